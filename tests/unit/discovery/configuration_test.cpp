#include <gtest/gtest.h>

#include <string>

#include "tabula/discovery/configuration.hpp"
#include "tabula/discovery/configuration_loader.hpp"
#include "tabula/foundation/config_manager.hpp"
#include "tabula/registry/registry_builder.hpp"

#include "support/mock_logger.hpp"
#include "support/temp_dir.hpp"
#include "support/test_types.hpp"

using namespace tabula::discovery;
using tabula::foundation::ConfigManager;
using tabula::foundation::ErrorCode;
using tabula::registry::RegistryBuilder;
using tabula::types::describeType;
using kcenon::common::interfaces::log_level;

class ConfigurationTest : public tabula::test::LoggingTest {
protected:
    Configuration parse(const std::string& yaml) {
        ConfigManager config;
        EXPECT_TRUE(config.loadString(yaml).hasValue());
        auto parsed = parseConfiguration(config, &catalog_);
        EXPECT_TRUE(parsed.hasValue());
        return std::move(parsed).value();
    }

    tabula::types::TypeCatalog catalog_ = tabula::test::makeShopCatalog();
};

// ---------------------------------------------------------------------------
// parseConfiguration / readConfiguration
// ---------------------------------------------------------------------------

TEST(EnumerationModeTest, Parse) {
    EXPECT_EQ(parseEnumerationMode("auto"), EnumerationMode::Auto);
    EXPECT_EQ(parseEnumerationMode("container"), EnumerationMode::Container);
    EXPECT_EQ(parseEnumerationMode("directory"), EnumerationMode::Directory);
    EXPECT_FALSE(parseEnumerationMode("Directory").has_value());
}

TEST_F(ConfigurationTest, FullDocument) {
    auto configuration = parse(R"(
deployment:
  package: shop
  artifact: /srv/shop/shop.pkg
  data_dir: /var/lib/shop
  resource_roots: [build/bin, build/classes]
  unit_suffix: .obj
  mode: directory
persistence:
  database: Shop.db
  version: 5
  entities: [shop::model::Order, shop::model::Customer]
  serializers: [shop::MoneySerializer]
)");

    const auto& ctx = configuration.context;
    EXPECT_EQ(ctx.packageName, "shop");
    EXPECT_EQ(ctx.artifactPath, std::filesystem::path("/srv/shop/shop.pkg"));
    EXPECT_EQ(ctx.dataDir, std::filesystem::path("/var/lib/shop"));
    ASSERT_EQ(ctx.resourceRoots.size(), 2u);
    EXPECT_EQ(ctx.resourceRoots[1], std::filesystem::path("build/classes"));
    EXPECT_EQ(ctx.unitSuffix, ".obj");
    EXPECT_EQ(ctx.mode, EnumerationMode::Directory);
    EXPECT_EQ(&ctx.typeCatalog(), &catalog_);

    EXPECT_TRUE(configuration.isValid());
    EXPECT_EQ(configuration.databaseName, "Shop.db");
    EXPECT_EQ(configuration.databaseVersion, 5);
    ASSERT_TRUE(configuration.entityTypes.has_value());
    ASSERT_EQ(configuration.entityTypes->size(), 2u);
    EXPECT_EQ((*configuration.entityTypes)[0].name, "shop::model::Order");
    ASSERT_TRUE(configuration.serializerTypes.has_value());
    EXPECT_EQ(configuration.serializerTypes->size(), 1u);
}

TEST_F(ConfigurationTest, Defaults) {
    auto configuration = parse("deployment:\n  package: shop\n");

    EXPECT_FALSE(configuration.isValid());
    EXPECT_FALSE(configuration.entityTypes.has_value());
    EXPECT_FALSE(configuration.serializerTypes.has_value());
    EXPECT_EQ(configuration.databaseName, kDefaultDatabaseName);
    EXPECT_EQ(configuration.databaseVersion, kDefaultDatabaseVersion);
    EXPECT_EQ(configuration.context.unitSuffix, ".o");
    EXPECT_EQ(configuration.context.mode, EnumerationMode::Auto);
    EXPECT_TRUE(configuration.context.resourceRoots.empty());
}

TEST_F(ConfigurationTest, UnresolvedNamesDropped) {
    auto configuration = parse(R"(
persistence:
  entities: [shop::model::Order, shop::model::Refund, shop::MoneySerializer]
  serializers: [shop::model::Customer, shop::MoneyTextSerializer]
)");

    ASSERT_TRUE(configuration.entityTypes.has_value());
    ASSERT_EQ(configuration.entityTypes->size(), 1u);
    EXPECT_EQ((*configuration.entityTypes)[0].name, "shop::model::Order");
    ASSERT_EQ(configuration.serializerTypes->size(), 1u);
    EXPECT_EQ((*configuration.serializerTypes)[0].name, "shop::MoneyTextSerializer");

    EXPECT_EQ(mockLogger_->count(log_level::error, "shop::model::Refund"), 1u);
    EXPECT_EQ(mockLogger_->count(log_level::error, "shop::MoneySerializer"), 1u);
    EXPECT_EQ(mockLogger_->count(log_level::error, "shop::model::Customer"), 1u);
}

TEST_F(ConfigurationTest, NoEntityResolvedIsInvalid) {
    auto configuration = parse("persistence:\n  entities: [shop::model::Refund]\n");
    ASSERT_TRUE(configuration.entityTypes.has_value());
    EXPECT_TRUE(configuration.entityTypes->empty());
    EXPECT_FALSE(configuration.isValid());
}

TEST_F(ConfigurationTest, UnknownModeRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("deployment:\n  mode: sideways\n").hasValue());
    auto parsed = parseConfiguration(config, &catalog_);
    ASSERT_TRUE(parsed.hasError());
    EXPECT_EQ(parsed.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigurationTest, MistypedVersionRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("persistence:\n  version: latest\n").hasValue());
    auto parsed = parseConfiguration(config, &catalog_);
    ASSERT_TRUE(parsed.hasError());
    EXPECT_EQ(parsed.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigurationTest, ReadFromFile) {
    tabula::test::ScratchDir dir;
    auto path = dir.write("tabula.yaml", "persistence:\n  entities: [shop::model::Customer]\n");

    auto configuration = readConfiguration(path, &catalog_);
    ASSERT_TRUE(configuration.hasValue());
    EXPECT_TRUE(configuration.value().isValid());
}

TEST_F(ConfigurationTest, ReadMissingFile) {
    tabula::test::ScratchDir dir;
    auto configuration = readConfiguration(dir.path() / "absent.yaml", &catalog_);
    ASSERT_TRUE(configuration.hasError());
    EXPECT_EQ(configuration.error().code(), ErrorCode::ConfigLoadFailed);
}

// ---------------------------------------------------------------------------
// ConfigurationLoader
// ---------------------------------------------------------------------------

class ConfigurationLoaderTest : public tabula::test::LoggingTest {
protected:
    RegistryBuilder builder_;
    ConfigurationLoader loader_{builder_};
};

TEST_F(ConfigurationLoaderTest, InvalidConfigurationLoadsNothing) {
    Configuration configuration;
    auto loaded = loader_.load(configuration);
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_FALSE(loaded.value());
    EXPECT_EQ(builder_.schemaCount(), 0u);
    EXPECT_EQ(builder_.serializerCount(), 4u);
}

TEST_F(ConfigurationLoaderTest, DeclaredTypesRegistered) {
    Configuration configuration;
    configuration.valid = true;
    configuration.entityTypes = std::vector<tabula::types::TypeRecord>{
        describeType<shop::model::Order>("shop::model::Order"),
        describeType<shop::model::Customer>("shop::model::Customer")};
    configuration.serializerTypes = std::vector<tabula::types::TypeRecord>{
        describeType<shop::MoneySerializer>("shop::MoneySerializer")};

    auto loaded = loader_.load(configuration);
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_TRUE(loaded.value());
    EXPECT_EQ(builder_.schemaCount(), 2u);
    EXPECT_NE(builder_.findSerializer(typeid(shop::Money)), nullptr);
}

TEST_F(ConfigurationLoaderTest, DuplicateEntityDescribedOnce) {
    Configuration configuration;
    configuration.valid = true;
    configuration.entityTypes = std::vector<tabula::types::TypeRecord>{
        describeType<shop::model::Order>("shop::model::Order"),
        describeType<shop::model::Order>("shop::model::Order")};

    ASSERT_TRUE(loader_.load(configuration).hasValue());
    EXPECT_EQ(builder_.schemaCount(), 1u);
}

TEST_F(ConfigurationLoaderTest, BadEntityFailsLoad) {
    Configuration configuration;
    configuration.valid = true;
    configuration.entityTypes = std::vector<tabula::types::TypeRecord>{
        describeType<shop::model::BadlyNamed>("shop::model::BadlyNamed")};

    auto loaded = loader_.load(configuration);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::SchemaConstructionFailed);
}

TEST_F(ConfigurationLoaderTest, BadSerializerLoggedAndSkipped) {
    Configuration configuration;
    configuration.valid = true;
    configuration.entityTypes = std::vector<tabula::types::TypeRecord>{
        describeType<shop::model::Order>("shop::model::Order")};
    configuration.serializerTypes = std::vector<tabula::types::TypeRecord>{
        describeType<shop::ThrowingSerializer>("shop::ThrowingSerializer"),
        describeType<shop::MoneyTextSerializer>("shop::MoneyTextSerializer")};

    auto loaded = loader_.load(configuration);
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_TRUE(loaded.value());

    const auto* money = builder_.findSerializer(typeid(shop::Money));
    ASSERT_NE(money, nullptr);
    EXPECT_EQ(money->serializedType(), std::type_index(typeid(std::string)));
    EXPECT_EQ(mockLogger_->count(log_level::error, "Couldn't instantiate TypeSerializer"), 1u);
}

TEST_F(ConfigurationLoaderTest, ValidWithoutSerializerList) {
    Configuration configuration;
    configuration.valid = true;
    configuration.entityTypes = std::vector<tabula::types::TypeRecord>{
        describeType<shop::model::Customer>("shop::model::Customer")};

    ASSERT_TRUE(loader_.load(configuration).hasValue());
    EXPECT_EQ(builder_.schemaCount(), 1u);
    EXPECT_EQ(builder_.serializerCount(), 4u);
}
