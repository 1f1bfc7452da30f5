#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "tabula/foundation/error_code.hpp"
#include "tabula/types/type_catalog.hpp"
#include "tabula/types/type_export.hpp"
#include "tabula/types/type_record.hpp"

#include "support/temp_dir.hpp"
#include "support/test_types.hpp"

using namespace tabula::types;
using tabula::foundation::ErrorCode;

namespace ledger {
class Entry : public tabula::schema::Entity {};
}  // namespace ledger

TABULA_REGISTER_TYPE(ledger::Entry);

// ---------------------------------------------------------------------------
// describeType
// ---------------------------------------------------------------------------

TEST(DescribeTypeTest, EntityWithDeclaredStorage) {
    auto record = describeType<shop::model::Order>("shop::model::Order");
    EXPECT_EQ(record.name, "shop::model::Order");
    EXPECT_EQ(record.type, std::type_index(typeid(shop::model::Order)));
    EXPECT_TRUE(record.isEntity());
    EXPECT_FALSE(record.isSerializer());
    EXPECT_FALSE(record.isAbstract);
    EXPECT_EQ(record.tableName, "Orders");
    EXPECT_EQ(record.idColumn, "OrderId");
    EXPECT_FALSE(record.serializerFactory);
    EXPECT_EQ(record.simpleName(), "Order");
}

TEST(DescribeTypeTest, AbstractEntity) {
    auto record = describeType<shop::model::Auditable>("shop::model::Auditable");
    EXPECT_TRUE(record.isEntity());
    EXPECT_TRUE(record.isAbstract);
    EXPECT_TRUE(record.tableName.empty());
}

TEST(DescribeTypeTest, SerializerGetsFactory) {
    auto record = describeType<shop::MoneySerializer>("shop::MoneySerializer");
    EXPECT_TRUE(record.isSerializer());
    ASSERT_TRUE(record.serializerFactory);

    auto instance = record.serializerFactory();
    ASSERT_NE(instance, nullptr);
    EXPECT_EQ(instance->deserializedType(), std::type_index(typeid(shop::Money)));
}

TEST(DescribeTypeTest, PlainTypeHasNoCapability) {
    auto record = describeType<shop::Catalogue>("shop::Catalogue");
    EXPECT_EQ(record.capability, TypeCapability::None);
    EXPECT_FALSE(record.isEntity());
    EXPECT_FALSE(record.isSerializer());
}

TEST(DescribeTypeTest, LeadingSeparatorDropped) {
    auto record = describeType<shop::model::Customer>("::shop::model::Customer");
    EXPECT_EQ(record.name, "shop::model::Customer");
}

TEST(DescribeTypeTest, SimpleNameOfUnqualifiedType) {
    auto record = describeType<shop::Catalogue>("Catalogue");
    EXPECT_EQ(record.simpleName(), "Catalogue");
}

// ---------------------------------------------------------------------------
// Register / Find / Load
// ---------------------------------------------------------------------------

TEST(TypeCatalogTest, EmptyCatalog) {
    TypeCatalog catalog;
    EXPECT_EQ(catalog.TypeCount(), 0u);
    EXPECT_EQ(catalog.Find("shop::model::Order"), nullptr);
}

TEST(TypeCatalogTest, RegisterAndFind) {
    TypeCatalog catalog;
    ASSERT_TRUE(catalog.Register(describeType<shop::model::Order>("shop::model::Order")).hasValue());

    const auto* record = catalog.Find("shop::model::Order");
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->type, std::type_index(typeid(shop::model::Order)));
}

TEST(TypeCatalogTest, DuplicateRegisterFails) {
    TypeCatalog catalog;
    ASSERT_TRUE(catalog.Register(describeType<shop::model::Order>("shop::model::Order")).hasValue());

    auto again = catalog.Register(describeType<shop::model::Order>("shop::model::Order"));
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::AlreadyExists);
    EXPECT_EQ(catalog.TypeCount(), 1u);
}

TEST(TypeCatalogTest, EmptyNameRejected) {
    TypeCatalog catalog;
    auto result = catalog.Register(TypeRecord{});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(TypeCatalogTest, LoadUnknownType) {
    auto catalog = tabula::test::makeShopCatalog();
    auto result = catalog.Load("shop::model::Refund");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::TypeNotFound);
}

TEST(TypeCatalogTest, AllTypeNamesAreSorted) {
    auto catalog = tabula::test::makeShopCatalog();
    auto names = catalog.GetAllTypeNames();
    ASSERT_EQ(names.size(), catalog.TypeCount());
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
    EXPECT_EQ(names.front(), "shop::Catalogue");
}

// ---------------------------------------------------------------------------
// Static registration
// ---------------------------------------------------------------------------

TEST(TypeCatalogStaticTest, RegisterStaticTypesImportsMacroRecords) {
    TypeCatalog catalog;
    EXPECT_GE(catalog.RegisterStaticTypes(), 1u);

    const auto* record = catalog.Find("ledger::Entry");
    ASSERT_NE(record, nullptr);
    EXPECT_TRUE(record->isEntity());

    // Second import adds nothing.
    EXPECT_EQ(catalog.RegisterStaticTypes(), 0u);
}

TEST(TypeCatalogStaticTest, GlobalCatalogHasStaticTypes) {
    EXPECT_NE(TypeCatalog::global().Find("ledger::Entry"), nullptr);
}

// ---------------------------------------------------------------------------
// Shared modules
// ---------------------------------------------------------------------------

TEST(TypeCatalogModuleTest, LoadModuleImportsDescribedTypes) {
    TypeCatalog catalog;
    auto loaded = catalog.LoadModule(TABULA_SAMPLE_MODULE_PATH);
    ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();
    EXPECT_EQ(loaded.value(), 3u);

    const auto* item = catalog.Find("inventory::model::Item");
    ASSERT_NE(item, nullptr);
    EXPECT_TRUE(item->isEntity());
    EXPECT_EQ(item->tableName, "Items");
    EXPECT_NE(item->module, nullptr);

    const auto* weight = catalog.Find("inventory::WeightSerializer");
    ASSERT_NE(weight, nullptr);
    EXPECT_TRUE(weight->isSerializer());
    EXPECT_EQ(weight->module, item->module);
}

TEST(TypeCatalogModuleTest, DuplicatesFromModuleAreSkipped) {
    TypeCatalog catalog;
    ASSERT_TRUE(catalog.LoadModule(TABULA_SAMPLE_MODULE_PATH).hasValue());

    auto again = catalog.LoadModule(TABULA_SAMPLE_MODULE_PATH);
    ASSERT_TRUE(again.hasValue());
    EXPECT_EQ(again.value(), 0u);
    EXPECT_EQ(catalog.TypeCount(), 3u);
}

TEST(TypeCatalogModuleTest, ModuleOutlivesCatalogThroughRecord) {
    TypeRecord kept;
    {
        TypeCatalog catalog;
        ASSERT_TRUE(catalog.LoadModule(TABULA_SAMPLE_MODULE_PATH).hasValue());
        kept = *catalog.Find("inventory::WeightSerializer");
    }
    ASSERT_NE(kept.module, nullptr);
    ASSERT_TRUE(kept.serializerFactory);

    auto instance = kept.serializerFactory();
    ASSERT_NE(instance, nullptr);
    EXPECT_EQ(instance->serializedType(), std::type_index(typeid(std::int64_t)));
}

TEST(TypeCatalogModuleTest, LastRecordReleasesModuleOnDestruction) {
    std::optional<TypeRecord> kept;
    std::weak_ptr<void> module;
    {
        TypeCatalog catalog;
        ASSERT_TRUE(catalog.LoadModule(TABULA_SAMPLE_MODULE_PATH).hasValue());
        kept = *catalog.Find("inventory::WeightSerializer");
        module = kept->module;
    }
    ASSERT_FALSE(module.expired());
    ASSERT_TRUE(kept->serializerFactory);

    // The factory's code lives in the module; destroying the record must
    // drop the factory before the handle.
    kept.reset();
    EXPECT_TRUE(module.expired());
}

TEST(TypeCatalogModuleTest, MissingModuleFile) {
    tabula::test::ScratchDir dir;
    TypeCatalog catalog;
    auto result = catalog.LoadModule(dir.path() / "libmissing.so");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ModuleLoadFailed);
}

TEST(TypeCatalogModuleTest, NotASharedLibrary) {
    tabula::test::ScratchDir dir;
    auto path = dir.write("libbroken.so", "definitely not ELF");
    TypeCatalog catalog;
    auto result = catalog.LoadModule(path);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ModuleLoadFailed);
}
