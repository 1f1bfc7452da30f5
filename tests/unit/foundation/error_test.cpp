#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "tabula/foundation/error_code.hpp"
#include "tabula/foundation/tabula_error.hpp"
#include "tabula/foundation/tabula_result.hpp"

using namespace tabula::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::AlreadyExists), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::PreferenceReadFailed), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::MissingSecondaryArtifact), "Artifact");
    EXPECT_EQ(errorSubsystem(ErrorCode::ArtifactCorrupt), "Artifact");
    EXPECT_EQ(errorSubsystem(ErrorCode::TypeNotFound), "Type");
    EXPECT_EQ(errorSubsystem(ErrorCode::ModuleSymbolMissing), "Type");
    EXPECT_EQ(errorSubsystem(ErrorCode::SchemaConstructionFailed), "Schema");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(ErrorCodeTest, UnmappedRangeIsUnknown) {
    EXPECT_EQ(errorSubsystem(static_cast<ErrorCode>(0x0500)), "Unknown");
}

// --- TabulaError tests ---

TEST(TabulaErrorTest, DefaultConstruction) {
    TabulaError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(TabulaErrorTest, CodeAndMessage) {
    TabulaError err(ErrorCode::TypeNotFound, "Type not found: shop::Order");
    EXPECT_EQ(err.code(), ErrorCode::TypeNotFound);
    EXPECT_EQ(err.message(), "Type not found: shop::Order");
    EXPECT_EQ(err.subsystem(), "Type");
    EXPECT_FALSE(err.isSuccess());
}

TEST(TabulaErrorTest, PathContext) {
    std::filesystem::path expected = "/data/code_cache/secondary-dexes/app.pkg.classes2.zip";
    TabulaError err(ErrorCode::MissingSecondaryArtifact, "missing", expected);
    EXPECT_TRUE(err.hasContext());

    const auto* path = err.context<std::filesystem::path>();
    ASSERT_NE(path, nullptr);
    EXPECT_EQ(*path, expected);

    // Wrong type returns nullptr
    EXPECT_EQ(err.context<std::string>(), nullptr);
}

TEST(TabulaErrorTest, PathAccessor) {
    std::filesystem::path archive = "/srv/shop/shop.pkg";
    TabulaError withPath(ErrorCode::ArtifactCorrupt, "bad archive", archive);
    ASSERT_NE(withPath.path(), nullptr);
    EXPECT_EQ(*withPath.path(), archive);

    TabulaError withoutPath(ErrorCode::TypeNotFound, "Type not found: shop::Refund",
                            std::string("shop::Refund"));
    EXPECT_TRUE(withoutPath.hasContext());
    EXPECT_EQ(withoutPath.path(), nullptr);
}

TEST(TabulaErrorTest, SuccessCheck) {
    TabulaError success(ErrorCode::Success);
    EXPECT_TRUE(success.isSuccess());
}

// --- TabulaResult tests ---

TEST(TabulaResultTest, OkValue) {
    auto result = TabulaResult<int>::ok(3);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 3);
}

TEST(TabulaResultTest, ErrorValue) {
    auto result = TabulaResult<int>::err(
        TabulaError(ErrorCode::PreferenceReadFailed, "bad counter"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::PreferenceReadFailed);
    EXPECT_EQ(result.error().message(), "bad counter");
}

TEST(TabulaResultTest, VoidError) {
    auto result = TabulaResult<void>::err(TabulaError(ErrorCode::AlreadyExists));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::AlreadyExists);
}
