#include <gtest/gtest.h>

#include <string>

#include "tabula/core/result.hpp"
#include "tabula/version.hpp"

namespace {
struct Failure {
    int code = -1;
    std::string message;
};
}  // namespace

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(tabula::Version::major, 0);
    EXPECT_EQ(tabula::Version::minor, 3);
    EXPECT_EQ(tabula::Version::patch, 1);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(tabula::Version::string, "0.3.1");
}

TEST(ResultTest, OkValue) {
    auto result = tabula::Result<int, Failure>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = tabula::Result<int, Failure>::err(Failure{404, "not found"});
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, 404);
    EXPECT_EQ(result.error().message, "not found");
}

TEST(ResultTest, ValueOr) {
    auto ok = tabula::Result<int, Failure>::ok(10);
    auto err = tabula::Result<int, Failure>::err(Failure{});
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, MoveOutValue) {
    auto result = tabula::Result<std::string, Failure>::ok("orders");
    std::string taken = std::move(result).value();
    EXPECT_EQ(taken, "orders");
}

TEST(ResultVoidTest, Ok) {
    auto result = tabula::Result<void, Failure>::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
}

TEST(ResultVoidTest, Error) {
    auto result = tabula::Result<void, Failure>::err(Failure{1, "void error"});
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "void error");
}
