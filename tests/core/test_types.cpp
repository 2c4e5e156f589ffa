// Core types and error tests

#include <diffdb/core.hpp>

#include <gtest/gtest.h>

using namespace diffdb;

// Test basic type definitions
TEST(TypesTest, AddressSizes) {
    EXPECT_EQ(sizeof(Address), 8);
    EXPECT_EQ(sizeof(RowId), 8);
    EXPECT_EQ(sizeof(Count), 8);
}

TEST(TypesTest, InvalidConstants) {
    EXPECT_EQ(INVALID_ADDRESS, ~Address{0});
    EXPECT_LT(INVALID_ROW_ID, 0);
}

// Error tests
TEST(ErrorTest, CategoryHelpers) {
    EXPECT_EQ(invalid_argument_error("x").category(), ErrorCategory::InvalidArgument);
    EXPECT_EQ(not_found_error("x").category(), ErrorCategory::NotFound);
    EXPECT_EQ(integrity_error("x").category(), ErrorCategory::ReferentialIntegrity);
    EXPECT_EQ(parse_error("x").category(), ErrorCategory::Parse);
    EXPECT_EQ(database_error("x").category(), ErrorCategory::Database);
    EXPECT_EQ(internal_error("x").category(), ErrorCategory::Internal);
}

TEST(ErrorTest, ContextKeepsCategory) {
    auto error = not_found_error("expected two file rows").with_context("diff.BinDiff");

    EXPECT_EQ(error.category(), ErrorCategory::NotFound);
    EXPECT_EQ(error.message(), "diff.BinDiff: expected two file rows");
}

TEST(ErrorTest, ContextKeepsFailureSite) {
    auto original = integrity_error("dangling row");
    auto chained = original.with_context("diff.BinDiff");

    EXPECT_EQ(chained.file(), original.file());
    EXPECT_EQ(chained.line(), original.line());
    EXPECT_EQ(chained.function(), original.function());
    EXPECT_NE(chained.function().find("ContextKeepsFailureSite"), std::string_view::npos);
}

TEST(ErrorTest, FormatMentionsCategoryAndMessage) {
    auto text = parse_error("bad timestamp").format();

    EXPECT_NE(text.find("parse"), std::string::npos);
    EXPECT_NE(text.find("bad timestamp"), std::string::npos);
}

namespace {

Result<int> half(int value) {
    if (value % 2 != 0) {
        return std::unexpected(invalid_argument_error("odd value"));
    }
    return value / 2;
}

Result<int> quarter(int value) {
    int h = DIFFDB_TRY(half(value));
    return half(h);
}

} // anonymous namespace

TEST(ErrorTest, TryMacroPropagates) {
    ASSERT_TRUE(quarter(8).has_value());
    EXPECT_EQ(*quarter(8), 2);

    auto failed = quarter(6);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().category(), ErrorCategory::InvalidArgument);
}
