#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "eurofolio/core/error.hpp"

using namespace eurofolio;

class ResultTest : public ::testing::Test {};

// Test successful Result with different types
TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");

    Result<double> double_result(3.14);
    EXPECT_TRUE(double_result.is_ok());
    EXPECT_DOUBLE_EQ(double_result.value(), 3.14);
}

TEST_F(ResultTest, ErrorCase) {
    auto error_result =
        make_error<int>(ErrorCode::VALIDATION_ERROR, "Allocations sum to 99%", "TestComponent");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::VALIDATION_ERROR);
    EXPECT_STREQ(error_result.error()->what(), "Allocations sum to 99%");
    EXPECT_EQ(error_result.error()->component(), "TestComponent");
}

TEST_F(ResultTest, ValueOnErrorThrows) {
    auto error_result = make_error<int>(ErrorCode::MISSING_DATA, "No prices", "Test");
    EXPECT_THROW(error_result.value(), EngineError);

    try {
        error_result.value();
        FAIL() << "Expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MISSING_DATA);
    }
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));

    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(*result.value(), 42);
}

TEST_F(ResultTest, MoveSemantics) {
    Result<std::string> str_result(std::string("test"));
    Result<std::string> moved_str = std::move(str_result);

    EXPECT_TRUE(moved_str.is_ok());
    EXPECT_EQ(moved_str.value(), "test");

    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> ptr_result(std::move(ptr));
    Result<std::unique_ptr<int>> moved_ptr = std::move(ptr_result);

    EXPECT_TRUE(moved_ptr.is_ok());
    EXPECT_EQ(*moved_ptr.value(), 42);
}

TEST_F(ResultTest, TakeValueMovesOut) {
    Result<std::vector<int>> result(std::vector<int>{1, 2, 3});
    std::vector<int> values = result.take_value();
    EXPECT_EQ(values.size(), 3u);
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_FALSE(success.is_error());
    EXPECT_NO_THROW(success.value());

    auto error = make_error<void>(ErrorCode::INVALID_ARGUMENT, "Void error", "Test");
    EXPECT_TRUE(error.is_error());
    EXPECT_FALSE(error.is_ok());
    EXPECT_THROW(error.value(), EngineError);
}

TEST_F(ResultTest, ForwardErrorKeepsCodeAndComponent) {
    auto original = make_error<void>(ErrorCode::FILE_NOT_FOUND, "missing.csv", "Loader");
    auto forwarded = forward_error<double>(original);

    ASSERT_TRUE(forwarded.is_error());
    EXPECT_EQ(forwarded.error()->code(), ErrorCode::FILE_NOT_FOUND);
    EXPECT_STREQ(forwarded.error()->what(), "missing.csv");
    EXPECT_EQ(forwarded.error()->component(), "Loader");
}

TEST_F(ResultTest, ErrorToString) {
    EngineError error(ErrorCode::VALIDATION_ERROR, "bad input", "InputNormalizer");
    EXPECT_EQ(error.to_string(), "Error in InputNormalizer: bad input (VALIDATION_ERROR)");
    EXPECT_EQ(error_code_to_string(ErrorCode::MISSING_DATA), "MISSING_DATA");
}
