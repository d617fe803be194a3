/**
 * @file status_file_test.cpp
 * @brief Unit tests for status file parsing
 *
 * @date 2025
 */

#include "noritest/core/errors.hpp"
#include "noritest/utils/status_file.hpp"

#include <gtest/gtest.h>

#include <string>

using noritest::core::StatusFileError;
using noritest::core::TestStatus;
using noritest::utils::ParseStatusFile;

namespace {

std::string ErrorOf(const std::string& content) {
    try {
        ParseStatusFile(content);
    }
    catch (const StatusFileError& e) {
        return e.what();
    }
    return "";
}

} // anonymous namespace

TEST(StatusFileTest, Success) {
    auto status = ParseStatusFile(R"({"status": "success"})");
    EXPECT_EQ(status.status, TestStatus::SUCCESS);
    EXPECT_FALSE(status.error.has_value());
}

TEST(StatusFileTest, FailureWithError) {
    auto status = ParseStatusFile(R"({"status": "failure", "error": "Test failed"})");
    EXPECT_EQ(status.status, TestStatus::FAILURE);
    ASSERT_TRUE(status.error.has_value());
    EXPECT_EQ(*status.error, "Test failed");
}

TEST(StatusFileTest, FailureWithoutError) {
    auto status = ParseStatusFile(R"({"status": "failure"})");
    EXPECT_EQ(status.status, TestStatus::FAILURE);
    EXPECT_FALSE(status.error.has_value());
}

TEST(StatusFileTest, SurroundingWhitespaceIsIgnored) {
    EXPECT_EQ(ParseStatusFile("\n  {\"status\": \"success\"}  \n").status, TestStatus::SUCCESS);
}

TEST(StatusFileTest, NonStringErrorIsIgnored) {
    auto status = ParseStatusFile(R"({"status": "failure", "error": 42})");
    EXPECT_FALSE(status.error.has_value());
}

TEST(StatusFileTest, InvalidJson) {
    EXPECT_EQ(ErrorOf("not json").rfind("Invalid JSON in status file", 0), 0u);
    EXPECT_EQ(ErrorOf("").rfind("Invalid JSON in status file", 0), 0u);
}

TEST(StatusFileTest, NotAnObject) {
    EXPECT_EQ(ErrorOf("[1, 2]"), "Status file must contain a JSON object");
    EXPECT_EQ(ErrorOf("\"success\""), "Status file must contain a JSON object");
    EXPECT_EQ(ErrorOf("null"), "Status file must contain a JSON object");
}

TEST(StatusFileTest, MissingStatus) {
    EXPECT_EQ(ErrorOf(R"({"error": "x"})"), "Status file missing required \"status\" field");
}

TEST(StatusFileTest, InvalidStatusValue) {
    EXPECT_EQ(ErrorOf(R"({"status": "passed"})"),
              "Invalid status value: \"passed\". Must be \"success\" or \"failure\"");
    EXPECT_NE(ErrorOf(R"({"status": true})"), "");
    EXPECT_NE(ErrorOf(R"({"status": "SUCCESS"})"), "");
}

TEST(StatusFileTest, MissingFile) {
    EXPECT_THROW(noritest::utils::ReadStatusFile("/nonexistent/.nori-test-status.json"),
                 StatusFileError);
}
