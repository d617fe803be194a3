/**
 * @file test_discovery_test.cpp
 * @brief Unit tests for test file discovery
 *
 * @date 2025
 */

#include "noritest/utils/test_discovery.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using noritest::utils::DiscoverTests;

namespace {

class TestDiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("noritest-discovery-" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void Touch(const fs::path& path) {
        std::ofstream(dir_ / path) << "# test\n";
    }

    fs::path dir_;
};

} // anonymous namespace

TEST_F(TestDiscoveryTest, FindsMarkdownFilesSorted) {
    Touch("b-test.md");
    Touch("a-test.md");
    Touch("notes.txt");

    auto tests = DiscoverTests(dir_);
    ASSERT_EQ(tests.size(), 2u);
    EXPECT_EQ(tests[0].filename(), "a-test.md");
    EXPECT_EQ(tests[1].filename(), "b-test.md");
    EXPECT_TRUE(tests[0].is_absolute());
}

TEST_F(TestDiscoveryTest, NotRecursive) {
    fs::create_directories(dir_ / "nested");
    Touch("nested/inner.md");
    Touch("top.md");

    auto tests = DiscoverTests(dir_);
    ASSERT_EQ(tests.size(), 1u);
    EXPECT_EQ(tests[0].filename(), "top.md");
}

TEST_F(TestDiscoveryTest, DirectoryNamedLikeMarkdownIsSkipped) {
    fs::create_directories(dir_ / "folder.md");
    EXPECT_TRUE(DiscoverTests(dir_).empty());
}

TEST_F(TestDiscoveryTest, EmptyDirectory) {
    EXPECT_TRUE(DiscoverTests(dir_).empty());
}

TEST_F(TestDiscoveryTest, MissingDirectory) {
    fs::path missing = dir_ / "missing";
    try {
        DiscoverTests(missing);
        FAIL() << "expected runtime_error";
    }
    catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "Directory does not exist: " + missing.string());
    }
}

TEST_F(TestDiscoveryTest, PathIsAFile) {
    Touch("file.md");
    fs::path file = dir_ / "file.md";
    try {
        DiscoverTests(file);
        FAIL() << "expected runtime_error";
    }
    catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "Path is not a directory: " + file.string());
    }
}
