/**
 * @file container_options_test.cpp
 * @brief Unit tests for translating run options into create requests
 *
 * @date 2025
 */

#include "noritest/docker/container_manager.hpp"
#include "noritest/docker/docker_schema.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;
using noritest::core::MountEntry;
using noritest::core::RunOptions;
using noritest::docker::ContainerManager;

namespace {

RunOptions BaseOptions() {
    RunOptions options;
    options.work_dir = "/workspace";
    return options;
}

bool HasEntry(const std::vector<std::string>& values, const std::string& entry) {
    return std::find(values.begin(), values.end(), entry) != values.end();
}

} // anonymous namespace

TEST(ContainerOptionsTest, BasicRequest) {
    auto request = ContainerManager::BuildCreateRequest("node:20", {"echo", "hi"}, BaseOptions(),
                                                        "1000:999");
    EXPECT_EQ(request.Image, "node:20");
    EXPECT_EQ(request.Cmd, (std::vector<std::string>{"echo", "hi"}));
    EXPECT_EQ(request.WorkingDir, "/workspace");
    EXPECT_EQ(request.User, "1000:999");
    EXPECT_FALSE(request.Tty);
    EXPECT_FALSE(request.Host.Privileged);
    EXPECT_FALSE(request.Host.AutoRemove);
    EXPECT_TRUE(request.Env.empty());
}

TEST(ContainerOptionsTest, MountsBecomeBinds) {
    auto options = BaseOptions();
    auto temp = std::filesystem::temp_directory_path();
    options.mounts.push_back(MountEntry{temp, "/data", false});
    options.mounts.push_back(MountEntry{temp, "/config", true});

    auto request = ContainerManager::BuildCreateRequest("node:20", {"true"}, options, "1000:1000");
    ASSERT_EQ(request.Host.Binds.size(), 2u);
    std::string host = std::filesystem::absolute(temp).lexically_normal().string();
    EXPECT_EQ(request.Host.Binds[0], host + ":/data:rw");
    EXPECT_EQ(request.Host.Binds[1], host + ":/config:ro");
}

TEST(ContainerOptionsTest, EnvironmentEntries) {
    auto options = BaseOptions();
    options.env["ANTHROPIC_API_KEY"] = "sk-test";
    options.env["HOME"] = "/home/node";
    options.env["EMPTY"] = "";

    auto request = ContainerManager::BuildCreateRequest("node:20", {"true"}, options, "1000:1000");
    EXPECT_EQ(request.Env.size(), 3u);
    EXPECT_TRUE(HasEntry(request.Env, "ANTHROPIC_API_KEY=sk-test"));
    EXPECT_TRUE(HasEntry(request.Env, "HOME=/home/node"));
    EXPECT_TRUE(HasEntry(request.Env, "EMPTY="));
}

TEST(ContainerOptionsTest, PrivilegedAndUserOverride) {
    auto options = BaseOptions();
    options.privileged = true;
    options.user = "0:0";

    auto request = ContainerManager::BuildCreateRequest("node:20", {"true"}, options, "1000:1000");
    EXPECT_TRUE(request.Host.Privileged);
    EXPECT_EQ(request.User, "0:0");
}

TEST(ContainerOptionsTest, RelativeWorkDirIsResolved) {
    auto options = BaseOptions();
    options.work_dir = "relative/dir";

    auto request = ContainerManager::BuildCreateRequest("node:20", {"true"}, options, "1000:1000");
    EXPECT_TRUE(std::filesystem::path(request.WorkingDir).is_absolute());
}

TEST(ContainerOptionsTest, InvalidInputRejected) {
    EXPECT_THROW(ContainerManager::BuildCreateRequest("", {"true"}, BaseOptions(), "1000:1000"),
                 std::invalid_argument);
    EXPECT_THROW(ContainerManager::BuildCreateRequest("node:20", {}, BaseOptions(), "1000:1000"),
                 std::invalid_argument);

    auto missing_mount = BaseOptions();
    missing_mount.mounts.push_back(MountEntry{"/definitely/not/here", "/x", false});
    EXPECT_THROW(ContainerManager::BuildCreateRequest("node:20", {"true"}, missing_mount, "1000:1000"),
                 std::invalid_argument);

    auto bad_env = BaseOptions();
    bad_env.env["A=B"] = "c";
    EXPECT_THROW(ContainerManager::BuildCreateRequest("node:20", {"true"}, bad_env, "1000:1000"),
                 std::invalid_argument);
}

TEST(ContainerOptionsTest, RequestSerialization) {
    auto options = BaseOptions();
    options.env["A"] = "1";
    options.privileged = true;

    json document = ContainerManager::BuildCreateRequest("node:20", {"sh", "-c", "exit 0"}, options,
                                                         "1000:1000");
    EXPECT_EQ(document["Image"], "node:20");
    EXPECT_EQ(document["Cmd"].size(), 3u);
    EXPECT_EQ(document["Env"][0], "A=1");
    EXPECT_EQ(document["HostConfig"]["Privileged"], true);
    EXPECT_EQ(document["AttachStdout"], true);
    EXPECT_EQ(document["AttachStderr"], true);
    EXPECT_EQ(document["OpenStdin"], false);
}

TEST(ContainerOptionsTest, EnvOmittedWhenEmpty) {
    json document = ContainerManager::BuildCreateRequest("node:20", {"true"}, BaseOptions(), "1000:1000");
    EXPECT_FALSE(document.contains("Env"));
}

TEST(ContainerOptionsTest, DefaultUserFallsBack) {
    EXPECT_EQ(ContainerManager::DefaultUser("/nonexistent/docker.sock"), "1000:1000");
    EXPECT_EQ(ContainerManager::DefaultUser(std::filesystem::temp_directory_path()).rfind("1000:", 0), 0u);
}
