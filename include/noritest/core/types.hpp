/**
 * @file types.hpp
 * @brief Value types shared by the container layer and the test runner
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace noritest {
namespace core {

/**
 * @struct MountEntry
 * @brief Host path bound into the container
 *
 * The host path must exist when the container is created.
 */
struct MountEntry {
    std::filesystem::path host_path;       ///< Path on the host
    std::filesystem::path container_path;  ///< Path inside the container
    bool read_only{false};                 ///< Mount mode (ro / rw)
};

/**
 * @struct RunOptions
 * @brief Per-execution container configuration
 *
 * Created fresh for each execution and never modified by the container
 * manager.
 */
struct RunOptions {
    std::filesystem::path work_dir;                  ///< Working directory inside the container
    std::vector<MountEntry> mounts;                  ///< Bind mounts
    std::map<std::string, std::string> env;          ///< Environment variables
    bool privileged{false};                          ///< Run privileged
    std::optional<std::string> container_name;       ///< Fixed container name
    bool keep_container{false};                      ///< Retain container after exit
    std::optional<std::filesystem::path> inject_file;      ///< Host file to inject before start
    std::filesystem::path inject_target;             ///< In-container path of the injected file
    std::optional<std::chrono::seconds> timeout;     ///< Deadline for the process
    std::optional<std::string> user;                 ///< "uid:gid", defaults to 1000:<socket gid>
};

/**
 * @struct ExecutionResult
 * @brief Outcome of a buffered execution
 */
struct ExecutionResult {
    int exit_code{0};          ///< Process exit code
    std::string stdout_text;   ///< Accumulated standard output
    std::string stderr_text;   ///< Accumulated standard error
    bool timed_out{false};     ///< Process was killed at the deadline
};

/**
 * @enum OutputOrigin
 * @brief Stream a chunk was written to
 */
enum class OutputOrigin {
    STDOUT,
    STDERR
};

/**
 * @struct OutputChunk
 * @brief One fragment of process output
 *
 * Order is guaranteed per origin only.
 */
struct OutputChunk {
    OutputOrigin origin{OutputOrigin::STDOUT};
    std::string data;
};

inline const char* OriginName(OutputOrigin origin) {
    return origin == OutputOrigin::STDOUT ? "stdout" : "stderr";
}

/**
 * @enum TestStatus
 * @brief Pass/fail outcome reported through the status file
 */
enum class TestStatus {
    SUCCESS,
    FAILURE
};

/**
 * @struct StatusFile
 * @brief Parsed status file contents
 */
struct StatusFile {
    TestStatus status{TestStatus::FAILURE};
    std::optional<std::string> error;
};

/**
 * @struct TestResult
 * @brief Outcome of one test file
 */
struct TestResult {
    std::string test_file;                 ///< Base name of the test markdown
    TestStatus status{TestStatus::FAILURE};
    std::optional<std::string> error;      ///< Failure description
    std::chrono::milliseconds duration{0};
};

/**
 * @struct TestReport
 * @brief Aggregated outcome of a run
 */
struct TestReport {
    int total_tests{0};
    int passed{0};
    int failed{0};
    std::vector<TestResult> results;
    std::chrono::milliseconds duration{0};
};

} // namespace core
} // namespace noritest
