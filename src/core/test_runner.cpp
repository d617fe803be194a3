/**
 * @file test_runner.cpp
 * @brief Implementation of the sequential test runner
 *
 * @date 2025
 */

#include "noritest/core/test_runner.hpp"
#include "noritest/core/errors.hpp"
#include "noritest/utils/markdown.hpp"
#include "noritest/utils/status_file.hpp"
#include "noritest/utils/stream_formatter.hpp"
#include "noritest/utils/string_utils.hpp"
#include "noritest/utils/test_discovery.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace noritest {
namespace core {

namespace fs = std::filesystem;

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds ElapsedSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

std::string ShellQuote(const std::string& value) {
    return "'" + utils::StringUtils::ReplaceAll(value, "'", "'\\''") + "'";
}

std::string ReadTextFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot read test file: " + path.string());
    }
    std::stringstream content;
    content << file.rdbuf();
    return content.str();
}

void RemoveQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("Failed to remove {}: {}", path.string(), ec.message());
    }
}

/**
 * @brief Removes the prompt file however the test ends
 */
class ScopedFile {
public:
    ScopedFile(fs::path path, const std::string& contents)
        : path_(std::move(path)) {
        std::ofstream file(path_, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Cannot write prompt file: " + path_.string());
        }
        file << contents;
    }

    ~ScopedFile() { RemoveQuietly(path_); }

    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;

private:
    fs::path path_;
};

} // anonymous namespace

TestRunner::TestRunner(CommandRunner& runner, RunnerConfig config,
                       std::ostream& out, std::ostream& err)
    : runner_(runner)
    , config_(std::move(config))
    , out_(out)
    , err_(err) {
    if (config_.work_dir.empty()) {
        config_.work_dir = fs::current_path();
    }
    config_.work_dir = fs::absolute(config_.work_dir).lexically_normal();
}

// ============================================================================
// RUN
// ============================================================================

TestReport TestRunner::Run(const fs::path& folder) {
    if (config_.dry_run) {
        return DryRun(folder);
    }

    auto start = Clock::now();
    std::vector<fs::path> tests = utils::DiscoverTests(folder);

    TestReport report;
    report.total_tests = static_cast<int>(tests.size());

    if (!tests.empty()) {
        EnsureImage();
    }

    for (std::size_t i = 0; i < tests.size(); ++i) {
        std::string name = tests[i].filename().string();
        out_ << "\n[" << (i + 1) << "/" << tests.size() << "] Running: " << name << std::endl;

        auto test_start = Clock::now();
        TestResult result;
        try {
            result = RunSingleTest(tests[i]);
        }
        catch (const std::exception& e) {
            spdlog::debug("Test {} raised: {}", name, e.what());
            result.test_file = name;
            result.status = TestStatus::FAILURE;
            result.error = e.what();
            result.duration = ElapsedSince(test_start);
        }

        if (result.status == TestStatus::SUCCESS) {
            out_ << "  ✓ PASSED (" << result.duration.count() << "ms)" << std::endl;
            ++report.passed;
        } else {
            out_ << "  ✗ FAILED: " << result.error.value_or("Unknown error") << std::endl;
            ++report.failed;
        }
        report.results.push_back(result);
    }

    report.duration = ElapsedSince(start);
    return report;
}

TestReport TestRunner::DryRun(const fs::path& folder) {
    auto start = Clock::now();
    std::vector<fs::path> tests = utils::DiscoverTests(folder);

    TestReport report;
    report.total_tests = static_cast<int>(tests.size());
    for (const auto& test : tests) {
        TestResult result;
        result.test_file = test.filename().string();
        result.status = TestStatus::SUCCESS;
        report.results.push_back(result);
    }
    report.passed = report.total_tests;
    report.duration = ElapsedSince(start);
    return report;
}

void TestRunner::EnsureImage() {
    if (runner_.ImageExists(config_.image)) {
        spdlog::debug("Image {} present", config_.image);
        return;
    }

    spdlog::info("Pulling image {}...", config_.image);
    auto start = Clock::now();
    runner_.PullImage(config_.image);
    spdlog::info("Image {} pulled in {}ms", config_.image, ElapsedSince(start).count());
}

// ============================================================================
// SINGLE TEST
// ============================================================================

TestResult TestRunner::RunSingleTest(const fs::path& test_file) {
    auto start = Clock::now();

    TestResult result;
    result.test_file = test_file.filename().string();

    fs::path prompt_path = config_.work_dir / PROMPT_FILE_NAME;
    fs::path status_path = config_.work_dir / STATUS_FILE_NAME;

    std::string prompt = utils::AppendStatusInstructions(ReadTextFile(test_file),
                                                         status_path.string());

    // A status file left by an earlier run would be mistaken for this one's
    if (fs::exists(status_path)) {
        spdlog::warn("Removing stale status file {}", status_path.string());
        RemoveQuietly(status_path);
    }

    AgentOutcome outcome;
    {
        ScopedFile prompt_file(prompt_path, prompt);
        RunOptions options = BuildRunOptions(test_file);
        auto command = BuildAgentCommand(prompt_path, config_.stream);
        outcome = config_.stream ? StreamAgent(command, options) : RunAgent(command, options);
    }

    spdlog::debug("Agent for {} exited with {}", result.test_file, outcome.exit_code);

    if (outcome.timed_out) {
        RemoveQuietly(status_path);
        result.status = TestStatus::FAILURE;
        result.error = "Test timed out after " +
                       std::to_string(config_.timeout.value_or(std::chrono::seconds(0)).count()) + "s";
        result.duration = ElapsedSince(start);
        return result;
    }

    if (!fs::exists(status_path)) {
        result.status = TestStatus::FAILURE;
        result.error = NO_STATUS_FILE_MESSAGE;
        result.duration = ElapsedSince(start);
        return result;
    }

    StatusFile status;
    try {
        status = utils::ReadStatusFile(status_path);
    }
    catch (const StatusFileError&) {
        RemoveQuietly(status_path);
        throw;
    }
    RemoveQuietly(status_path);

    result.status = status.status;
    result.error = status.error;
    result.duration = ElapsedSince(start);
    return result;
}

std::vector<std::string> TestRunner::BuildAgentCommand(const fs::path& prompt_file, bool stream) {
    std::string script = "npx -y @anthropic-ai/claude-code -p \"$(cat " +
                         ShellQuote(prompt_file.string()) +
                         ")\" --dangerously-skip-permissions";
    script += stream ? " --output-format stream-json --verbose" : " --output-format text";
    return {"bash", "-c", script};
}

RunOptions TestRunner::BuildRunOptions(const fs::path& test_file) const {
    RunOptions options;
    options.work_dir = config_.work_dir;
    // Same path inside and out, so nested containers can mount it again
    options.mounts.push_back(MountEntry{config_.work_dir, config_.work_dir, false});
    // Agents that drive containers themselves talk to the host engine
    if (!config_.engine_socket.empty()) {
        options.mounts.push_back(MountEntry{config_.engine_socket, CONTAINER_ENGINE_SOCKET, false});
    }
    options.env["HOME"] = CONTAINER_HOME;
    for (const auto& [key, value] : config_.auth.env) {
        options.env[key] = value;
    }
    options.privileged = config_.privileged;
    options.keep_container = config_.keep_containers;
    options.timeout = config_.timeout;

    if (config_.keep_containers) {
        auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        options.container_name = "nori-test-" + test_file.stem().string() + "-" +
                                 std::to_string(epoch_ms);
    }

    if (config_.auth.session_file.has_value()) {
        options.inject_file = *config_.auth.session_file;
        options.inject_target = utils::SESSION_TARGET;
    }

    return options;
}

TestRunner::AgentOutcome TestRunner::RunAgent(const std::vector<std::string>& command,
                                              const RunOptions& options) {
    ExecutionResult execution = runner_.RunCommand(config_.image, command, options);

    if (execution.exit_code != 0 && !execution.stderr_text.empty()) {
        spdlog::debug("Agent stderr: {}",
                      utils::StringUtils::Truncate(utils::StringUtils::Trim(execution.stderr_text), 2000));
    }
    spdlog::debug("Agent wrote {} bytes of output", execution.stdout_text.size());

    return AgentOutcome{execution.exit_code, execution.timed_out};
}

TestRunner::AgentOutcome TestRunner::StreamAgent(const std::vector<std::string>& command,
                                                 const RunOptions& options) {
    auto stream = runner_.RunCommandStreaming(config_.image, command, options);

    utils::StreamFormatter formatter;
    while (auto chunk = stream->Next()) {
        if (chunk->origin == OutputOrigin::STDOUT) {
            for (const auto& line : formatter.ProcessChunk(chunk->data)) {
                out_ << line << std::endl;
            }
        } else {
            err_ << "\x1b[2m" << chunk->data << "\x1b[0m" << std::flush;
        }
    }

    int exit_code = stream->Finish();
    return AgentOutcome{exit_code, stream->TimedOut()};
}

} // namespace core
} // namespace noritest
