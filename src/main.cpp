/**
 * @file main.cpp
 * @brief nori-tests - Command-line interface
 *
 * Entry point for the markdown test runner. Discovers test files in a folder,
 * runs the coding agent on each one inside a disposable container and reports
 * the outcome on the console and optionally as a JSON document.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "noritest/core/errors.hpp"
#include "noritest/core/test_runner.hpp"
#include "noritest/docker/container_manager.hpp"
#include "noritest/reporters/json_reporter.hpp"
#include "noritest/utils/auth.hpp"
#include "noritest/utils/string_utils.hpp"
#include "noritest/utils/test_discovery.hpp"

#include <unistd.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace {

constexpr const char* VERSION = "1.0.0";

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintBanner() {
    std::cout << "\nnori-tests v" << VERSION << "\n";
    std::cout << "================\n";
}

void PrintSummary(const noritest::core::TestReport& report) {
    std::cout << "\n================\n";
    std::cout << "Summary\n";
    std::cout << "================\n";
    std::cout << "Total:  " << report.total_tests << "\n";
    std::cout << "Passed: " << report.passed << "\n";
    std::cout << "Failed: " << report.failed << "\n";
    std::cout << "Time:   " << report.duration.count() << "ms\n";
}

std::optional<std::string> PromptForApiKey() {
    std::cout << noritest::utils::API_KEY_ENV << " not found. Please enter your API key: " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return std::nullopt;
    }
    answer = noritest::utils::StringUtils::Trim(answer);
    if (answer.empty()) {
        return std::nullopt;
    }
    return answer;
}

/**
 * @brief Resolve the agent credential, prompting on a terminal if needed
 * @return std::nullopt if no credential could be obtained
 */
std::optional<noritest::utils::AuthConfig> ResolveCredentials(bool prefer_session) {
    using noritest::utils::AuthType;

    auto method = noritest::utils::GetAuthMethod(prefer_session);

    if (method.has_both) {
        if (method.type == AuthType::SESSION) {
            spdlog::warn("Both {} and a session file are present; using the session file {}",
                         noritest::utils::API_KEY_ENV, method.session_file.string());
        } else {
            spdlog::warn("Both {} and a session file are present; using the API key "
                         "(pass --prefer-session to use the session file)",
                         noritest::utils::API_KEY_ENV);
        }
    }

    if (method.type != AuthType::NONE) {
        return noritest::utils::MakeAuthConfig(method);
    }

    if (!::isatty(STDIN_FILENO)) {
        spdlog::error("{} environment variable is not set and no session file was found",
                      noritest::utils::API_KEY_ENV);
        return std::nullopt;
    }

    auto api_key = PromptForApiKey();
    if (!api_key.has_value()) {
        spdlog::error("{} is required", noritest::utils::API_KEY_ENV);
        return std::nullopt;
    }

    noritest::utils::AuthConfig config;
    config.env[noritest::utils::API_KEY_ENV] = *api_key;
    return config;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Run markdown integration tests with claude-code in isolated Docker containers"};
    app.set_version_flag("--version", VERSION);

    std::string folder;
    std::string output_file;
    std::string image = "node:20";
    int timeout_seconds = 0;
    bool keep_containers = false;
    bool dry_run = false;
    bool stream = false;
    bool privileged = false;
    bool prefer_session = false;
    bool verbose = false;

    app.add_option("folder", folder, "Path to folder containing test markdown files")
        ->required()
        ->check(CLI::ExistingDirectory);

    app.add_option("-o,--output", output_file, "Write a JSON report to this file");
    app.add_flag("--keep-containers", keep_containers, "Keep containers after tests for debugging");
    app.add_flag("--dry-run", dry_run, "Discover tests without running them");
    app.add_flag("--stream", stream, "Show agent output in real time");
    app.add_flag("--privileged", privileged,
                 "Run containers in privileged mode (required for docker-in-docker)");
    app.add_flag("--prefer-session", prefer_session,
                 "Use the session file even when an API key is set");
    app.add_option("--image", image, "Image the agent runs in")
        ->default_val("node:20");
    app.add_option("--timeout", timeout_seconds, "Per-test timeout in seconds (0 = none)")
        ->check(CLI::NonNegativeNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        auto folder_path = std::filesystem::absolute(folder).lexically_normal();

        noritest::core::RunnerConfig config;
        config.image = image;
        config.work_dir = std::filesystem::current_path();
        config.keep_containers = keep_containers;
        config.privileged = privileged;
        config.stream = stream;
        config.dry_run = dry_run;
        if (timeout_seconds > 0) {
            config.timeout = std::chrono::seconds(timeout_seconds);
        }

        if (!dry_run) {
            auto auth = ResolveCredentials(prefer_session);
            if (!auth.has_value()) {
                return 1;
            }
            config.auth = *auth;
        }

        auto tests = noritest::utils::DiscoverTests(folder_path);

        PrintBanner();
        std::cout << "Test folder: " << folder_path.string() << "\n";
        std::cout << "Tests found: " << tests.size() << std::endl;

        noritest::reporters::JsonReporter reporter;

        if (tests.empty()) {
            std::cout << "\nNo test files found." << std::endl;
            if (!output_file.empty() &&
                !reporter.WriteReport(noritest::core::TestReport{}, output_file)) {
                return 1;
            }
            return 0;
        }

        if (dry_run) {
            std::cout << "\n[DRY RUN] Would run the following tests:\n";
            for (std::size_t i = 0; i < tests.size(); ++i) {
                std::cout << "  " << (i + 1) << ". " << tests[i].filename().string() << "\n";
            }
        }

        noritest::core::TestReport report;
        if (dry_run) {
            report = noritest::core::TestRunner::DryRun(folder_path);
        } else {
            noritest::docker::ContainerManager manager;
            if (!manager.Client().Ping()) {
                spdlog::error("Cannot reach the Docker engine at {}",
                              manager.Client().SocketPath().string());
                return 1;
            }
            config.engine_socket = manager.Client().SocketPath();
            noritest::core::TestRunner runner(manager, config);
            report = runner.Run(folder_path);
        }

        PrintSummary(report);

        if (!output_file.empty()) {
            auto output_path = std::filesystem::absolute(output_file);
            if (!reporter.WriteReport(report, output_path)) {
                return 1;
            }
            std::cout << "\nReport written to: " << output_path.string() << std::endl;
        }

        return report.failed > 0 ? 1 : 0;

    } catch (const noritest::core::DockerError& e) {
        spdlog::error("Docker error: {}", e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
