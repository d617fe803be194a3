/**
 * @file json_reporter.cpp
 * @brief Implementation of the JSON test report
 *
 * @date 2025
 */

#include "noritest/reporters/json_reporter.hpp"
#include "noritest/utils/status_file.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

using json = nlohmann::json;

namespace noritest {
namespace reporters {

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

json JsonReporter::ToJson(const core::TestReport& report) const {
    json results = json::array();
    for (const auto& result : report.results) {
        json entry;
        entry["testFile"] = result.test_file;
        entry["status"] = utils::StatusName(result.status);
        if (result.error.has_value()) {
            entry["error"] = *result.error;
        }
        entry["durationMs"] = result.duration.count();
        results.push_back(entry);
    }

    json document;
    document["totalTests"] = report.total_tests;
    document["passed"] = report.passed;
    document["failed"] = report.failed;
    document["results"] = results;
    document["durationMs"] = report.duration.count();
    return document;
}

core::TestReport JsonReporter::FromJson(const json& document) {
    core::TestReport report;
    report.total_tests = document.at("totalTests").get<int>();
    report.passed = document.at("passed").get<int>();
    report.failed = document.at("failed").get<int>();
    report.duration = std::chrono::milliseconds(document.at("durationMs").get<long long>());

    for (const auto& entry : document.at("results")) {
        core::TestResult result;
        result.test_file = entry.at("testFile").get<std::string>();
        result.status = entry.at("status").get<std::string>() == "success"
            ? core::TestStatus::SUCCESS
            : core::TestStatus::FAILURE;
        if (entry.contains("error")) {
            result.error = entry["error"].get<std::string>();
        }
        result.duration = std::chrono::milliseconds(entry.at("durationMs").get<long long>());
        report.results.push_back(result);
    }

    return report;
}

std::string JsonReporter::Serialize(const core::TestReport& report) const {
    return ToJson(report).dump(config_.indent);
}

bool JsonReporter::WriteReport(const core::TestReport& report,
                               const std::filesystem::path& output_path) const {
    try {
        std::filesystem::path parent = output_path.parent_path();
        if (config_.create_directories && !parent.empty() && !std::filesystem::exists(parent)) {
            std::filesystem::create_directories(parent);
        }

        std::ofstream file(output_path);
        if (!file) {
            spdlog::error("Failed to open file for writing: {}", output_path.string());
            return false;
        }

        file << Serialize(report) << '\n';
        file.close();
        if (!file) {
            spdlog::error("Failed to write report: {}", output_path.string());
            return false;
        }

        spdlog::debug("Report written: {} ({} results)", output_path.string(), report.results.size());
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to save JSON report: {}", e.what());
        return false;
    }
}

} // namespace reporters
} // namespace noritest
