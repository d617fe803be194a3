/**
 * @file json_reporter.hpp
 * @brief Machine-readable JSON report of a test run
 *
 * Document layout:
 * ```
 * {
 *   "totalTests": 2,
 *   "passed": 1,
 *   "failed": 1,
 *   "results": [
 *     {"testFile": "a.md", "status": "success", "durationMs": 5120},
 *     {"testFile": "b.md", "status": "failure", "error": "...", "durationMs": 830}
 *   ],
 *   "durationMs": 5950
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include "noritest/core/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace noritest {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Configuration for JSON report output
 */
struct JsonReporterConfig {
    int indent{2};                  ///< Spaces per indentation level
    bool create_directories{true};  ///< Create missing parent directories
};

/**
 * @class JsonReporter
 * @brief Serializes a TestReport
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = {});

    nlohmann::json ToJson(const core::TestReport& report) const;

    /**
     * @brief Rebuild a report from its document
     * @throws nlohmann::json::exception on a malformed document
     */
    static core::TestReport FromJson(const nlohmann::json& document);

    std::string Serialize(const core::TestReport& report) const;

    /**
     * @brief Write the report to @p output_path
     * @return false if the file could not be written
     */
    bool WriteReport(const core::TestReport& report,
                     const std::filesystem::path& output_path) const;

private:
    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace noritest
