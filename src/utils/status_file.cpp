/**
 * @file status_file.cpp
 * @brief Implementation of status file parsing
 *
 * @date 2025
 */

#include "noritest/utils/status_file.hpp"
#include "noritest/core/errors.hpp"
#include "noritest/utils/string_utils.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace noritest {
namespace utils {

const char* StatusName(core::TestStatus status) {
    return status == core::TestStatus::SUCCESS ? "success" : "failure";
}

core::StatusFile ParseStatusFile(const std::string& content) {
    json document;
    try {
        document = json::parse(StringUtils::Trim(content));
    }
    catch (const json::parse_error& e) {
        throw core::StatusFileError(std::string("Invalid JSON in status file: ") + e.what());
    }

    if (!document.is_object()) {
        throw core::StatusFileError("Status file must contain a JSON object");
    }

    if (!document.contains("status")) {
        throw core::StatusFileError("Status file missing required \"status\" field");
    }

    const json& status = document["status"];
    std::string value = status.is_string() ? status.get<std::string>() : status.dump();

    core::StatusFile result;
    if (value == "success" && status.is_string()) {
        result.status = core::TestStatus::SUCCESS;
    } else if (value == "failure" && status.is_string()) {
        result.status = core::TestStatus::FAILURE;
    } else {
        throw core::StatusFileError("Invalid status value: \"" + value +
                                    "\". Must be \"success\" or \"failure\"");
    }

    // A non-string error is ignored
    if (document.contains("error") && document["error"].is_string()) {
        result.error = document["error"].get<std::string>();
    }

    return result;
}

core::StatusFile ReadStatusFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw core::StatusFileError("Cannot read status file: " + path.string());
    }
    std::stringstream content;
    content << file.rdbuf();
    return ParseStatusFile(content.str());
}

} // namespace utils
} // namespace noritest
