/**
 * @file markdown.hpp
 * @brief Prompt templating for test markdown
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace noritest {
namespace utils {

/// Placeholder replaced with the status file path
constexpr const char* STATUS_PATH_PLACEHOLDER = "{{STATUS_FILE_PATH}}";

/**
 * @brief Append the completion instructions telling the agent how to report
 *        its result
 *
 * **Example**:
 * @code
 * std::string prompt = AppendStatusInstructions("# Test\nDo X", "/work/.nori-test-status.json");
 * // prompt starts with "# Test\nDo X" and names the status path three times
 * @endcode
 */
std::string AppendStatusInstructions(const std::string& markdown,
                                     const std::string& status_file_path);

} // namespace utils
} // namespace noritest
