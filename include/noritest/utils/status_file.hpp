/**
 * @file status_file.hpp
 * @brief Parsing of the status file written by the agent
 *
 * Accepted documents:
 * ```
 * {"status": "success"}
 * {"status": "failure", "error": "what went wrong"}
 * ```
 *
 * @date 2025
 */

#pragma once

#include "noritest/core/types.hpp"

#include <filesystem>
#include <string>

namespace noritest {
namespace utils {

/**
 * @brief Parse status file contents
 * @throws core::StatusFileError on malformed JSON, a non-object document, a
 *         missing "status" field or a status other than success/failure
 */
core::StatusFile ParseStatusFile(const std::string& content);

/**
 * @brief Read and parse a status file
 * @throws core::StatusFileError if the file cannot be read or is malformed
 */
core::StatusFile ReadStatusFile(const std::filesystem::path& path);

const char* StatusName(core::TestStatus status);

} // namespace utils
} // namespace noritest
