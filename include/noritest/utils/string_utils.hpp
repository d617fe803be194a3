/**
 * @file string_utils.hpp
 * @brief String helpers shared by the engine client, prompt templating and
 *        stream formatting
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace noritest {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string manipulation helpers
 *
 * All methods are static - no instantiation required.
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic Manipulation
     ***************************************************************************/

    /**
     * @brief Remove leading and trailing whitespace
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Split by delimiter, skipping empty tokens
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief Replace every occurrence of @p from with @p to
     */
    static std::string ReplaceAll(const std::string& str, const std::string& from, const std::string& to);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);

    /**
     * @brief Replace newlines and runs of whitespace with single spaces
     *
     * **Example**:
     * @code
     * StringUtils::CollapseWhitespace("a\n  b\t\tc ");  // "a b c"
     * @endcode
     */
    static std::string CollapseWhitespace(const std::string& str);

    /**
     * @brief Truncate to at most @p max_length characters
     *
     * The suffix counts toward the length limit.
     */
    static std::string Truncate(const std::string& str,
                                std::size_t max_length,
                                const std::string& suffix = "...");

    /***************************************************************************
     * Encoding
     ***************************************************************************/

    /**
     * @brief Percent-encode for use in a URL path segment or query value
     *
     * Unreserved characters (RFC 3986: ALPHA DIGIT - . _ ~) pass through.
     */
    static std::string UrlEncode(const std::string& str);
};

} // namespace utils
} // namespace noritest
