/**
 * @file auth.hpp
 * @brief Credential resolution for the agent inside the container
 *
 * Two mutually exclusive sources:
 * - ANTHROPIC_API_KEY in the environment, passed through as an env variable
 * - a session file (.claude.json), injected into the container home
 *
 * The API key wins unless the session is explicitly preferred.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace noritest {
namespace utils {

/// Environment variable carrying the API key
constexpr const char* API_KEY_ENV = "ANTHROPIC_API_KEY";

/// Where a session file is placed inside the container
constexpr const char* SESSION_TARGET = "/home/node/.claude.json";

/**
 * @enum AuthType
 * @brief Selected credential source
 */
enum class AuthType {
    API_KEY,
    SESSION,
    NONE
};

/**
 * @struct AuthMethod
 * @brief Resolved credential source
 */
struct AuthMethod {
    AuthType type{AuthType::NONE};
    std::string api_key;                  ///< Set for API_KEY
    std::filesystem::path session_file;   ///< Set for SESSION
    bool has_both{false};                 ///< Both sources were available
};

/**
 * @struct AuthConfig
 * @brief What the container needs to authenticate
 */
struct AuthConfig {
    std::map<std::string, std::string> env;            ///< Extra environment
    std::optional<std::filesystem::path> session_file; ///< Host file to inject
};

/**
 * @brief Locate a session file
 *
 * Checks $HOME/.claude/.claude.json, then ./.claude.json.
 */
std::optional<std::filesystem::path> FindSessionFile();

/**
 * @brief Choose between the given sources
 */
AuthMethod SelectAuthMethod(const std::optional<std::string>& api_key,
                            const std::optional<std::filesystem::path>& session_file,
                            bool prefer_session);

/**
 * @brief Resolve from the process environment and the session file locations
 */
AuthMethod GetAuthMethod(bool prefer_session = false);

/**
 * @brief Translate a resolved method into container configuration
 * @throws core::AuthError for AuthType::NONE
 */
AuthConfig MakeAuthConfig(const AuthMethod& method);

/**
 * @brief GetAuthMethod() followed by MakeAuthConfig()
 * @throws core::AuthError if no credential source is available
 */
AuthConfig GetAuthConfig(bool prefer_session = false);

} // namespace utils
} // namespace noritest
