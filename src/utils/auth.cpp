/**
 * @file auth.cpp
 * @brief Implementation of credential resolution
 *
 * @date 2025
 */

#include "noritest/utils/auth.hpp"
#include "noritest/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace noritest {
namespace utils {

namespace fs = std::filesystem;

std::optional<fs::path> FindSessionFile() {
    std::error_code ec;

    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') {
        fs::path global_session = fs::path(home) / ".claude" / ".claude.json";
        if (fs::exists(global_session, ec)) {
            return global_session;
        }
    }

    fs::path local_session = fs::current_path(ec) / ".claude.json";
    if (!ec && fs::exists(local_session, ec)) {
        return local_session;
    }

    return std::nullopt;
}

AuthMethod SelectAuthMethod(const std::optional<std::string>& api_key,
                            const std::optional<fs::path>& session_file,
                            bool prefer_session) {
    bool has_key = api_key.has_value() && !api_key->empty();
    bool has_session = session_file.has_value();

    AuthMethod method;
    method.has_both = has_key && has_session;

    if (has_session && (prefer_session || !has_key)) {
        method.type = AuthType::SESSION;
        method.session_file = *session_file;
    } else if (has_key) {
        method.type = AuthType::API_KEY;
        method.api_key = *api_key;
    } else {
        method.has_both = false;
    }

    return method;
}

AuthMethod GetAuthMethod(bool prefer_session) {
    std::optional<std::string> api_key;
    if (const char* value = std::getenv(API_KEY_ENV)) {
        api_key = value;
    }
    return SelectAuthMethod(api_key, FindSessionFile(), prefer_session);
}

AuthConfig MakeAuthConfig(const AuthMethod& method) {
    AuthConfig config;
    switch (method.type) {
        case AuthType::API_KEY:
            config.env[API_KEY_ENV] = method.api_key;
            break;
        case AuthType::SESSION:
            spdlog::debug("Using session file {}", method.session_file.string());
            config.session_file = method.session_file;
            break;
        case AuthType::NONE:
            throw core::AuthError("No authentication method available");
    }
    return config;
}

AuthConfig GetAuthConfig(bool prefer_session) {
    return MakeAuthConfig(GetAuthMethod(prefer_session));
}

} // namespace utils
} // namespace noritest
