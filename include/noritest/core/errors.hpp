/**
 * @file errors.hpp
 * @brief Exception hierarchy for container execution and test orchestration
 *
 * Every failure that aborts an operation is reported as an exception derived
 * from std::runtime_error. Cleanup paths never throw; they log and continue.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace noritest {
namespace core {

/**
 * @class DockerError
 * @brief Container engine API request failed
 *
 * Raised for transport failures (status code 0) and for any HTTP status the
 * engine returns outside the accepted set of the operation.
 */
class DockerError : public std::runtime_error {
public:
    DockerError(int status_code, const std::string& target, const std::string& message)
        : std::runtime_error("Docker request failed: " + target + " -> " +
                             std::to_string(status_code) + " (" + message + ")")
        , status_code_(status_code)
        , target_(target)
        , engine_message_(message) {}

    int StatusCode() const { return status_code_; }
    const std::string& Target() const { return target_; }
    const std::string& EngineMessage() const { return engine_message_; }

private:
    int status_code_;             ///< HTTP status (0 for transport errors)
    std::string target_;          ///< Request target, e.g. "/containers/create"
    std::string engine_message_;  ///< Message reported by the engine
};

/**
 * @class ArchiveError
 * @brief Archive could not be packed
 */
class ArchiveError : public std::runtime_error {
public:
    explicit ArchiveError(const std::string& message)
        : std::runtime_error("Archive error: " + message) {}
};

/**
 * @class DemuxError
 * @brief Multiplexed output stream is corrupt
 */
class DemuxError : public std::runtime_error {
public:
    explicit DemuxError(const std::string& message)
        : std::runtime_error("Stream demux error: " + message) {}
};

/**
 * @class StatusFileError
 * @brief Status file written by the guarded process is malformed
 */
class StatusFileError : public std::runtime_error {
public:
    explicit StatusFileError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class AuthError
 * @brief No credential source is available
 */
class AuthError : public std::runtime_error {
public:
    explicit AuthError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace core
} // namespace noritest
