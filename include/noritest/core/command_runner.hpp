/**
 * @file command_runner.hpp
 * @brief Abstract container execution interface used by the test runner
 *
 * @date 2025
 */

#pragma once

#include "noritest/core/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace noritest {
namespace core {

/**
 * @class ChunkStream
 * @brief Lazy, finite, non-restartable sequence of output chunks
 *
 * Next() yields chunks until the process has exited and every buffered
 * chunk has been consumed. Finish() then returns the exit code and releases
 * the container.
 */
class ChunkStream {
public:
    virtual ~ChunkStream() = default;

    /**
     * @brief Next chunk, blocking until one is available
     * @return std::nullopt once the sequence is exhausted
     */
    virtual std::optional<OutputChunk> Next() = 0;

    /**
     * @brief Complete the execution
     *
     * Discards any chunk not yet consumed.
     * @return Process exit code
     */
    virtual int Finish() = 0;

    /// Process was killed at its deadline (valid after Finish())
    virtual bool TimedOut() const = 0;
};

/**
 * @class CommandRunner
 * @brief Runs one command per disposable container
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run to completion, accumulating output
     */
    virtual ExecutionResult RunCommand(const std::string& image,
                                       const std::vector<std::string>& command,
                                       const RunOptions& options) = 0;

    /**
     * @brief Run while handing output to the caller as it arrives
     */
    virtual std::unique_ptr<ChunkStream> RunCommandStreaming(
        const std::string& image,
        const std::vector<std::string>& command,
        const RunOptions& options) = 0;

    virtual bool ImageExists(const std::string& image) = 0;

    virtual void PullImage(const std::string& image) = 0;
};

} // namespace core
} // namespace noritest
