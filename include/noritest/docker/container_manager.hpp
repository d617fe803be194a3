/**
 * @file container_manager.hpp
 * @brief Disposable container lifecycle for one command per container
 *
 * Each execution walks the same lifecycle:
 *
 * ```
 * Created -> (Injected)? -> Attached -> Started -> Running -> Exited -> (Removed)?
 * ```
 *
 * Buffered and streaming modes share the preamble (create, inject, attach,
 * start) and differ only in where demultiplexed output goes: into two
 * growing buffers, or onto a ChunkBridge the caller drains.
 *
 * @date 2025
 */

#pragma once

#include "noritest/core/command_runner.hpp"
#include "noritest/docker/docker_client.hpp"
#include "noritest/docker/stream_demuxer.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace noritest {
namespace docker {

class ContainerRun;

/**
 * @class ContainerManager
 * @brief Creates, runs and removes containers through the engine API
 *
 * **Failure semantics**:
 * - Errors before start propagate; a created container is still removed.
 * - Errors while attached, starting or waiting propagate; removal is
 *   attempted best-effort.
 * - Removal failures are logged and never propagate.
 *
 * **Thread Safety**: Executions may run concurrently; each owns its
 * container exclusively.
 *
 * **Usage Example**:
 * @code
 * ContainerManager manager;
 *
 * core::RunOptions options;
 * options.work_dir = "/tmp";
 * options.env["GREETING"] = "hello";
 *
 * auto result = manager.RunCommand("node:20-slim", {"sh", "-c", "echo $GREETING"}, options);
 * // result.exit_code == 0, result.stdout_text == "hello\n"
 *
 * auto stream = manager.RunCommandStreaming("node:20-slim", {"sh", "-c", "echo a; echo b >&2"}, options);
 * while (auto chunk = stream->Next()) {
 *     std::cout << core::OriginName(chunk->origin) << ": " << chunk->data;
 * }
 * int exit_code = stream->Finish();
 * @endcode
 */
class ContainerManager : public core::CommandRunner {
public:
    /// Non-root identity the guarded process runs as
    static constexpr std::uint32_t CONTAINER_UID = 1000;

    explicit ContainerManager(std::filesystem::path socket_path = DockerClient::SocketFromEnvironment());
    ~ContainerManager() override;

    core::ExecutionResult RunCommand(const std::string& image,
                                     const std::vector<std::string>& command,
                                     const core::RunOptions& options) override;

    std::unique_ptr<core::ChunkStream> RunCommandStreaming(
        const std::string& image,
        const std::vector<std::string>& command,
        const core::RunOptions& options) override;

    bool ImageExists(const std::string& image) override;

    void PullImage(const std::string& image) override;

    DockerClient& Client() { return client_; }

    /**
     * @brief Translate execution options into an engine create request
     * @throws std::invalid_argument on an empty image or command, a missing
     *         mount source, or an invalid environment key
     */
    static docker_schema::CreateContainer BuildCreateRequest(
        const std::string& image,
        const std::vector<std::string>& command,
        const core::RunOptions& options,
        const std::string& default_user);

    /**
     * @brief "1000:<gid of the engine socket>", or "1000:1000" if the socket
     *        cannot be examined
     */
    static std::string DefaultUser(const std::filesystem::path& socket_path);

private:
    std::unique_ptr<ContainerRun> Prepare(const std::string& image,
                                          const std::vector<std::string>& command,
                                          const core::RunOptions& options);

    void InjectFile(ContainerRun& run, const std::filesystem::path& host_file,
                    const std::filesystem::path& target);

    DockerClient client_;
    std::string default_user_;
};

} // namespace docker
} // namespace noritest
