/**
 * @file docker_client.hpp
 * @brief Container engine HTTP API client over a unix socket
 *
 * Talks HTTP/1.1 to the engine socket (default /var/run/docker.sock) with
 * Boost.Beast. Every request opens its own connection, so one client may be
 * used concurrently from several threads (e.g. waiting on a container
 * while another thread reads its attach stream).
 *
 * @date 2025
 */

#pragma once

#include "noritest/docker/docker_schema.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/http/verb.hpp>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace noritest {
namespace docker {

/**
 * @class AttachedStream
 * @brief Hijacked connection carrying a container's multiplexed output
 *
 * Owns the socket. Bytes the HTTP parser read past the response header are
 * returned first by Read().
 */
class AttachedStream {
public:
    AttachedStream(std::unique_ptr<boost::asio::io_context> context,
                   std::unique_ptr<boost::asio::local::stream_protocol::socket> socket,
                   std::string leftover);
    ~AttachedStream();

    AttachedStream(const AttachedStream&) = delete;
    AttachedStream& operator=(const AttachedStream&) = delete;

    /**
     * @brief Read the next bytes of the stream (blocking)
     * @return Number of bytes read, 0 at end of stream
     * @throws core::DockerError on a transport error
     */
    std::size_t Read(char* buffer, std::size_t size);

    /**
     * @brief Shut the connection down so a blocked Read() returns
     *
     * Safe to call from a thread other than the reader.
     */
    void Shutdown();

private:
    std::unique_ptr<boost::asio::io_context> context_;
    std::unique_ptr<boost::asio::local::stream_protocol::socket> socket_;
    std::string leftover_;
    std::size_t leftover_offset_{0};
    int native_handle_{-1};
    std::atomic<bool> shutdown_requested_{false};
};

/**
 * @class DockerClient
 * @brief Minimal engine API client for the container lifecycle
 *
 * All operations throw core::DockerError when the engine answers with a
 * status outside the operation's accepted set, or when the socket cannot
 * be reached.
 */
class DockerClient {
public:
    using OnResponseBytes = std::function<void(const char*, std::size_t)>;
    using OnImageProgress = std::function<void(const std::string&)>;

    static constexpr const char* DEFAULT_SOCKET = "/var/run/docker.sock";

    explicit DockerClient(std::filesystem::path socket_path = DEFAULT_SOCKET);

    /**
     * @brief Resolve the engine socket from DOCKER_HOST (unix:// only)
     */
    static std::filesystem::path SocketFromEnvironment();

    const std::filesystem::path& SocketPath() const { return socket_path_; }

    /// GET /_ping. Never throws.
    bool Ping();

    bool ImageExists(const std::string& image);

    /**
     * @brief Pull an image, returning once the engine reports completion
     * @param on_progress Receives each progress line (optional)
     */
    void PullImage(const std::string& image, const OnImageProgress& on_progress = {});

    /**
     * @return Container id
     */
    std::string CreateContainer(const docker_schema::CreateContainer& request,
                                const std::optional<std::string>& name = std::nullopt);

    /**
     * @brief Extract a tar archive into a directory of the container
     */
    void PutArchive(const std::string& id, const std::string& directory,
                    const std::string& tar_bytes);

    /**
     * @brief Check whether a path exists inside a (possibly stopped) container
     */
    bool PathExists(const std::string& id, const std::string& path);

    std::unique_ptr<AttachedStream> AttachContainer(const std::string& id);

    void StartContainer(const std::string& id);

    /**
     * @brief Block until the container exits
     * @return Exit code reported by the engine
     */
    int WaitContainer(const std::string& id);

    void KillContainer(const std::string& id);

    void RemoveContainer(const std::string& id, bool force = true);

    std::vector<docker_schema::ContainerSummary> ListContainers(
        bool all = true, const std::string& name_filter = "");

    /**
     * @brief Split "repo[:tag]" / "repo@digest" into pull query values
     */
    static std::pair<std::string, std::string> SplitImageReference(const std::string& image);

    /**
     * @brief Extract the engine's "message" from an error body
     */
    static std::string ParseEngineMessage(const std::string& body);

private:
    struct Response {
        unsigned status{0};
        std::string body;
    };

    std::unique_ptr<boost::asio::local::stream_protocol::socket> Connect(
        boost::asio::io_context& context, const std::string& target);

    Response SendRequest(boost::beast::http::verb method, const std::string& target,
                         const std::string& body = "",
                         const std::string& content_type = "application/json");

    unsigned SendRequest(boost::beast::http::verb method, const std::string& target,
                         const std::string& body, const std::string& content_type,
                         const OnResponseBytes& on_response);

    Response Transaction(boost::beast::http::verb method, const std::string& target,
                         const std::vector<unsigned>& accepted,
                         const std::string& body = "",
                         const std::string& content_type = "application/json");

    std::filesystem::path socket_path_;
};

} // namespace docker
} // namespace noritest
