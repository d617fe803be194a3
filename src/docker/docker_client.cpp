/**
 * @file docker_client.cpp
 * @brief Implementation of the engine API client
 *
 * **Request model**:
 * ```
 * connect(unix socket) -> write request -> read header -> relay body -> close
 * ```
 * Bodies are relayed through a fixed buffer (Beast buffer_body), so large
 * or endless responses (image pull progress) are handed to the caller as
 * they arrive. The attach request upgrades the connection; after the 101
 * response the socket carries the container's multiplexed output and is
 * handed over to an AttachedStream.
 *
 * @date 2025
 */

#include "noritest/docker/docker_client.hpp"
#include "noritest/core/errors.hpp"
#include "noritest/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <sys/socket.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <limits>

using json = nlohmann::json;

namespace noritest {
namespace docker {

namespace http = boost::beast::http;
using boost::asio::local::stream_protocol;

namespace {

constexpr std::size_t RELAY_BUFFER_SIZE = 16 * 4096;

http::request<http::string_body> BuildRequest(http::verb method, const std::string& target,
                                              const std::string& body,
                                              const std::string& content_type) {
    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, "localhost");
    req.set(http::field::connection, "close");
    req.set(http::field::accept, "application/json");
    if (!body.empty()) {
        req.set(http::field::content_type, content_type);
        req.body() = body;
    }
    req.prepare_payload();
    return req;
}

} // anonymous namespace

// ============================================================================
// ATTACHED STREAM
// ============================================================================

AttachedStream::AttachedStream(std::unique_ptr<boost::asio::io_context> context,
                               std::unique_ptr<stream_protocol::socket> socket,
                               std::string leftover)
    : context_(std::move(context))
    , socket_(std::move(socket))
    , leftover_(std::move(leftover))
    , native_handle_(socket_->native_handle()) {
}

AttachedStream::~AttachedStream() {
    boost::system::error_code ec;
    socket_->close(ec);
}

std::size_t AttachedStream::Read(char* buffer, std::size_t size) {
    if (leftover_offset_ < leftover_.size()) {
        std::size_t take = std::min(size, leftover_.size() - leftover_offset_);
        leftover_.copy(buffer, take, leftover_offset_);
        leftover_offset_ += take;
        return take;
    }

    boost::system::error_code ec;
    std::size_t bytes = socket_->read_some(boost::asio::buffer(buffer, size), ec);
    if (ec == boost::asio::error::eof) {
        return 0;
    }
    if (ec) {
        if (shutdown_requested_) {
            return 0;
        }
        throw core::DockerError(0, "attach", ec.message());
    }
    return bytes;
}

void AttachedStream::Shutdown() {
    shutdown_requested_ = true;
    // Plain shutdown(2) on the descriptor is safe while another thread reads
    ::shutdown(native_handle_, SHUT_RDWR);
}

// ============================================================================
// CLIENT
// ============================================================================

DockerClient::DockerClient(std::filesystem::path socket_path)
    : socket_path_(std::move(socket_path)) {
    spdlog::debug("Docker client using socket {}", socket_path_.string());
}

std::filesystem::path DockerClient::SocketFromEnvironment() {
    const char* host = std::getenv("DOCKER_HOST");
    if (host == nullptr || *host == '\0') {
        return DEFAULT_SOCKET;
    }

    std::string value(host);
    const std::string scheme = "unix://";
    if (utils::StringUtils::StartsWith(value, scheme)) {
        return value.substr(scheme.size());
    }

    spdlog::warn("DOCKER_HOST '{}' is not a unix socket, using {}", value, DEFAULT_SOCKET);
    return DEFAULT_SOCKET;
}

std::unique_ptr<stream_protocol::socket> DockerClient::Connect(
    boost::asio::io_context& context, const std::string& target) {
    auto socket = std::make_unique<stream_protocol::socket>(context);

    boost::system::error_code ec;
    socket->connect(stream_protocol::endpoint(socket_path_.string()), ec);
    if (ec) {
        throw core::DockerError(0, target,
                                "cannot connect to " + socket_path_.string() + ": " + ec.message());
    }
    return socket;
}

unsigned DockerClient::SendRequest(http::verb method, const std::string& target,
                                   const std::string& body, const std::string& content_type,
                                   const OnResponseBytes& on_response) {
    boost::asio::io_context context;
    auto socket = Connect(context, target);

    boost::system::error_code ec;
    auto req = BuildRequest(method, target, body, content_type);
    http::write(*socket, req, ec);
    if (ec) {
        throw core::DockerError(0, target, "write failed: " + ec.message());
    }

    boost::beast::flat_buffer buffer;
    http::response_parser<http::buffer_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    if (method == http::verb::head) {
        parser.skip(true);
    }

    http::read_header(*socket, buffer, parser, ec);
    if (ec) {
        throw core::DockerError(0, target, "read failed: " + ec.message());
    }

    unsigned status = parser.get().result_int();
    auto verb_name = http::to_string(method);
    spdlog::debug("{} {} -> {}", std::string(verb_name.data(), verb_name.size()), target, status);

    std::array<char, RELAY_BUFFER_SIZE> chunk;
    while (!parser.is_done()) {
        parser.get().body().data = chunk.data();
        parser.get().body().size = chunk.size();
        http::read(*socket, buffer, parser, ec);
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        if (ec) {
            throw core::DockerError(static_cast<int>(status), target,
                                    "body read failed: " + ec.message());
        }

        std::size_t bytes = chunk.size() - parser.get().body().size;
        if (bytes > 0 && on_response) {
            on_response(chunk.data(), bytes);
        }
    }

    return status;
}

DockerClient::Response DockerClient::SendRequest(http::verb method, const std::string& target,
                                                 const std::string& body,
                                                 const std::string& content_type) {
    Response response;
    response.status = SendRequest(method, target, body, content_type,
                                  [&response](const char* data, std::size_t size) {
                                      response.body.append(data, size);
                                  });
    return response;
}

DockerClient::Response DockerClient::Transaction(http::verb method, const std::string& target,
                                                 const std::vector<unsigned>& accepted,
                                                 const std::string& body,
                                                 const std::string& content_type) {
    Response response = SendRequest(method, target, body, content_type);

    bool ok = false;
    for (unsigned code : accepted) {
        if (response.status == code) {
            ok = true;
            break;
        }
    }
    if (!ok) {
        throw core::DockerError(static_cast<int>(response.status), target,
                                ParseEngineMessage(response.body));
    }
    return response;
}

std::string DockerClient::ParseEngineMessage(const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("message") &&
        parsed["message"].is_string()) {
        return parsed["message"].get<std::string>();
    }
    return utils::StringUtils::Trim(body);
}

// ============================================================================
// IMAGES
// ============================================================================

bool DockerClient::Ping() {
    try {
        return SendRequest(http::verb::get, "/_ping").status == 200;
    }
    catch (const std::exception& e) {
        spdlog::debug("Docker ping failed: {}", e.what());
        return false;
    }
}

bool DockerClient::ImageExists(const std::string& image) {
    std::string target = "/images/" + image + "/json";
    Response response = SendRequest(http::verb::get, target);
    if (response.status == 200) {
        return true;
    }
    if (response.status == 404) {
        return false;
    }
    throw core::DockerError(static_cast<int>(response.status), target,
                            ParseEngineMessage(response.body));
}

std::pair<std::string, std::string> DockerClient::SplitImageReference(const std::string& image) {
    if (image.find('@') != std::string::npos) {
        return {image, ""};
    }

    std::size_t slash = image.rfind('/');
    std::size_t colon = image.rfind(':');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        return {image.substr(0, colon), image.substr(colon + 1)};
    }
    return {image, "latest"};
}

void DockerClient::PullImage(const std::string& image, const OnImageProgress& on_progress) {
    auto [repository, tag] = SplitImageReference(image);

    std::string target = "/images/create?fromImage=" + utils::StringUtils::UrlEncode(repository);
    if (!tag.empty()) {
        target += "&tag=" + utils::StringUtils::UrlEncode(tag);
    }

    spdlog::info("Pulling image {}", image);

    std::string pending;
    std::string pull_error;
    auto handle_line = [&](const std::string& line) {
        std::string trimmed = utils::StringUtils::Trim(line);
        if (trimmed.empty()) {
            return;
        }
        if (on_progress) {
            on_progress(trimmed);
        }
        json event = json::parse(trimmed, nullptr, false);
        if (event.is_discarded() || !event.is_object()) {
            return;
        }
        if (event.contains("error") && event["error"].is_string()) {
            pull_error = event["error"].get<std::string>();
        } else if (event.contains("errorDetail") && event["errorDetail"].is_object()) {
            pull_error = event["errorDetail"].value("message", std::string{"unknown error"});
        }
    };

    std::string error_body;
    unsigned status = SendRequest(http::verb::post, target, "", "application/json",
        [&](const char* data, std::size_t size) {
            pending.append(data, size);
            std::size_t newline;
            while ((newline = pending.find('\n')) != std::string::npos) {
                handle_line(pending.substr(0, newline));
                pending.erase(0, newline + 1);
            }
        });
    handle_line(pending);

    if (status != 200) {
        throw core::DockerError(static_cast<int>(status), target,
                                pull_error.empty() ? ParseEngineMessage(pending) : pull_error);
    }
    if (!pull_error.empty()) {
        throw core::DockerError(static_cast<int>(status), target, pull_error);
    }

    spdlog::info("Pulled image {}", image);
}

// ============================================================================
// CONTAINERS
// ============================================================================

std::string DockerClient::CreateContainer(const docker_schema::CreateContainer& request,
                                          const std::optional<std::string>& name) {
    std::string target = "/containers/create";
    if (name.has_value() && !name->empty()) {
        target += "?name=" + utils::StringUtils::UrlEncode(*name);
    }

    json body = request;
    Response response = Transaction(http::verb::post, target, {201}, body.dump());

    auto created = json::parse(response.body).get<docker_schema::CreatedContainer>();
    for (const auto& warning : created.Warnings) {
        spdlog::warn("Container create warning: {}", warning);
    }
    return created.Id;
}

void DockerClient::PutArchive(const std::string& id, const std::string& directory,
                              const std::string& tar_bytes) {
    std::string target = "/containers/" + id + "/archive?path=" +
                         utils::StringUtils::UrlEncode(directory);
    Transaction(http::verb::put, target, {200}, tar_bytes, "application/x-tar");
}

bool DockerClient::PathExists(const std::string& id, const std::string& path) {
    std::string target = "/containers/" + id + "/archive?path=" +
                         utils::StringUtils::UrlEncode(path);
    Response response = SendRequest(http::verb::head, target);
    if (response.status == 200) {
        return true;
    }
    if (response.status == 404) {
        return false;
    }
    throw core::DockerError(static_cast<int>(response.status), target,
                            ParseEngineMessage(response.body));
}

std::unique_ptr<AttachedStream> DockerClient::AttachContainer(const std::string& id) {
    std::string target = "/containers/" + id + "/attach?stream=1&stdout=1&stderr=1";

    auto context = std::make_unique<boost::asio::io_context>();
    auto socket = Connect(*context, target);

    boost::system::error_code ec;
    auto req = BuildRequest(http::verb::post, target, "", "");
    req.set(http::field::upgrade, "tcp");
    req.set(http::field::connection, "Upgrade");
    http::write(*socket, req, ec);
    if (ec) {
        throw core::DockerError(0, target, "write failed: " + ec.message());
    }

    boost::beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    http::read_header(*socket, buffer, parser, ec);
    if (ec) {
        throw core::DockerError(0, target, "read failed: " + ec.message());
    }

    unsigned status = parser.get().result_int();
    spdlog::debug("POST {} -> {}", target, status);

    if (status != 101 && status != 200) {
        http::read(*socket, buffer, parser, ec);
        throw core::DockerError(static_cast<int>(status), target,
                                ParseEngineMessage(parser.get().body()));
    }

    // Anything past the header already belongs to the output stream
    std::string leftover = boost::beast::buffers_to_string(buffer.data());
    return std::make_unique<AttachedStream>(std::move(context), std::move(socket),
                                            std::move(leftover));
}

void DockerClient::StartContainer(const std::string& id) {
    Transaction(http::verb::post, "/containers/" + id + "/start", {204, 304});
}

int DockerClient::WaitContainer(const std::string& id) {
    Response response = Transaction(http::verb::post, "/containers/" + id + "/wait", {200});

    json result = json::parse(response.body);
    if (result.contains("Error") && result["Error"].is_object()) {
        std::string message = result["Error"].value("Message", std::string{});
        if (!message.empty()) {
            spdlog::warn("Container {} wait reported: {}", id.substr(0, 12), message);
        }
    }
    return result.at("StatusCode").get<int>();
}

void DockerClient::KillContainer(const std::string& id) {
    Transaction(http::verb::post, "/containers/" + id + "/kill", {204, 409});
}

void DockerClient::RemoveContainer(const std::string& id, bool force) {
    Transaction(http::verb::delete_,
                "/containers/" + id + (force ? "?force=1" : "?force=0"), {204});
}

std::vector<docker_schema::ContainerSummary> DockerClient::ListContainers(
    bool all, const std::string& name_filter) {
    std::string target = std::string("/containers/json?all=") + (all ? "1" : "0");
    if (!name_filter.empty()) {
        json filters = json::object();
        filters["name"] = json::array({name_filter});
        target += "&filters=" + utils::StringUtils::UrlEncode(filters.dump());
    }

    Response response = Transaction(http::verb::get, target, {200});
    return json::parse(response.body).get<std::vector<docker_schema::ContainerSummary>>();
}

} // namespace docker
} // namespace noritest
