/**
 * @file container_manager.cpp
 * @brief Implementation of the disposable container lifecycle
 *
 * **Execution Workflow**:
 * 1. **Translate**: mounts become "host:container:mode" binds, the env map
 *    becomes KEY=VALUE entries
 * 2. **Create**: the container is created stopped, running as uid 1000
 * 3. **Inject**: an optional host file is written into the stopped
 *    container through the archive interface
 * 4. **Attach**: the output stream is attached before start so no early
 *    output is lost
 * 5. **Start**: a reader thread demultiplexes output into the sink
 * 6. **Wait**: blocks until exit, killing the container at its deadline
 * 7. **Drain**: the attach stream closing marks the end of output
 * 8. **Remove**: force removal unless retention was requested
 *
 * **Threads per execution**:
 * ```
 * caller ---- create/inject/attach/start ---- wait ---- join reader ---- remove
 *                                      \
 * reader                                read -> demux -> sink ... EOF
 * ```
 * In streaming mode the wait and join run on a waiter thread that closes the
 * chunk bridge, and the caller consumes chunks concurrently.
 *
 * @date 2025
 */

#include "noritest/docker/container_manager.hpp"
#include "noritest/core/chunk_bridge.hpp"
#include "noritest/core/errors.hpp"
#include "noritest/docker/archive_packer.hpp"

#include <spdlog/spdlog.h>

#include <sys/stat.h>

#include <array>
#include <exception>
#include <future>
#include <stdexcept>
#include <thread>

namespace noritest {
namespace docker {

namespace {

constexpr std::size_t READ_BUFFER_SIZE = 8192;

struct WaitOutcome {
    int exit_code{0};
    bool timed_out{false};
};

std::string ShortId(const std::string& id) {
    return id.substr(0, 12);
}

} // anonymous namespace

// ============================================================================
// CONTAINER RUN
// ============================================================================
// Owns one container for the duration of one execution. The destructor
// guarantees the reader thread is stopped and the retention policy applied.

class ContainerRun {
public:
    ContainerRun(DockerClient& client, std::string id, bool keep, std::string label)
        : client_(client)
        , id_(std::move(id))
        , keep_(keep)
        , label_(std::move(label)) {
    }

    ~ContainerRun() {
        if (reader_.joinable()) {
            if (attach_) {
                attach_->Shutdown();
            }
            reader_.join();
        }
        Cleanup();
    }

    ContainerRun(const ContainerRun&) = delete;
    ContainerRun& operator=(const ContainerRun&) = delete;

    const std::string& Id() const { return id_; }

    void Attach() {
        attach_ = client_.AttachContainer(id_);
        spdlog::debug("Container {} attached", ShortId(id_));
    }

    void StartReader(StreamDemuxer::Sink sink) {
        reader_ = std::thread([this, sink = std::move(sink)]() {
            try {
                StreamDemuxer demuxer(sink);
                std::array<char, READ_BUFFER_SIZE> buffer;
                std::size_t bytes;
                while ((bytes = attach_->Read(buffer.data(), buffer.size())) > 0) {
                    demuxer.Feed(buffer.data(), bytes);
                }
                demuxer.Finish();
                spdlog::debug("Container {} output closed ({} frames, {} bytes)",
                              ShortId(id_), demuxer.FramesDelivered(), demuxer.BytesDelivered());
            }
            catch (...) {
                reader_error_ = std::current_exception();
            }
        });
    }

    void Start() {
        client_.StartContainer(id_);
        spdlog::debug("Container {} started", ShortId(id_));
    }

    WaitOutcome Wait(const std::optional<std::chrono::seconds>& timeout) {
        WaitOutcome outcome;
        if (!timeout.has_value()) {
            outcome.exit_code = client_.WaitContainer(id_);
            spdlog::debug("Container {} exited with {}", ShortId(id_), outcome.exit_code);
            return outcome;
        }

        auto pending = std::async(std::launch::async,
                                  [this]() { return client_.WaitContainer(id_); });
        if (pending.wait_for(*timeout) == std::future_status::timeout) {
            spdlog::warn("Container {} exceeded {}s, killing", ShortId(id_), timeout->count());
            outcome.timed_out = true;
            try {
                client_.KillContainer(id_);
            }
            catch (const std::exception& e) {
                spdlog::warn("Failed to kill container {}: {}", ShortId(id_), e.what());
            }
        }
        outcome.exit_code = pending.get();
        spdlog::debug("Container {} exited with {}", ShortId(id_), outcome.exit_code);
        return outcome;
    }

    /**
     * @brief Wait for the output stream to close, rethrowing reader errors
     */
    void JoinReader() {
        if (reader_.joinable()) {
            reader_.join();
        }
        if (reader_error_) {
            std::exception_ptr error = reader_error_;
            reader_error_ = nullptr;
            std::rethrow_exception(error);
        }
    }

    /**
     * @brief Stop the process and unblock the reader
     */
    void Abort() {
        try {
            client_.KillContainer(id_);
        }
        catch (const std::exception& e) {
            spdlog::warn("Failed to kill container {}: {}", ShortId(id_), e.what());
        }
        if (attach_) {
            attach_->Shutdown();
        }
    }

    void Cleanup() {
        if (cleaned_) {
            return;
        }
        cleaned_ = true;

        if (keep_) {
            spdlog::info("Keeping container {} ({})", label_, ShortId(id_));
            return;
        }

        try {
            client_.RemoveContainer(id_, true);
            spdlog::debug("Container {} removed", ShortId(id_));
        }
        catch (const std::exception& e) {
            spdlog::warn("Failed to remove container {}: {}", ShortId(id_), e.what());
        }
    }

private:
    DockerClient& client_;
    std::string id_;
    bool keep_;
    std::string label_;
    std::unique_ptr<AttachedStream> attach_;
    std::thread reader_;
    std::exception_ptr reader_error_;
    bool cleaned_{false};
};

// ============================================================================
// STREAMING EXECUTION
// ============================================================================

namespace {

class StreamingExecution : public core::ChunkStream {
public:
    StreamingExecution(std::unique_ptr<ContainerRun> run,
                       std::optional<std::chrono::seconds> timeout)
        : run_(std::move(run))
        , timeout_(timeout) {
        run_->Attach();
        run_->StartReader([this](core::OutputOrigin origin, std::string_view data) {
            bridge_.Push(core::OutputChunk{origin, std::string(data)});
        });
        run_->Start();

        // Waiting runs alongside consumption so output near exit is not lost
        waiter_ = std::thread([this]() {
            try {
                outcome_ = run_->Wait(timeout_);
                run_->JoinReader();
            }
            catch (...) {
                error_ = std::current_exception();
            }
            bridge_.Close();
        });
    }

    ~StreamingExecution() override {
        if (waiter_.joinable()) {
            if (!bridge_.IsClosed()) {
                spdlog::warn("Output stream of container {} abandoned before exit ({} chunks unread)",
                             ShortId(run_->Id()), bridge_.Pending());
                run_->Abort();
            }
            waiter_.join();
        }
    }

    std::optional<core::OutputChunk> Next() override {
        if (finished_) {
            return std::nullopt;
        }
        return bridge_.Next();
    }

    int Finish() override {
        if (finished_) {
            return outcome_.exit_code;
        }

        std::size_t discarded = 0;
        while (bridge_.Next()) {
            ++discarded;
        }
        if (discarded > 0) {
            spdlog::debug("Discarded {} unread output chunks", discarded);
        }

        waiter_.join();
        finished_ = true;
        run_->Cleanup();

        if (error_) {
            std::rethrow_exception(error_);
        }
        return outcome_.exit_code;
    }

    bool TimedOut() const override { return outcome_.timed_out; }

private:
    core::ChunkBridge<core::OutputChunk> bridge_;
    std::unique_ptr<ContainerRun> run_;
    std::optional<std::chrono::seconds> timeout_;
    WaitOutcome outcome_;
    std::exception_ptr error_;
    bool finished_{false};
    std::thread waiter_;
};

} // anonymous namespace

// ============================================================================
// CONTAINER MANAGER
// ============================================================================

ContainerManager::ContainerManager(std::filesystem::path socket_path)
    : client_(socket_path)
    , default_user_(DefaultUser(socket_path)) {
    spdlog::debug("Container manager initialized (user {})", default_user_);
}

ContainerManager::~ContainerManager() = default;

std::string ContainerManager::DefaultUser(const std::filesystem::path& socket_path) {
    std::string uid = std::to_string(CONTAINER_UID);
    struct stat info {};
    if (::stat(socket_path.c_str(), &info) != 0) {
        return uid + ":" + uid;
    }
    return uid + ":" + std::to_string(info.st_gid);
}

docker_schema::CreateContainer ContainerManager::BuildCreateRequest(
    const std::string& image,
    const std::vector<std::string>& command,
    const core::RunOptions& options,
    const std::string& default_user) {
    if (image.empty()) {
        throw std::invalid_argument("Image reference is empty");
    }
    if (command.empty()) {
        throw std::invalid_argument("Command is empty");
    }
    if (options.work_dir.empty()) {
        throw std::invalid_argument("Working directory is empty");
    }

    docker_schema::CreateContainer request;
    request.Image = image;
    request.Cmd = command;
    request.User = options.user.value_or(default_user);
    request.WorkingDir = options.work_dir.is_absolute()
        ? options.work_dir.string()
        : std::filesystem::absolute(options.work_dir).lexically_normal().string();

    for (const auto& mount : options.mounts) {
        std::error_code ec;
        if (!std::filesystem::exists(mount.host_path, ec)) {
            throw std::invalid_argument("Mount source does not exist: " + mount.host_path.string());
        }
        std::filesystem::path host = std::filesystem::absolute(mount.host_path).lexically_normal();
        request.Host.Binds.push_back(host.string() + ":" + mount.container_path.string() + ":" +
                                     (mount.read_only ? "ro" : "rw"));
    }

    for (const auto& [key, value] : options.env) {
        if (key.empty() || key.find('=') != std::string::npos) {
            throw std::invalid_argument("Invalid environment variable name: '" + key + "'");
        }
        request.Env.push_back(key + "=" + value);
    }

    request.Host.Privileged = options.privileged;
    request.Host.AutoRemove = false;  // removal happens after output is collected
    return request;
}

std::unique_ptr<ContainerRun> ContainerManager::Prepare(const std::string& image,
                                                        const std::vector<std::string>& command,
                                                        const core::RunOptions& options) {
    auto request = BuildCreateRequest(image, command, options, default_user_);

    std::string id = client_.CreateContainer(request, options.container_name);
    std::string label = options.container_name.value_or(ShortId(id));
    spdlog::debug("Container {} created from {}", label, image);

    auto run = std::make_unique<ContainerRun>(client_, id, options.keep_container, label);

    if (options.inject_file.has_value()) {
        std::filesystem::path target = options.inject_target.empty()
            ? std::filesystem::path(request.WorkingDir) / options.inject_file->filename()
            : options.inject_target;
        InjectFile(*run, *options.inject_file, target);
    }

    return run;
}

void ContainerManager::InjectFile(ContainerRun& run, const std::filesystem::path& host_file,
                                  const std::filesystem::path& target) {
    if (!target.is_absolute() || !target.has_filename()) {
        throw std::invalid_argument("Injection target must be an absolute file path: " +
                                    target.string());
    }

    ArchiveEntryOptions file_options;
    file_options.mode = 0600;
    file_options.uid = CONTAINER_UID;
    file_options.gid = CONTAINER_UID;

    ArchiveEntryOptions dir_options = file_options;
    dir_options.mode = 0755;

    // Find the deepest ancestor the image already has
    std::filesystem::path parent = target.parent_path();
    std::filesystem::path existing = parent;
    while (existing != existing.root_path() && !client_.PathExists(run.Id(), existing.string())) {
        existing = existing.parent_path();
    }

    std::string archive;
    if (existing == parent) {
        archive = ArchivePacker::PackFile(host_file, file_options, target.filename().string());
    } else {
        spdlog::debug("Creating {} inside container {}", parent.string(), ShortId(run.Id()));
        archive = ArchivePacker::PackFileWithParents(
            host_file, target.lexically_relative(existing), file_options, dir_options);
    }

    client_.PutArchive(run.Id(), existing.string(), archive);
    spdlog::debug("Injected {} into {} at {}", host_file.filename().string(),
                  ShortId(run.Id()), target.string());
}

core::ExecutionResult ContainerManager::RunCommand(const std::string& image,
                                                   const std::vector<std::string>& command,
                                                   const core::RunOptions& options) {
    // Declared before the run so that unwinding joins the reader before the
    // buffers it appends to are destroyed
    core::ExecutionResult result;
    auto run = Prepare(image, command, options);

    run->Attach();
    run->StartReader([&result](core::OutputOrigin origin, std::string_view data) {
        if (origin == core::OutputOrigin::STDOUT) {
            result.stdout_text.append(data.data(), data.size());
        } else {
            result.stderr_text.append(data.data(), data.size());
        }
    });
    run->Start();

    WaitOutcome outcome = run->Wait(options.timeout);
    run->JoinReader();
    run->Cleanup();

    result.exit_code = outcome.exit_code;
    result.timed_out = outcome.timed_out;
    return result;
}

std::unique_ptr<core::ChunkStream> ContainerManager::RunCommandStreaming(
    const std::string& image,
    const std::vector<std::string>& command,
    const core::RunOptions& options) {
    auto run = Prepare(image, command, options);
    return std::make_unique<StreamingExecution>(std::move(run), options.timeout);
}

bool ContainerManager::ImageExists(const std::string& image) {
    return client_.ImageExists(image);
}

void ContainerManager::PullImage(const std::string& image) {
    client_.PullImage(image, [](const std::string& line) {
        spdlog::trace("pull: {}", line);
    });
}

} // namespace docker
} // namespace noritest
