/**
 * @file archive_packer.cpp
 * @brief Implementation of the in-memory tar writer
 *
 * libarchive writes through a callback that appends to a growable string,
 * so no output size has to be guessed up front. The last block is not
 * padded beyond the 512-byte record, keeping injected archives small.
 *
 * @date 2025
 */

#include "noritest/docker/archive_packer.hpp"
#include "noritest/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <archive.h>
#include <archive_entry.h>

#include <fstream>
#include <sstream>

namespace noritest {
namespace docker {

namespace {

la_ssize_t AppendToBuffer(struct archive*, void* client_data, const void* data, size_t length) {
    auto* buffer = static_cast<std::string*>(client_data);
    buffer->append(static_cast<const char*>(data), length);
    return static_cast<la_ssize_t>(length);
}

struct EntryDeleter {
    void operator()(struct archive_entry* entry) const { archive_entry_free(entry); }
};

} // anonymous namespace

void ArchivePacker::WriterDeleter::operator()(struct archive* writer) const {
    archive_write_free(writer);
}

ArchivePacker::ArchivePacker()
    : writer_(archive_write_new()) {
    if (!writer_) {
        throw core::ArchiveError("archive_write_new failed");
    }

    if (archive_write_set_format_ustar(writer_.get()) != ARCHIVE_OK ||
        archive_write_set_bytes_in_last_block(writer_.get(), 1) != ARCHIVE_OK) {
        throw core::ArchiveError("cannot configure tar writer: " + LastError());
    }

    if (archive_write_open(writer_.get(), &buffer_, nullptr, AppendToBuffer, nullptr) != ARCHIVE_OK) {
        throw core::ArchiveError("archive_write_open failed: " + LastError());
    }
}

ArchivePacker::~ArchivePacker() = default;

std::string ArchivePacker::LastError() const {
    const char* message = archive_error_string(writer_.get());
    return message != nullptr ? message : "unknown error";
}

void ArchivePacker::EnsureOpen() const {
    if (finished_) {
        throw core::ArchiveError("archive already finalized");
    }
}

void ArchivePacker::WriteEntry(const std::string& name, bool directory,
                               const std::string& contents, const ArchiveEntryOptions& options) {
    EnsureOpen();
    if (name.empty()) {
        throw core::ArchiveError("entry name is empty");
    }

    std::unique_ptr<struct archive_entry, EntryDeleter> entry(archive_entry_new());
    if (!entry) {
        throw core::ArchiveError("archive_entry_new failed");
    }

    std::time_t mtime = options.mtime != 0 ? options.mtime : std::time(nullptr);

    archive_entry_set_pathname(entry.get(), name.c_str());
    archive_entry_set_filetype(entry.get(), directory ? AE_IFDIR : AE_IFREG);
    archive_entry_set_perm(entry.get(), options.mode & 07777);
    archive_entry_set_uid(entry.get(), options.uid);
    archive_entry_set_gid(entry.get(), options.gid);
    archive_entry_set_mtime(entry.get(), mtime, 0);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(contents.size()));

    if (archive_write_header(writer_.get(), entry.get()) != ARCHIVE_OK) {
        throw core::ArchiveError("cannot add " + name + ": " + LastError());
    }

    const char* data = contents.data();
    std::size_t remaining = contents.size();
    while (remaining > 0) {
        la_ssize_t written = archive_write_data(writer_.get(), data, remaining);
        if (written <= 0) {
            throw core::ArchiveError("cannot write " + name + ": " + LastError());
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }

    ++entries_;
}

void ArchivePacker::AddFile(const std::string& name, const std::string& contents,
                            const ArchiveEntryOptions& options) {
    WriteEntry(name, false, contents, options);
}

void ArchivePacker::AddDirectory(const std::string& name, const ArchiveEntryOptions& options) {
    std::string dir_name = name;
    if (!dir_name.empty() && dir_name.back() != '/') {
        dir_name += '/';
    }
    WriteEntry(dir_name, true, "", options);
}

std::string ArchivePacker::Finish() {
    EnsureOpen();
    if (archive_write_close(writer_.get()) != ARCHIVE_OK) {
        throw core::ArchiveError("archive_write_close failed: " + LastError());
    }
    finished_ = true;
    return std::move(buffer_);
}

std::string ArchivePacker::ReadHostFile(const std::filesystem::path& host_file) {
    std::ifstream file(host_file, std::ios::binary);
    if (!file) {
        throw core::ArchiveError("cannot read " + host_file.string());
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw core::ArchiveError("read failed for " + host_file.string());
    }
    return contents.str();
}

std::string ArchivePacker::PackFile(const std::filesystem::path& host_file,
                                    const ArchiveEntryOptions& options,
                                    const std::string& entry_name) {
    std::string contents = ReadHostFile(host_file);
    std::string name = entry_name.empty() ? host_file.filename().string() : entry_name;

    ArchivePacker packer;
    packer.AddFile(name, contents, options);
    spdlog::debug("Packed {} as {} ({} bytes)", host_file.string(), name, contents.size());
    return packer.Finish();
}

std::string ArchivePacker::PackFileWithParents(const std::filesystem::path& host_file,
                                               const std::filesystem::path& relative_path,
                                               const ArchiveEntryOptions& file_options,
                                               const ArchiveEntryOptions& dir_options) {
    std::string contents = ReadHostFile(host_file);
    std::filesystem::path relative = relative_path.relative_path();

    ArchivePacker packer;
    std::filesystem::path parent;
    for (const auto& part : relative.parent_path()) {
        parent /= part;
        packer.AddDirectory(parent.generic_string(), dir_options);
    }
    packer.AddFile(relative.generic_string(), contents, file_options);
    return packer.Finish();
}

} // namespace docker
} // namespace noritest
