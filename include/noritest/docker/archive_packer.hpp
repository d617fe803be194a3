/**
 * @file archive_packer.hpp
 * @brief In-memory tar archive builder for container file injection
 *
 * Produces POSIX ustar archives accepted by the engine's archive-write
 * interface (PUT /containers/{id}/archive). Used to place credential files
 * into a container after it is created and before it starts.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <memory>
#include <string>

struct archive;

namespace noritest {
namespace docker {

/**
 * @struct ArchiveEntryOptions
 * @brief Ownership and permission metadata for an archive entry
 */
struct ArchiveEntryOptions {
    std::uint32_t mode{0644};   ///< Permission bits
    std::uint32_t uid{0};       ///< Owner user id
    std::uint32_t gid{0};       ///< Owner group id
    std::time_t mtime{0};       ///< Modification time (0 = now)
};

/**
 * @class ArchivePacker
 * @brief Builds a tar archive in memory through libarchive
 *
 * Entries are appended in order. Finish() closes the archive, which writes
 * the end-of-archive marker the engine requires. No entry may be added
 * after Finish().
 *
 * **Usage Example**:
 * @code
 * ArchiveEntryOptions options;
 * options.mode = 0600;
 * options.uid = options.gid = 1000;
 *
 * std::string tar = ArchivePacker::PackFile("/home/me/.claude/.claude.json", options);
 * client.PutArchive(container_id, "/home/node", tar);
 * @endcode
 */
class ArchivePacker {
public:
    static constexpr std::size_t BLOCK_SIZE = 512;

    /**
     * @throws core::ArchiveError if the writer cannot be set up
     */
    ArchivePacker();
    ~ArchivePacker();

    ArchivePacker(const ArchivePacker&) = delete;
    ArchivePacker& operator=(const ArchivePacker&) = delete;

    /**
     * @brief Append a regular file entry
     * @param name Path inside the archive (relative, '/' separated)
     * @param contents File bytes
     * @throws core::ArchiveError if the entry cannot be recorded (for
     *         example a name too long for a ustar header)
     */
    void AddFile(const std::string& name, const std::string& contents,
                 const ArchiveEntryOptions& options = {});

    /**
     * @brief Append a directory entry
     */
    void AddDirectory(const std::string& name, const ArchiveEntryOptions& options = {});

    /**
     * @brief Close the archive and return its bytes
     */
    std::string Finish();

    std::size_t EntryCount() const { return entries_; }
    bool IsFinished() const { return finished_; }

    /**
     * @brief Pack one host file as a single entry
     * @param entry_name Name inside the archive (default: the host base name)
     * @throws core::ArchiveError if the file cannot be read
     */
    static std::string PackFile(const std::filesystem::path& host_file,
                                const ArchiveEntryOptions& options = {},
                                const std::string& entry_name = "");

    /**
     * @brief Pack one host file at a relative path, preceded by an entry
     *        for each of its parent directories
     *
     * Used when the target directory does not exist in the image.
     */
    static std::string PackFileWithParents(const std::filesystem::path& host_file,
                                           const std::filesystem::path& relative_path,
                                           const ArchiveEntryOptions& file_options,
                                           const ArchiveEntryOptions& dir_options);

    static std::string ReadHostFile(const std::filesystem::path& host_file);

private:
    struct WriterDeleter {
        void operator()(struct archive* writer) const;
    };

    void WriteEntry(const std::string& name, bool directory, const std::string& contents,
                    const ArchiveEntryOptions& options);
    void EnsureOpen() const;
    std::string LastError() const;

    std::string buffer_;  ///< Written to by writer_, so declared first
    std::unique_ptr<struct archive, WriterDeleter> writer_;
    std::size_t entries_{0};
    bool finished_{false};
};

} // namespace docker
} // namespace noritest
