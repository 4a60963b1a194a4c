/**
 * @file memory_filesystem.hpp
 * @brief In-memory FileSystemView for synthetic targets
 *
 * Lets callers assemble a target tree entry by entry (regular files,
 * directories, symlinks, device nodes) with explicit modes and timestamps,
 * without a disk image. Parent directories are created implicitly.
 *
 * @date 2025
 */

#pragma once

#include "nsioc/fs/filesystem_view.hpp"

#include <map>
#include <string>
#include <optional>

namespace nsioc {
namespace fs {

/**
 * @struct MemoryNode
 * @brief One entry of a MemoryFileSystem
 */
struct MemoryNode {
    FileStat stat;                  ///< Reported metadata
    std::string content;            ///< File content (regular files)
    bool content_readable{true};    ///< false makes Read() throw NotReadableError
    bool metadata_readable{true};   ///< false makes Stat() return nullopt
};

/**
 * @class MemoryFileSystem
 * @brief Mutable builder, read-only FileSystemView
 *
 * **Usage Example**:
 * @code
 * MemoryFileSystem fs;
 * fs.AddFile("/var/vpn/config.php", "<?php eval($_POST['x']); ?>", 0644);
 * fs.AddDirectory("/var/netscaler/logon");
 * fs.AddFile("/usr/bin/su", "", 04755);
 * @endcode
 */
class MemoryFileSystem : public FileSystemView {
public:
    MemoryFileSystem();

    /**
     * @brief Add (or replace) a regular file; size follows the content
     * @return Reference to the stored node for further adjustments
     */
    MemoryNode& AddFile(const std::string& path, const std::string& content,
                        std::uint32_t mode = 0644);

    /**
     * @brief Add a directory (no-op if it already exists)
     */
    MemoryNode& AddDirectory(const std::string& path, std::uint32_t mode = 0755);

    /**
     * @brief Add a symbolic link; the target is stored as content
     */
    MemoryNode& AddSymlink(const std::string& path, const std::string& target);

    /**
     * @brief Add a non-regular, non-directory entry (device node, fifo, socket)
     */
    MemoryNode& AddSpecial(const std::string& path, FileType type, std::uint32_t mode = 0600);

    /**
     * @brief Set timestamps of an existing entry (nullopt leaves the field unknown)
     * @throws std::out_of_range if the path was never added
     */
    void SetTimes(const std::string& path,
                  std::optional<Timestamp> mtime,
                  std::optional<Timestamp> ctime,
                  std::optional<Timestamp> btime);

    /**
     * @brief Mutable access to an existing node
     * @throws std::out_of_range if the path was never added
     */
    MemoryNode& Node(const std::string& path);

    bool Exists(const std::string& path) const override;
    std::optional<FileStat> Stat(const std::string& path) const override;
    std::vector<FileEntry> List(const std::string& path, bool recursive) const override;
    std::string Read(const std::string& path, std::size_t max_bytes) const override;

private:
    std::map<std::string, MemoryNode> nodes_;   ///< Keyed by normalised path

    MemoryNode& Insert(const std::string& path, MemoryNode node);
    void EnsureParents(const std::string& normalized_path);
};

} // namespace fs
} // namespace nsioc
