/**
 * @file filesystem_view.hpp
 * @brief Read-only view over a reconstructed appliance filesystem
 *
 * Defines the capability interface every IOC check reads through. The view
 * exposes path enumeration, per-entry metadata with optional timestamps, and
 * bounded content reads. Implementations never write to the underlying image.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>
#include <stdexcept>

namespace nsioc {
namespace fs {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @enum FileType
 * @brief Type of a filesystem entry as reported by lstat
 */
enum class FileType {
    REGULAR,            ///< Regular file
    DIRECTORY,          ///< Directory
    SYMLINK,            ///< Symbolic link (never followed)
    CHARACTER_DEVICE,   ///< Character device node
    BLOCK_DEVICE,       ///< Block device node
    FIFO,               ///< Named pipe
    SOCKET,             ///< UNIX domain socket
    UNKNOWN             ///< Anything else
};

/**
 * @struct FileStat
 * @brief Metadata of a single entry
 *
 * Timestamps are optional because not every reconstructed filesystem keeps
 * all of them. A missing field means "unknown", never "zero".
 */
struct FileStat {
    FileType type{FileType::UNKNOWN};   ///< Entry type
    std::uint32_t mode{0};              ///< Permission and special bits (st_mode & 07777)
    std::uint64_t size{0};              ///< Size in bytes
    std::optional<Timestamp> mtime;     ///< Content modification time
    std::optional<Timestamp> ctime;     ///< Inode change time
    std::optional<Timestamp> btime;     ///< Birth (creation) time
    bool time_out_of_range{false};      ///< A recorded timestamp did not fit Timestamp and was dropped

    bool IsRegular() const { return type == FileType::REGULAR; }
    bool IsDirectory() const { return type == FileType::DIRECTORY; }
};

/**
 * @struct FileEntry
 * @brief A path inside the target together with its metadata
 */
struct FileEntry {
    std::string path;   ///< Absolute virtual path ("/var/vpn/index.php")
    FileStat stat;      ///< Metadata at enumeration time
};

/**
 * @class NotReadableError
 * @brief Content or metadata of a specific entry cannot be retrieved
 *
 * Raised by Read() for special files, directories, missing entries and I/O
 * failures. Checks catch it per entry and continue.
 */
class NotReadableError : public std::runtime_error {
public:
    explicit NotReadableError(const std::string& path, const std::string& reason)
        : std::runtime_error("Not readable: " + path + " (" + reason + ")")
        , path_(path) {}

    const std::string& Path() const { return path_; }

private:
    std::string path_;
};

/**
 * @class FileSystemView
 * @brief Abstract read-only accessor over an acquired image
 *
 * All paths are absolute POSIX-style virtual paths rooted at the target's
 * "/". Implementations must return listings in a deterministic order so that
 * reports are reproducible across runs.
 *
 * **Usage Example**:
 * @code
 * MountedFileSystem view({{"/", "/cases/ns01/root"}, {"/var", "/cases/ns01/var"}});
 * if (view.Exists("/var/vpn")) {
 *     for (const auto& entry : view.List("/var/vpn", true)) {
 *         if (entry.stat.IsRegular()) {
 *             auto head = view.Read(entry.path, 2048);
 *         }
 *     }
 * }
 * @endcode
 */
class FileSystemView {
public:
    virtual ~FileSystemView() = default;

    /**
     * @brief Check whether a path exists (symlinks count, dangling or not)
     */
    virtual bool Exists(const std::string& path) const = 0;

    /**
     * @brief Retrieve metadata without following symlinks
     * @return Metadata, or std::nullopt if missing or unreadable
     */
    virtual std::optional<FileStat> Stat(const std::string& path) const = 0;

    /**
     * @brief Enumerate the children of a directory
     *
     * @param path Directory to list
     * @param recursive Descend into subdirectories (symlinked directories are
     *        reported but not entered)
     * @return Entries sorted lexicographically by path. Empty if the path is
     *         missing or not a directory. Unreadable subdirectories are
     *         skipped.
     */
    virtual std::vector<FileEntry> List(const std::string& path, bool recursive) const = 0;

    /**
     * @brief Read at most max_bytes of a regular file
     * @throws NotReadableError if the entry is not a readable regular file
     */
    virtual std::string Read(const std::string& path, std::size_t max_bytes) const = 0;
};

/***************************************************************************
 * Virtual path helpers
 ***************************************************************************/

/**
 * @brief Normalise a virtual path: collapse "//" and ".", strip trailing "/"
 * @throws std::invalid_argument if the path is relative or contains ".."
 */
std::string NormalizePath(const std::string& path);

/**
 * @brief Parent of a normalised virtual path ("/" for top-level entries)
 */
std::string ParentPath(const std::string& path);

/**
 * @brief Join a directory and a child name
 */
std::string JoinPath(const std::string& directory, const std::string& name);

/**
 * @brief True if path equals prefix or lies below it
 */
bool IsWithin(const std::string& path, const std::string& prefix);

} // namespace fs
} // namespace nsioc
