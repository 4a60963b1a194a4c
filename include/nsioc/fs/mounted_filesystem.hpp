/**
 * @file mounted_filesystem.hpp
 * @brief FileSystemView backed by reconstructed volumes on the analysis host
 *
 * NetScaler appliances split their state across a volatile root disk and
 * persistent volumes (/var, /flash). After reconstruction each volume lives
 * in its own host directory; MountedFileSystem stitches them back into a
 * single virtual tree using a mount table.
 *
 * @date 2025
 */

#pragma once

#include "nsioc/fs/filesystem_view.hpp"

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace nsioc {
namespace fs {

/**
 * @struct Mount
 * @brief One volume of the target mapped into the virtual tree
 */
struct Mount {
    std::string virtual_prefix;         ///< Where the volume appears ("/", "/var")
    std::filesystem::path host_root;    ///< Host directory holding the volume contents
};

/**
 * @class MountedFileSystem
 * @brief Read-only view over host directories
 *
 * Path resolution picks the mount with the longest matching prefix. A mount
 * point is listed as a directory of its parent even if the parent volume
 * does not contain that directory (a data disk acquired without its root).
 *
 * Metadata comes from statx(2) so that birth time is available wherever the
 * host filesystem records it; lstat semantics throughout. Symlinks in
 * intermediate components are resolved inside the virtual tree (absolute
 * targets against the image root), so no lookup ever leaves the mounted
 * volumes.
 *
 * **Thread Safety**: All methods are const and reentrant.
 */
class MountedFileSystem : public FileSystemView {
public:
    /**
     * @brief Construct from a mount table
     * @throws std::invalid_argument if no mount covers "/" or a prefix is invalid
     */
    explicit MountedFileSystem(std::vector<Mount> mounts);

    bool Exists(const std::string& path) const override;
    std::optional<FileStat> Stat(const std::string& path) const override;
    std::vector<FileEntry> List(const std::string& path, bool recursive) const override;
    std::string Read(const std::string& path, std::size_t max_bytes) const override;

    const std::vector<Mount>& GetMounts() const { return mounts_; }

private:
    std::vector<Mount> mounts_;   ///< Sorted by prefix length, longest first

    /// Host path of a canonical virtual path (no symlinks before the last component)
    std::filesystem::path Resolve(const std::string& canonical_path) const;

    /**
     * @brief Rewrite a path so that only its last component may be a symlink
     * @return std::nullopt if an intermediate component is missing, not a
     *         directory, or the links nest deeper than 32 levels
     */
    std::optional<std::string> CanonicalPath(const std::string& normalized_path) const;

    std::optional<FileStat> StatCanonical(const std::string& canonical_path) const;
    bool HasMountBelow(const std::string& normalized_path) const;
    std::vector<std::string> ListNames(const std::string& normalized_path) const;
};

/**
 * @brief Read host metadata with lstat semantics
 * @return std::nullopt if the entry cannot be stat'ed
 */
std::optional<FileStat> StatHostPath(const std::filesystem::path& host_path);

} // namespace fs
} // namespace nsioc
