/**
 * @file mounted_filesystem.cpp
 * @brief Implementation of the host-directory backed FileSystemView
 *
 * **Resolution**:
 * ```
 * mounts: "/" -> /cases/ns01/root, "/var" -> /cases/ns01/var
 * "/var/vpn/index.php" -> /cases/ns01/var/vpn/index.php
 * "/etc/crontab"       -> /cases/ns01/root/etc/crontab
 * ```
 *
 * **Symlinks**: the host kernel only ever sees paths whose intermediate
 * components have been lstat'ed as directories. A link inside the image is
 * re-resolved against the virtual tree, never against the analysis host:
 * ```
 * /nsconfig -> /flash/nsconfig
 * "/nsconfig/ns.conf"  -> "/flash/nsconfig/ns.conf" -> <flash volume>/nsconfig/ns.conf
 * ```
 * The final component is never followed.
 *
 * **Metadata**: statx(2) with AT_SYMLINK_NOFOLLOW, falling back to lstat(2)
 * where the kernel does not provide statx. Birth time is only reported when
 * STATX_BTIME comes back in the result mask. Times that do not fit the
 * nanosecond Timestamp (before 1677, after 2262) are dropped and flagged.
 *
 * @date 2025
 */

#include "nsioc/fs/mounted_filesystem.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace nsioc {
namespace fs {

namespace {

constexpr int kMaxSymlinkHops = 32;

// Bounds in whole seconds, one second inside the limits to leave room for the fraction
constexpr std::int64_t kMaxTimestampSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(Timestamp::duration::max()).count() - 1;
constexpr std::int64_t kMinTimestampSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(Timestamp::duration::min()).count() + 1;

std::optional<Timestamp> ToTimestamp(std::int64_t seconds, std::int64_t nanoseconds, FileStat& stat) {
    if (seconds > kMaxTimestampSeconds || seconds < kMinTimestampSeconds) {
        stat.time_out_of_range = true;
        return std::nullopt;
    }
    auto since_epoch = std::chrono::duration_cast<Timestamp::duration>(std::chrono::seconds(seconds)) +
                       std::chrono::duration_cast<Timestamp::duration>(std::chrono::nanoseconds(nanoseconds));
    return Timestamp(since_epoch);
}

// Components of an image path, with "." dropped and ".." clamped at the root
std::vector<std::string> SplitComponents(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream stream(path);
    std::string part;
    while (std::getline(stream, part, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (!parts.empty()) {
                parts.pop_back();
            }
            continue;
        }
        parts.push_back(part);
    }
    return parts;
}

FileType ModeToType(mode_t mode) {
    if (S_ISREG(mode)) return FileType::REGULAR;
    if (S_ISDIR(mode)) return FileType::DIRECTORY;
    if (S_ISLNK(mode)) return FileType::SYMLINK;
    if (S_ISCHR(mode)) return FileType::CHARACTER_DEVICE;
    if (S_ISBLK(mode)) return FileType::BLOCK_DEVICE;
    if (S_ISFIFO(mode)) return FileType::FIFO;
    if (S_ISSOCK(mode)) return FileType::SOCKET;
    return FileType::UNKNOWN;
}

std::optional<FileStat> LstatHostPath(const std::filesystem::path& host_path) {
    struct stat st{};
    if (lstat(host_path.c_str(), &st) != 0) {
        return std::nullopt;
    }

    FileStat result;
    result.type = ModeToType(st.st_mode);
    result.mode = static_cast<std::uint32_t>(st.st_mode & 07777);
    result.size = static_cast<std::uint64_t>(st.st_size);
    result.mtime = ToTimestamp(st.st_mtim.tv_sec, st.st_mtim.tv_nsec, result);
    result.ctime = ToTimestamp(st.st_ctim.tv_sec, st.st_ctim.tv_nsec, result);
    return result;
}

} // anonymous namespace

// ============================================================================
// HOST METADATA
// ============================================================================

std::optional<FileStat> StatHostPath(const std::filesystem::path& host_path) {
    struct statx stx{};
    unsigned int mask = STATX_BASIC_STATS | STATX_BTIME;
    if (statx(AT_FDCWD, host_path.c_str(), AT_SYMLINK_NOFOLLOW, mask, &stx) != 0) {
        if (errno == ENOSYS) {
            return LstatHostPath(host_path);
        }
        return std::nullopt;
    }

    FileStat result;
    result.type = ModeToType(stx.stx_mode);
    result.mode = static_cast<std::uint32_t>(stx.stx_mode & 07777);
    result.size = stx.stx_size;

    if (stx.stx_mask & STATX_MTIME) {
        result.mtime = ToTimestamp(stx.stx_mtime.tv_sec, stx.stx_mtime.tv_nsec, result);
    }
    if (stx.stx_mask & STATX_CTIME) {
        result.ctime = ToTimestamp(stx.stx_ctime.tv_sec, stx.stx_ctime.tv_nsec, result);
    }
    if (stx.stx_mask & STATX_BTIME) {
        result.btime = ToTimestamp(stx.stx_btime.tv_sec, stx.stx_btime.tv_nsec, result);
    }
    return result;
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

MountedFileSystem::MountedFileSystem(std::vector<Mount> mounts)
    : mounts_(std::move(mounts)) {
    bool has_root = false;
    for (auto& mount : mounts_) {
        mount.virtual_prefix = NormalizePath(mount.virtual_prefix);
        // Host side of the table is trusted; resolve it once so lstat never sees a link there
        std::error_code ec;
        auto canonical = std::filesystem::canonical(mount.host_root, ec);
        if (!ec) {
            mount.host_root = canonical;
        }
        if (mount.virtual_prefix == "/") {
            has_root = true;
        }
    }
    if (!has_root) {
        throw std::invalid_argument("Mount table has no entry for '/'");
    }

    // Longest prefix first so Resolve() can stop at the first match
    std::stable_sort(mounts_.begin(), mounts_.end(), [](const Mount& a, const Mount& b) {
        return a.virtual_prefix.size() > b.virtual_prefix.size();
    });

    for (const auto& mount : mounts_) {
        spdlog::debug("Mounted {} -> {}", mount.virtual_prefix, mount.host_root.string());
    }
}

// ============================================================================
// PATH RESOLUTION
// ============================================================================

std::filesystem::path MountedFileSystem::Resolve(const std::string& canonical_path) const {
    for (const auto& mount : mounts_) {
        if (!IsWithin(canonical_path, mount.virtual_prefix)) {
            continue;
        }
        std::string relative = canonical_path.substr(mount.virtual_prefix.size());
        while (!relative.empty() && relative.front() == '/') {
            relative.erase(0, 1);
        }
        return relative.empty() ? mount.host_root : mount.host_root / relative;
    }
    // Unreachable: the constructor guarantees a "/" mount
    return mounts_.back().host_root;
}

std::optional<std::string> MountedFileSystem::CanonicalPath(const std::string& normalized_path) const {
    auto pending = SplitComponents(normalized_path);
    std::string current = "/";
    std::size_t index = 0;
    int hops = 0;

    // Every component but the last must be a real directory (or a synthetic mount parent)
    while (index + 1 < pending.size()) {
        auto candidate = JoinPath(current, pending[index]);
        auto host_path = Resolve(candidate);
        auto stat = StatHostPath(host_path);

        if (stat && stat->type == FileType::SYMLINK) {
            if (++hops > kMaxSymlinkHops) {
                spdlog::debug("Too many levels of symbolic links resolving {}", normalized_path);
                return std::nullopt;
            }
            std::error_code ec;
            auto target = std::filesystem::read_symlink(host_path, ec);
            if (ec) {
                spdlog::debug("Cannot read link {}: {}", candidate, ec.message());
                return std::nullopt;
            }

            // Absolute targets restart at the image root, relative ones at the link's directory
            std::string rewritten = target.is_absolute() ? target.string() : current + "/" + target.string();
            for (std::size_t i = index + 1; i < pending.size(); ++i) {
                rewritten += "/" + pending[i];
            }
            spdlog::debug("Following link {} -> {} inside the target", candidate, target.string());

            pending = SplitComponents(rewritten);
            current = "/";
            index = 0;
            continue;
        }

        if (stat ? !stat->IsDirectory() : !HasMountBelow(candidate)) {
            return std::nullopt;
        }
        current = candidate;
        ++index;
    }

    return pending.empty() ? current : JoinPath(current, pending.back());
}

bool MountedFileSystem::HasMountBelow(const std::string& normalized_path) const {
    for (const auto& mount : mounts_) {
        if (mount.virtual_prefix != normalized_path && IsWithin(mount.virtual_prefix, normalized_path)) {
            return true;
        }
    }
    return false;
}

std::optional<FileStat> MountedFileSystem::StatCanonical(const std::string& canonical_path) const {
    auto result = StatHostPath(Resolve(canonical_path));
    if (!result && HasMountBelow(canonical_path)) {
        FileStat synthetic;
        synthetic.type = FileType::DIRECTORY;
        synthetic.mode = 0755;
        return synthetic;
    }
    return result;
}

// ============================================================================
// FILESYSTEMVIEW INTERFACE
// ============================================================================

bool MountedFileSystem::Exists(const std::string& path) const {
    auto canonical = CanonicalPath(NormalizePath(path));
    if (!canonical) {
        return false;
    }
    std::error_code ec;
    auto status = std::filesystem::symlink_status(Resolve(*canonical), ec);
    if (!ec && status.type() != std::filesystem::file_type::not_found) {
        return true;
    }
    // Intermediate directory of a deeper mount ("/var" when only "/var/netscaler" is mounted)
    return HasMountBelow(*canonical);
}

std::optional<FileStat> MountedFileSystem::Stat(const std::string& path) const {
    auto canonical = CanonicalPath(NormalizePath(path));
    if (!canonical) {
        return std::nullopt;
    }
    return StatCanonical(*canonical);
}

std::vector<std::string> MountedFileSystem::ListNames(const std::string& normalized_path) const {
    std::set<std::string> names;

    std::error_code ec;
    std::filesystem::directory_iterator it(Resolve(normalized_path), ec);
    if (ec) {
        spdlog::debug("Cannot list {}: {}", normalized_path, ec.message());
    } else {
        const std::filesystem::directory_iterator end;
        while (it != end) {
            names.insert(it->path().filename().string());
            it.increment(ec);
            if (ec) {
                spdlog::debug("Listing of {} ended early: {}", normalized_path, ec.message());
                break;
            }
        }
    }

    // Mount points directly below this directory
    for (const auto& mount : mounts_) {
        if (mount.virtual_prefix == normalized_path || !IsWithin(mount.virtual_prefix, normalized_path)) {
            continue;
        }
        std::string rest = mount.virtual_prefix.substr(normalized_path == "/" ? 1 : normalized_path.size() + 1);
        names.insert(rest.substr(0, rest.find('/')));
    }

    return {names.begin(), names.end()};
}

std::vector<FileEntry> MountedFileSystem::List(const std::string& path, bool recursive) const {
    std::vector<FileEntry> entries;

    auto root = NormalizePath(path);
    auto canonical_root = CanonicalPath(root);
    if (!canonical_root) {
        return entries;
    }
    auto root_stat = StatCanonical(*canonical_root);
    if (!root_stat || !root_stat->IsDirectory()) {
        return entries;
    }

    // Reported paths stay under the requested root; host access goes through the canonical twin.
    // Explicit stack instead of recursion; deep trees come from untrusted images
    std::vector<std::pair<std::string, std::string>> pending{{root, *canonical_root}};
    while (!pending.empty()) {
        auto directory = pending.back();
        pending.pop_back();

        std::vector<std::pair<std::string, std::string>> subdirectories;
        for (const auto& name : ListNames(directory.second)) {
            auto child = JoinPath(directory.first, name);
            auto canonical_child = JoinPath(directory.second, name);
            auto stat = StatCanonical(canonical_child);
            if (!stat) {
                spdlog::debug("Skipping unreadable entry: {}", child);
                continue;
            }
            entries.push_back({child, *stat});
            if (recursive && stat->IsDirectory()) {
                subdirectories.emplace_back(child, canonical_child);
            }
        }

        pending.insert(pending.end(), subdirectories.begin(), subdirectories.end());
    }

    // Lexicographic path order, the same order MemoryFileSystem produces
    std::sort(entries.begin(), entries.end(), [](const FileEntry& a, const FileEntry& b) {
        return a.path < b.path;
    });
    return entries;
}

std::string MountedFileSystem::Read(const std::string& path, std::size_t max_bytes) const {
    auto normalized = NormalizePath(path);
    auto canonical = CanonicalPath(normalized);
    if (!canonical) {
        throw NotReadableError(normalized, "path does not resolve inside the target");
    }
    auto host_path = Resolve(*canonical);

    auto stat = StatHostPath(host_path);
    if (!stat) {
        throw NotReadableError(normalized, "cannot stat");
    }
    if (!stat->IsRegular()) {
        throw NotReadableError(normalized, "not a regular file");
    }

    std::ifstream file(host_path, std::ios::binary);
    if (!file.is_open()) {
        throw NotReadableError(normalized, "cannot open");
    }

    std::string buffer(static_cast<std::size_t>(std::min<std::uint64_t>(stat->size, max_bytes)), '\0');
    file.read(&buffer[0], static_cast<std::streamsize>(buffer.size()));
    if (file.bad()) {
        throw NotReadableError(normalized, "read error");
    }
    buffer.resize(static_cast<std::size_t>(file.gcount()));
    return buffer;
}

} // namespace fs
} // namespace nsioc
