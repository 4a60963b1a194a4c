/**
 * @file memory_filesystem.cpp
 * @brief Implementation of the in-memory FileSystemView
 *
 * @date 2025
 */

#include "nsioc/fs/memory_filesystem.hpp"

#include <algorithm>

namespace nsioc {
namespace fs {

MemoryFileSystem::MemoryFileSystem() {
    MemoryNode root;
    root.stat.type = FileType::DIRECTORY;
    root.stat.mode = 0755;
    nodes_.emplace("/", root);
}

// ============================================================================
// BUILDER
// ============================================================================

MemoryNode& MemoryFileSystem::AddFile(const std::string& path, const std::string& content,
                                      std::uint32_t mode) {
    MemoryNode node;
    node.stat.type = FileType::REGULAR;
    node.stat.mode = mode & 07777;
    node.stat.size = content.size();
    node.content = content;
    return Insert(path, std::move(node));
}

MemoryNode& MemoryFileSystem::AddDirectory(const std::string& path, std::uint32_t mode) {
    auto normalized = NormalizePath(path);
    auto it = nodes_.find(normalized);
    if (it != nodes_.end() && it->second.stat.IsDirectory()) {
        return it->second;
    }
    MemoryNode node;
    node.stat.type = FileType::DIRECTORY;
    node.stat.mode = mode & 07777;
    return Insert(normalized, std::move(node));
}

MemoryNode& MemoryFileSystem::AddSymlink(const std::string& path, const std::string& target) {
    MemoryNode node;
    node.stat.type = FileType::SYMLINK;
    node.stat.mode = 0777;
    node.stat.size = target.size();
    node.content = target;
    return Insert(path, std::move(node));
}

MemoryNode& MemoryFileSystem::AddSpecial(const std::string& path, FileType type, std::uint32_t mode) {
    if (type == FileType::REGULAR || type == FileType::DIRECTORY) {
        throw std::invalid_argument("AddSpecial() expects a non-regular, non-directory type");
    }
    MemoryNode node;
    node.stat.type = type;
    node.stat.mode = mode & 07777;
    return Insert(path, std::move(node));
}

void MemoryFileSystem::SetTimes(const std::string& path,
                                std::optional<Timestamp> mtime,
                                std::optional<Timestamp> ctime,
                                std::optional<Timestamp> btime) {
    auto& node = Node(path);
    node.stat.mtime = mtime;
    node.stat.ctime = ctime;
    node.stat.btime = btime;
}

MemoryNode& MemoryFileSystem::Node(const std::string& path) {
    return nodes_.at(NormalizePath(path));
}

MemoryNode& MemoryFileSystem::Insert(const std::string& path, MemoryNode node) {
    auto normalized = NormalizePath(path);
    EnsureParents(normalized);
    auto& slot = nodes_[normalized];
    slot = std::move(node);
    return slot;
}

void MemoryFileSystem::EnsureParents(const std::string& normalized_path) {
    auto parent = ParentPath(normalized_path);
    while (parent != "/" && nodes_.find(parent) == nodes_.end()) {
        MemoryNode directory;
        directory.stat.type = FileType::DIRECTORY;
        directory.stat.mode = 0755;
        nodes_.emplace(parent, directory);
        parent = ParentPath(parent);
    }
}

// ============================================================================
// FILESYSTEMVIEW INTERFACE
// ============================================================================

bool MemoryFileSystem::Exists(const std::string& path) const {
    return nodes_.count(NormalizePath(path)) > 0;
}

std::optional<FileStat> MemoryFileSystem::Stat(const std::string& path) const {
    auto it = nodes_.find(NormalizePath(path));
    if (it == nodes_.end() || !it->second.metadata_readable) {
        return std::nullopt;
    }
    return it->second.stat;
}

std::vector<FileEntry> MemoryFileSystem::List(const std::string& path, bool recursive) const {
    std::vector<FileEntry> entries;

    auto directory = NormalizePath(path);
    auto self = nodes_.find(directory);
    if (self == nodes_.end() || !self->second.stat.IsDirectory() || !self->second.metadata_readable) {
        return entries;
    }

    // Subtrees below an unreadable directory are not reachable
    std::vector<std::string> blocked;
    auto is_blocked = [&blocked](const std::string& candidate) {
        return std::any_of(blocked.begin(), blocked.end(), [&candidate](const std::string& b) {
            return IsWithin(candidate, b);
        });
    };

    for (auto it = nodes_.upper_bound(directory); it != nodes_.end(); ++it) {
        const auto& [node_path, node] = *it;
        if (!IsWithin(node_path, directory)) {
            // std::map order keeps siblings like "/a-b" between "/a" and "/a/x"
            if (node_path.compare(0, directory.size(), directory) == 0) {
                continue;
            }
            break;
        }
        if (!recursive && ParentPath(node_path) != directory) {
            continue;
        }
        if (is_blocked(node_path)) {
            continue;
        }
        if (!node.metadata_readable) {
            blocked.push_back(node_path);
            continue;
        }
        entries.push_back({node_path, node.stat});
    }
    return entries;
}

std::string MemoryFileSystem::Read(const std::string& path, std::size_t max_bytes) const {
    auto normalized = NormalizePath(path);
    auto it = nodes_.find(normalized);
    if (it == nodes_.end()) {
        throw NotReadableError(normalized, "no such file");
    }
    const auto& node = it->second;
    if (!node.stat.IsRegular()) {
        throw NotReadableError(normalized, "not a regular file");
    }
    if (!node.content_readable || !node.metadata_readable) {
        throw NotReadableError(normalized, "permission denied");
    }
    return node.content.substr(0, std::min(max_bytes, node.content.size()));
}

} // namespace fs
} // namespace nsioc
