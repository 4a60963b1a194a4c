/**
 * @file filesystem_view.cpp
 * @brief Virtual path helpers shared by all FileSystemView implementations
 *
 * Virtual paths are always absolute, "/"-separated and free of "." and ".."
 * components. Host path resolution is left to the concrete views.
 *
 * @date 2025
 */

#include "nsioc/fs/filesystem_view.hpp"

#include <sstream>
#include <vector>

namespace nsioc {
namespace fs {

std::string NormalizePath(const std::string& path) {
    if (path.empty() || path.front() != '/') {
        throw std::invalid_argument("Virtual path must be absolute: '" + path + "'");
    }

    std::vector<std::string> parts;
    std::stringstream stream(path);
    std::string part;
    while (std::getline(stream, part, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            throw std::invalid_argument("Virtual path must not contain '..': '" + path + "'");
        }
        parts.push_back(part);
    }

    if (parts.empty()) {
        return "/";
    }

    std::string normalized;
    for (const auto& p : parts) {
        normalized += "/";
        normalized += p;
    }
    return normalized;
}

std::string ParentPath(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

std::string JoinPath(const std::string& directory, const std::string& name) {
    if (directory.empty() || directory == "/") {
        return "/" + name;
    }
    if (directory.back() == '/') {
        return directory + name;
    }
    return directory + "/" + name;
}

bool IsWithin(const std::string& path, const std::string& prefix) {
    if (prefix == "/") {
        return !path.empty() && path.front() == '/';
    }
    if (path.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

} // namespace fs
} // namespace nsioc
