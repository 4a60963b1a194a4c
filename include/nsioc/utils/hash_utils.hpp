/**
 * @file hash_utils.hpp
 * @brief SHA-256 hashing of evidence files
 *
 * Flagged files are hashed so the report can be correlated with threat
 * intelligence and so a later re-acquisition can be verified against it.
 *
 * @date 2025
 */

#pragma once

#include "nsioc/fs/filesystem_view.hpp"

#include <string>
#include <optional>

namespace nsioc {
namespace utils {

/**
 * @class HashUtils
 * @brief OpenSSL EVP backed digests
 *
 * **Thread Safety**: All methods are static and reentrant.
 *
 * **Usage Example**:
 * @code
 * auto digest = HashUtils::ComputeSHA256("hello");
 * auto evidence = HashUtils::HashEvidence(view, "/var/vpn/config.php", 64 * 1024 * 1024);
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of a buffer
     * @return 64 lowercase hex characters
     * @throws std::runtime_error if OpenSSL fails
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief SHA-256 of a regular file inside a target
     * @param view Target filesystem
     * @param path Virtual path
     * @param max_bytes Files larger than this are not hashed
     * @return std::nullopt if the file is not regular, too large or unreadable
     */
    static std::optional<std::string> HashEvidence(const fs::FileSystemView& view,
                                                   const std::string& path,
                                                   std::size_t max_bytes);
};

} // namespace utils
} // namespace nsioc
