/**
 * @file hash_utils.cpp
 * @brief Implementation of evidence hashing through the OpenSSL EVP interface
 *
 * **Output Format**: lowercase hexadecimal, the form used by VirusTotal,
 * MISP and STIX indicators.
 *
 * **Error Handling**:
 * - OpenSSL failures: std::runtime_error
 * - Missing, special, oversized or unreadable evidence: std::nullopt plus a log line
 *
 * @date 2025
 */

#include "nsioc/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace nsioc {
namespace utils {

namespace {

// ============================================================================
// INTERNAL HELPER FUNCTIONS
// ============================================================================

std::string BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

struct EvpContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // anonymous namespace

// ============================================================================
// DIGESTS
// ============================================================================

std::string HashUtils::ComputeSHA256(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, EvpContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &length) != 1) {
        throw std::runtime_error("SHA-256 computation failed");
    }

    return BinaryToHex(hash, length);
}

std::optional<std::string> HashUtils::HashEvidence(const fs::FileSystemView& view,
                                                   const std::string& path,
                                                   std::size_t max_bytes) {
    auto stat = view.Stat(path);
    if (!stat || !stat->IsRegular()) {
        spdlog::debug("Not hashing {}: not a regular file", path);
        return std::nullopt;
    }
    if (stat->size > max_bytes) {
        spdlog::warn("Not hashing {}: {} bytes exceeds evidence limit of {}", path, stat->size, max_bytes);
        return std::nullopt;
    }

    try {
        return ComputeSHA256(view.Read(path, max_bytes));
    } catch (const fs::NotReadableError& e) {
        spdlog::warn("Not hashing {}: {}", path, e.what());
        return std::nullopt;
    }
}

} // namespace utils
} // namespace nsioc
