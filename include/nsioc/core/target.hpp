/**
 * @file target.hpp
 * @brief An acquired appliance filesystem opened for scanning
 *
 * A target is described on the command line as its root volume directory
 * optionally followed by further volumes and their mount points:
 *
 *     image/root,/var=image/var,/flash=image/flash
 *
 * @date 2025
 */

#pragma once

#include "nsioc/analyzers/host_fingerprint.hpp"
#include "nsioc/config/ioc_rules.hpp"
#include "nsioc/fs/mounted_filesystem.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace nsioc {
namespace core {

/**
 * @class TargetOpenError
 * @brief Target cannot be scanned at all (missing root, bad volume spec)
 */
class TargetOpenError : public std::runtime_error {
public:
    explicit TargetOpenError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct TargetError
 * @brief A target that could not be scanned, kept for the report
 */
struct TargetError {
    std::string target;     ///< Text as given on the command line
    std::string message;    ///< Why it could not be opened
};

/**
 * @struct TargetSpec
 * @brief Parsed `ROOT[,/mount=DIR...]` target description
 */
struct TargetSpec {
    std::string name;                   ///< Text as given on the command line
    std::vector<fs::Mount> mounts;      ///< Root volume first

    /**
     * @brief Parse a target description
     * @throws TargetOpenError on empty root, a volume without "=", or a
     *         mount point that is not absolute
     */
    static TargetSpec Parse(const std::string& text);
};

/**
 * @class Target
 * @brief Read-only filesystem of one appliance plus its fingerprint
 *
 * Owns the FileSystemView; move-only.
 */
class Target {
public:
    Target(std::string name, std::unique_ptr<fs::FileSystemView> view, analyzers::TargetInfo info);

    Target(Target&&) = default;
    Target& operator=(Target&&) = default;
    Target(const Target&) = delete;
    Target& operator=(const Target&) = delete;

    /**
     * @brief Validate volume directories, mount them and fingerprint the result
     * @param spec Parsed target description
     * @param rules Fingerprint locations
     * @param install_time_override Replaces the detected install time when set
     * @throws TargetOpenError if a volume directory is missing or not a directory
     */
    static Target Open(const TargetSpec& spec,
                       const config::FingerprintRules& rules,
                       std::optional<fs::Timestamp> install_time_override = std::nullopt);

    const std::string& Name() const { return name_; }
    const fs::FileSystemView& View() const { return *view_; }
    const analyzers::TargetInfo& Info() const { return info_; }

private:
    std::string name_;
    std::unique_ptr<fs::FileSystemView> view_;
    analyzers::TargetInfo info_;
};

} // namespace core
} // namespace nsioc
