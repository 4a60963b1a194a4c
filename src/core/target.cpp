/**
 * @file target.cpp
 * @brief Target description parsing and opening
 *
 * @date 2025
 */

#include "nsioc/core/target.hpp"
#include "nsioc/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace nsioc {
namespace core {

using utils::StringUtils;

TargetSpec TargetSpec::Parse(const std::string& text) {
    TargetSpec spec;
    spec.name = text;

    auto parts = StringUtils::Split(text, ',');
    if (parts.empty() || StringUtils::Trim(parts[0]).empty()) {
        throw TargetOpenError("Target '" + text + "' has no root directory");
    }

    spec.mounts.push_back({"/", StringUtils::Trim(parts[0])});

    for (std::size_t i = 1; i < parts.size(); ++i) {
        auto volume = StringUtils::Trim(parts[i]);
        auto eq = volume.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == volume.size()) {
            throw TargetOpenError("Invalid volume '" + volume + "' in target '" + text +
                                  "', expected /mountpoint=DIR");
        }

        auto mount_point = volume.substr(0, eq);
        try {
            mount_point = fs::NormalizePath(mount_point);
        } catch (const std::invalid_argument& e) {
            throw TargetOpenError("Invalid mount point in target '" + text + "': " + e.what());
        }
        if (mount_point == "/") {
            throw TargetOpenError("Target '" + text + "' mounts '/' twice");
        }

        spec.mounts.push_back({mount_point, volume.substr(eq + 1)});
    }

    return spec;
}

Target::Target(std::string name, std::unique_ptr<fs::FileSystemView> view, analyzers::TargetInfo info)
    : name_(std::move(name)),
      view_(std::move(view)),
      info_(std::move(info)) {
}

Target Target::Open(const TargetSpec& spec,
                    const config::FingerprintRules& rules,
                    std::optional<fs::Timestamp> install_time_override) {
    for (const auto& mount : spec.mounts) {
        std::error_code ec;
        if (!std::filesystem::is_directory(mount.host_root, ec)) {
            throw TargetOpenError("Volume for " + mount.virtual_prefix + " is not a directory: " +
                                  mount.host_root.string());
        }
    }

    std::unique_ptr<fs::FileSystemView> view;
    try {
        view = std::make_unique<fs::MountedFileSystem>(spec.mounts);
    } catch (const std::invalid_argument& e) {
        throw TargetOpenError("Cannot mount target '" + spec.name + "': " + e.what());
    }

    spdlog::info("Opened target {} ({} volume(s))", spec.name, spec.mounts.size());

    analyzers::HostFingerprint fingerprint(rules);
    auto info = fingerprint.Collect(*view, spec.name);
    if (install_time_override) {
        spdlog::debug("Install time overridden: {}", StringUtils::FormatTimestamp(*install_time_override));
        info.install_time = install_time_override;
    }

    return Target(spec.name, std::move(view), std::move(info));
}

} // namespace core
} // namespace nsioc
