/**
 * @file host_fingerprint.cpp
 * @brief Implementation of target fingerprinting
 *
 * **ns.conf Excerpt**:
 * ```
 * #NS13.1 Build 49.15
 * # Last modified by `save config`, Tue Sep 26 10:12:04 2023
 * set ns config -IPAddress 10.0.0.10 -netmask 255.255.255.0
 * set ns hostName adc-prod-01
 * ```
 *
 * @date 2025
 */

#include "nsioc/analyzers/host_fingerprint.hpp"
#include "nsioc/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <regex>
#include <sstream>

namespace nsioc {
namespace analyzers {

using utils::StringUtils;

namespace {

constexpr std::size_t kMaxConfigBytes = 4 * 1024 * 1024;
constexpr std::size_t kMaxHeaderLength = 256;

} // anonymous namespace

HostFingerprint::HostFingerprint(const config::FingerprintRules& rules)
    : rules_(rules) {
}

std::optional<std::string> HostFingerprint::ParseVersionHeader(const std::string& line) {
    static const std::regex header(R"(^#NS(\d+\.\d+)\s+Build\s+(\d+\.\d+))");
    if (line.rfind("#NS", 0) != 0) {
        return std::nullopt;
    }
    // The header is short; bound what the recursive matcher sees
    const std::string head = line.substr(0, kMaxHeaderLength);
    std::smatch match;
    if (!std::regex_search(head, match, header)) {
        return std::nullopt;
    }
    return match[1].str() + "-" + match[2].str();
}

std::optional<std::string> HostFingerprint::ParseHostnameLine(const std::string& line) {
    auto words = StringUtils::SplitWhitespace(line);
    if (words.size() < 4 || words[0] != "set" || words[1] != "ns" ||
        StringUtils::ToLower(words[2]) != "hostname") {
        return std::nullopt;
    }

    auto name = words[3];
    if (name.size() >= 2 && name.front() == '"' && name.back() == '"') {
        name = name.substr(1, name.size() - 2);
    }
    if (name.empty()) {
        return std::nullopt;
    }
    return name;
}

void HostFingerprint::ReadConfig(const fs::FileSystemView& view, TargetInfo& info) const {
    for (const auto& path : rules_.config_files) {
        auto stat = view.Stat(path);
        if (!stat || !stat->IsRegular()) {
            continue;
        }

        std::string content;
        try {
            content = view.Read(path, kMaxConfigBytes);
        } catch (const fs::NotReadableError& e) {
            spdlog::warn("Cannot read {}: {}", path, e.what());
            continue;
        }

        std::istringstream stream(content);
        std::string line;
        while (std::getline(stream, line)) {
            if (!info.version) {
                info.version = ParseVersionHeader(line);
            }
            if (!info.hostname) {
                info.hostname = ParseHostnameLine(line);
            }
            if (info.version && info.hostname) {
                break;
            }
        }

        spdlog::debug("Read appliance configuration from {}", path);
        return;
    }
}

TargetInfo HostFingerprint::Collect(const fs::FileSystemView& view, const std::string& name) const {
    TargetInfo info;
    info.name = name;

    for (const auto& marker : rules_.os_markers) {
        if (view.Exists(marker)) {
            info.os = "citrix-netscaler";
            break;
        }
    }
    if (info.os == "unknown") {
        spdlog::warn("Target {} does not look like a Citrix NetScaler filesystem", name);
    }

    ReadConfig(view, info);

    for (const auto& marker : rules_.install_markers) {
        auto stat = view.Stat(marker);
        if (!stat) {
            continue;
        }
        auto created = stat->btime ? stat->btime : stat->ctime;
        if (created && (!info.install_time || *created < *info.install_time)) {
            info.install_time = created;
        }
    }

    for (const auto& log : rules_.activity_logs) {
        auto stat = view.Stat(log);
        if (stat && stat->mtime && (!info.last_activity || *stat->mtime > *info.last_activity)) {
            info.last_activity = stat->mtime;
        }
    }

    if (info.version) {
        info.advisory = advisory_.Evaluate(*info.version);
    }

    spdlog::debug("Fingerprint of {}: os={} hostname={} version={}", name, info.os,
                  info.hostname.value_or("-"), info.version.value_or("-"));
    return info;
}

} // namespace analyzers
} // namespace nsioc
