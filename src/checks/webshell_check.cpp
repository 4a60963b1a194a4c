/**
 * @file webshell_check.cpp
 * @brief Implementation of the webshell permission and signature check
 *
 * **Known NetScaler Webshell Traits**:
 * - Dropped into /var/netscaler/logon/, /var/vpn/ or /var/netscaler/ns_gui/
 *   where the portal serves PHP from the persistent data disk
 * - Written by the web server user, so the mode is 0644 instead of the
 *   firmware's 0444
 * - Small loaders: eval($_POST[...]), base64_decode(...), or array_filter()
 *   with a callback smuggled in through request parameters
 *
 * @date 2025
 */

#include "nsioc/checks/webshell_check.hpp"
#include "nsioc/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace nsioc {
namespace checks {

using utils::StringUtils;

std::optional<std::uint32_t> BaselineModeFor(const std::string& path,
                                             const std::map<std::string, std::uint32_t>& file_classes) {
    auto name = path.substr(path.find_last_of('/') + 1);
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        return std::nullopt;
    }

    auto it = file_classes.find(StringUtils::ToLower(name.substr(dot)));
    if (it == file_classes.end()) {
        return std::nullopt;
    }
    return it->second;
}

CheckResult CheckWebshells(const fs::FileSystemView& view, const config::WebshellRules& rules) {
    CheckResult result;
    result.check_name = "webshell";

    bool any_directory = false;
    std::set<std::string> visited;

    for (const auto& directory : rules.paths) {
        if (!view.Exists(directory)) {
            spdlog::debug("Webshell path not present in target: {}", directory);
            continue;
        }
        any_directory = true;

        for (const auto& entry : view.List(directory, true)) {
            if (!entry.stat.IsRegular() || !visited.insert(entry.path).second) {
                continue;
            }

            auto baseline = BaselineModeFor(entry.path, rules.file_classes);
            if (!baseline) {
                continue;
            }
            result.entries_examined++;

            // Permission baseline
            const std::uint32_t mode = entry.stat.mode & 0777;
            if (mode != *baseline) {
                result.findings.emplace_back(
                    core::FindingKind::PHP_FILE_PERMISSION,
                    "Suspicious php permission " + StringUtils::FormatOctalMode(mode),
                    core::Confidence::HIGH,
                    entry.path);
            }

            // Content signatures
            if (entry.stat.size > rules.max_content_bytes) {
                spdlog::debug("Skipping content of {} ({} bytes > {})",
                              entry.path, entry.stat.size, rules.max_content_bytes);
                continue;
            }

            std::string content;
            try {
                content = view.Read(entry.path, rules.max_content_bytes);
            } catch (const fs::NotReadableError& e) {
                spdlog::warn("Cannot read {}: {}", entry.path, e.what());
                result.ReduceCoverage("Content not readable: " + entry.path);
                continue;
            }

            for (const auto& signature : rules.signatures) {
                if (!StringUtils::ContainsIgnoreCase(content, signature)) {
                    continue;
                }
                auto shown = StringUtils::Truncate(signature, rules.signature_display_length);
                result.findings.emplace_back(
                    core::FindingKind::PHP_FILE_CONTENTS,
                    "Suspicious PHP code '" + StringUtils::Sanitize(shown) + "'",
                    core::Confidence::HIGH,
                    entry.path);
            }
        }
    }

    if (!any_directory) {
        result.ReduceCoverage("None of the web application directories exist in this target");
    }

    return result;
}

} // namespace checks
} // namespace nsioc
