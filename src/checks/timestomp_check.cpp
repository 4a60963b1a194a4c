/**
 * @file timestomp_check.cpp
 * @brief Implementation of the timestamp consistency check
 *
 * Attackers copying a webshell next to firmware files commonly reset its
 * modification time (touch -r) to blend in. The inode change time and, on
 * UFS2, the birth time cannot be set from userland, so a gap between the
 * modification time and those fields survives the manipulation.
 *
 * @date 2025
 */

#include "nsioc/checks/timestomp_check.hpp"
#include "nsioc/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <set>

namespace nsioc {
namespace checks {

using utils::StringUtils;

namespace {

std::chrono::seconds Gap(const fs::Timestamp& later, const fs::Timestamp& earlier) {
    return std::chrono::duration_cast<std::chrono::seconds>(later - earlier);
}

std::optional<core::Finding> Evaluate(const fs::FileEntry& entry,
                                      const std::optional<fs::FileStat>& parent,
                                      std::optional<fs::Timestamp> install_time,
                                      std::chrono::seconds threshold) {
    const auto& stat = entry.stat;
    if (!stat.mtime) {
        return std::nullopt;
    }
    const auto mtime = *stat.mtime;

    // Claims to predate the installation, yet arrived well after it
    auto arrival = stat.btime ? stat.btime : stat.ctime;
    if (install_time && arrival && mtime < *install_time && *arrival > *install_time + threshold) {
        return core::Finding(
            core::FindingKind::TIMESTOMP,
            "Modification time " + StringUtils::FormatTimestamp(mtime) +
                " predates install time " + StringUtils::FormatTimestamp(*install_time) +
                " but entry appeared " + StringUtils::FormatTimestamp(*arrival),
            core::Confidence::HIGH,
            entry.path);
    }

    // Claims to be older than the directory holding it
    if (parent && parent->btime && mtime + threshold < *parent->btime) {
        return core::Finding(
            core::FindingKind::TIMESTOMP,
            "Modification time predates parent directory creation by " +
                StringUtils::FormatDuration(Gap(*parent->btime, mtime)),
            core::Confidence::MEDIUM,
            entry.path);
    }

    if (stat.ctime && *stat.ctime > mtime + threshold) {
        return core::Finding(
            core::FindingKind::TIMESTOMP,
            "Possibly timestomped file observed (changed " +
                StringUtils::FormatDuration(Gap(*stat.ctime, mtime)) + " after last modification)",
            core::Confidence::LOW,
            entry.path);
    }

    return std::nullopt;
}

} // anonymous namespace

CheckResult CheckTimestomps(const fs::FileSystemView& view,
                            const config::TimestompRules& rules,
                            std::optional<fs::Timestamp> install_time) {
    CheckResult result;
    result.check_name = "timestomp";

    if (!install_time) {
        spdlog::debug("No install time context; install-time rule disabled");
    }

    bool any_directory = false;
    std::set<std::string> visited;
    std::map<std::string, std::optional<fs::FileStat>> parents;

    for (const auto& directory : rules.paths) {
        if (!view.Exists(directory)) {
            spdlog::debug("Timestomp path not present in target: {}", directory);
            continue;
        }
        any_directory = true;

        for (const auto& entry : view.List(directory, true)) {
            if (!entry.stat.IsRegular() && !entry.stat.IsDirectory()) {
                continue;
            }
            if (!visited.insert(entry.path).second) {
                continue;
            }
            result.entries_examined++;

            if (entry.stat.time_out_of_range) {
                spdlog::warn("Timestamp of {} is outside the representable range", entry.path);
                result.ReduceCoverage("Timestamp outside the representable range: " + entry.path);
            }

            auto parent_path = fs::ParentPath(entry.path);
            auto cached = parents.find(parent_path);
            if (cached == parents.end()) {
                cached = parents.emplace(parent_path, view.Stat(parent_path)).first;
            }

            auto finding = Evaluate(entry, cached->second, install_time, rules.threshold);
            if (finding) {
                result.findings.push_back(std::move(*finding));
            }
        }
    }

    if (!any_directory) {
        result.ReduceCoverage("None of the timestomp scope directories exist in this target");
    }

    return result;
}

} // namespace checks
} // namespace nsioc
