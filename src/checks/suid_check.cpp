/**
 * @file suid_check.cpp
 * @brief Implementation of the setuid binary check
 *
 * Attackers who gained code execution as `nobody` through the web portal
 * leave a setuid copy of a shell (or a small wrapper) behind to regain root
 * later. The appliance ships a fixed set of setuid binaries, so anything
 * else carrying the bit is reported.
 *
 * **Parallel Walk**:
 * The children of the walk origin are listed first; every directory among
 * them is then walked on its own std::async task. The merged entries are
 * sorted by path, giving exactly the order of the sequential walk.
 *
 * @date 2025
 */

#include "nsioc/checks/suid_check.hpp"
#include "nsioc/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <sys/stat.h>

namespace nsioc {
namespace checks {

namespace {

std::vector<fs::FileEntry> WalkParallel(const fs::FileSystemView& view, const std::string& root) {
    auto top_level = view.List(root, false);

    std::vector<std::future<std::vector<fs::FileEntry>>> tasks;
    for (const auto& entry : top_level) {
        if (!entry.stat.IsDirectory()) {
            continue;
        }
        tasks.push_back(std::async(std::launch::async, [&view, path = entry.path]() {
            return view.List(path, true);
        }));
    }

    std::vector<fs::FileEntry> entries = std::move(top_level);
    for (auto& task : tasks) {
        auto subtree = task.get();
        entries.insert(entries.end(),
                       std::make_move_iterator(subtree.begin()),
                       std::make_move_iterator(subtree.end()));
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::FileEntry& a, const fs::FileEntry& b) { return a.path < b.path; });

    spdlog::debug("Parallel SUID walk: {} subtree task(s), {} entries", tasks.size(), entries.size());
    return entries;
}

} // anonymous namespace

CheckResult CheckSuidBinaries(const fs::FileSystemView& view, const config::SuidRules& rules,
                              bool parallel) {
    CheckResult result;
    result.check_name = "suid";

    auto root = view.Stat(rules.root);
    if (!root || !root->IsDirectory()) {
        result.ReduceCoverage("SUID walk origin not present in target: " + rules.root);
        return result;
    }

    auto entries = parallel ? WalkParallel(view, rules.root) : view.List(rules.root, true);

    for (const auto& entry : entries) {
        if (!entry.stat.IsRegular()) {
            continue;
        }
        result.entries_examined++;

        if ((entry.stat.mode & S_ISUID) == 0) {
            continue;
        }
        if (rules.allowlist.count(entry.path) > 0) {
            spdlog::debug("Known setuid binary: {}", entry.path);
            continue;
        }

        result.findings.emplace_back(
            core::FindingKind::BINARY_SUID,
            "Binary with SUID bit set observed (mode " +
                utils::StringUtils::FormatOctalMode(entry.stat.mode & 07777) + ")",
            core::Confidence::MEDIUM,
            entry.path);
    }

    return result;
}

} // namespace checks
} // namespace nsioc
