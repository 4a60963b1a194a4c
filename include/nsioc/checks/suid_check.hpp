/**
 * @file suid_check.hpp
 * @brief Detection of unexpected setuid binaries
 *
 * @date 2025
 */

#pragma once

#include "nsioc/checks/check_result.hpp"
#include "nsioc/config/ioc_rules.hpp"
#include "nsioc/fs/filesystem_view.hpp"

namespace nsioc {
namespace checks {

/**
 * @brief Walk the whole tree and report setuid files not on the allowlist
 *
 * Every regular file below rules.root with S_ISUID set and a path outside
 * rules.allowlist yields one `binary/suid` finding (medium). Only metadata is
 * inspected.
 *
 * @param view Target filesystem
 * @param rules Walk origin and allowlist
 * @param parallel Walk top-level subtrees concurrently; output is identical
 *                 to the sequential walk
 * @return Findings sorted by path
 */
CheckResult CheckSuidBinaries(const fs::FileSystemView& view, const config::SuidRules& rules,
                              bool parallel = false);

} // namespace checks
} // namespace nsioc
