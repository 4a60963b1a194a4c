/**
 * @file cronjob_check.hpp
 * @brief Detection of persistence through scheduled jobs
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
 * @brief Parse every cron definition file and flag suspicious jobs
 *
 * Each entry of rules.paths is either a crontab file or a directory whose
 * regular files are crontabs (not recursive). Files in rules.system_crontabs
 * carry a user column; for files in the other directories the file name is
 * the owning user.
 *
 * Per job:
 * - every pattern whose regex is found in the command =>
 *   `cronjob/suspicious` at the pattern's confidence
 * - owner in rules.suspicious_users => `cronjob/user` (high)
 *
 * Unreadable and malformed files are skipped with coverage reduced.
 *
 * @throws config::RulesError if a pattern is not a valid regex
 */
CheckResult CheckCronjobs(const fs::FileSystemView& view, const config::CronjobRules& rules);

} // namespace checks
} // namespace nsioc
