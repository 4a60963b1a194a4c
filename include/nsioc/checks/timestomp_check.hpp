/**
 * @file timestomp_check.hpp
 * @brief Detection of files whose timestamps were deliberately antedated
 *
 * @date 2025
 */

#pragma once

#include "nsioc/checks/check_result.hpp"
#include "nsioc/config/ioc_rules.hpp"
#include "nsioc/fs/filesystem_view.hpp"

#include <optional>

namespace nsioc {
namespace checks {

/**
 * @brief Inspect timestamps below rules.paths for internal inconsistencies
 *
 * Regular files and directories are evaluated (symlinks are not); the
 * strongest matching rule yields one `timestomp` finding per entry:
 *
 * | Confidence | Condition                                                        |
 * |------------|------------------------------------------------------------------|
 * | high       | mtime < install time, birth (else change) time > install + gap   |
 * | medium     | mtime earlier than the parent directory's birth time by > gap    |
 * | low        | change time later than mtime by > gap                            |
 *
 * A rule whose inputs are unknown (missing timestamp, no install context) is
 * not evaluated.
 *
 * @param view Target filesystem
 * @param rules Scope and tolerated gap
 * @param install_time Installation time of the appliance, if known
 */
CheckResult CheckTimestomps(const fs::FileSystemView& view,
                            const config::TimestompRules& rules,
                            std::optional<fs::Timestamp> install_time);

} // namespace checks
} // namespace nsioc
