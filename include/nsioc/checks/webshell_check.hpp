/**
 * @file webshell_check.hpp
 * @brief Detection of webshells in the appliance's web application trees
 *
 * Web-facing portal code on NetScaler is shipped read-only (0444). Injected
 * webshells typically arrive with a different mode and contain dynamically
 * evaluated code. The check reports both indicators independently.
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
 * @brief Scan the configured web directories for webshell indicators
 *
 * For every regular file of a monitored file class below rules.paths:
 * - mode & 0777 differs from the class baseline =>
 *   `php-file-permission` (high), message carries the observed octal mode
 * - size <= rules.max_content_bytes and content contains a signature
 *   (case-insensitive) => one `php-file-contents` (high) per signature
 *
 * Missing directories are skipped silently; if none exists the result has
 * coverage_reduced set and no findings.
 *
 * @param view Target filesystem
 * @param rules Directories, file classes and signatures
 * @return Findings in path order
 */
CheckResult CheckWebshells(const fs::FileSystemView& view, const config::WebshellRules& rules);

/**
 * @brief Baseline mode for a path's file class, matched on lower-cased extension
 * @return std::nullopt if the file is not in a monitored class
 */
std::optional<std::uint32_t> BaselineModeFor(const std::string& path,
                                             const std::map<std::string, std::uint32_t>& file_classes);

} // namespace checks
} // namespace nsioc
