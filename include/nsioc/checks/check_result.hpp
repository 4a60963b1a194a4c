/**
 * @file check_result.hpp
 * @brief Output of a single IOC check against a single target
 *
 * @date 2025
 */

#pragma once

#include "nsioc/core/finding.hpp"

#include <string>
#include <vector>

namespace nsioc {
namespace checks {

/**
 * @struct CheckResult
 * @brief Ordered findings of one check plus what it could not look at
 *
 * `coverage_reduced` is set whenever the check skipped input it would
 * normally have evaluated (missing directories, unreadable files, malformed
 * crontabs, or the check failing outright). The notes say why.
 */
struct CheckResult {
    std::string check_name;                  ///< "webshell", "timestomp", "cronjob", "suid"
    std::vector<core::Finding> findings;     ///< In discovery order
    bool coverage_reduced{false};            ///< Some input could not be evaluated
    std::vector<std::string> notes;          ///< Human-readable coverage notes
    std::size_t entries_examined{0};         ///< Files/entries actually evaluated

    /**
     * @brief Record a coverage gap
     */
    void ReduceCoverage(std::string note) {
        coverage_reduced = true;
        notes.push_back(std::move(note));
    }
};

} // namespace checks
} // namespace nsioc
