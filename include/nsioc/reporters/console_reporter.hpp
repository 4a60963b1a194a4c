/**
 * @file console_reporter.hpp
 * @brief Human-readable terminal report of a scan
 *
 * @date 2025
 */

#pragma once

#include "nsioc/core/detection_engine.hpp"
#include "nsioc/core/finding.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace nsioc {

namespace reporters {

/**
 * @struct ConsoleReporterConfig
 * @brief Presentation options for the console report
 */
struct ConsoleReporterConfig {
    core::Confidence min_confidence{core::Confidence::LOW};  ///< Lower-confidence findings are hidden
    bool show_coverage_notes{true};                           ///< Print per-check coverage notes
};

/**
 * @class ConsoleReporter
 * @brief Writes target summary boxes and findings tables
 *
 * **Example Output**:
 * @code
 * Confidence    Type                 Alert                               Artefact Location
 * ------------  -------------------  ----------------------------------  -------------------
 * high          php-file-permission  Suspicious php permission 0644      /var/vpn/config.php
 * high          php-file-contents    Suspicious PHP code 'eval($_'       /var/vpn/config.php
 * @endcode
 */
class ConsoleReporter {
public:
    explicit ConsoleReporter(std::ostream& out, const ConsoleReporterConfig& config = ConsoleReporterConfig{});

    /**
     * @brief Print header, per-check summary and findings of one target
     */
    void PrintScanResult(const core::ScanResult& result) const;

    /**
     * @brief Print a failure line for a target that could not be opened
     */
    void PrintTargetError(const core::TargetError& error) const;

    /**
     * @brief Closing line after all targets
     */
    void PrintFooter(std::size_t targets, std::size_t failed) const;

    /**
     * @brief Render findings as an aligned four-column table
     */
    static std::string FormatFindingsTable(const std::vector<core::Finding>& findings);

private:
    void PrintTargetInfo(const core::ScanResult& result) const;
    void PrintCheckSummary(const core::ScanResult& result) const;

    std::ostream& out_;
    ConsoleReporterConfig config_;
};

} // namespace reporters

} // namespace nsioc
