/**
 * @file json_reporter.hpp
 * @brief Machine-readable JSON report of all scanned targets
 *
 * One document per invocation: every target with its fingerprint, version
 * advisory, per-check coverage, findings and evidence hashes, plus the
 * targets that could not be opened.
 *
 * @date 2025
 */

#pragma once

#include "nsioc/core/detection_engine.hpp"
#include "nsioc/core/finding.hpp"
#include "nsioc/core/target.hpp"

#include <string>
#include <vector>
#include <filesystem>

namespace nsioc {

namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Configuration for JSON report generation
 */
struct JsonReporterConfig {
    core::Confidence min_confidence{core::Confidence::LOW};  ///< Lower-confidence findings are omitted
    bool pretty_print{true};                                  ///< Indent output
    int indent_size{2};                                       ///< Indentation spaces
};

/**
 * @class JsonReporter
 * @brief JSON report generator
 *
 * **Document Layout**:
 * ```json
 * {
 *   "tool": "nsioc",
 *   "generated_at": "2025-07-21T10:00:00Z",
 *   "min_confidence": "low",
 *   "targets": [
 *     {
 *       "name": "image/root,/var=image/var",
 *       "info": { "os": "citrix-netscaler", "version": "13.1-49.15", ... },
 *       "advisory": { "end_of_life": false, "vulnerable": [ ... ] },
 *       "checks": [ { "name": "webshell", "coverage_reduced": false, ... } ],
 *       "findings": [ { "kind": "php-file-permission", "confidence": "high", ... } ]
 *     }
 *   ],
 *   "errors": [ { "target": "missing/root", "message": "..." } ],
 *   "summary": { "targets": 2, "failed": 1, "findings": 2 }
 * }
 * ```
 *
 * **Usage Example**:
 * @code
 * JsonReporter reporter;
 * std::string json = reporter.GenerateJsonString(results, errors);
 * reporter.SaveReport(results, errors, "report.json");
 * @endcode
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    /**
     * @brief Render the report
     */
    std::string GenerateJsonString(const std::vector<core::ScanResult>& results,
                                   const std::vector<core::TargetError>& errors) const;

    /**
     * @brief Render the report and write it to output_path
     * @return false if the file could not be written (logged)
     */
    bool SaveReport(const std::vector<core::ScanResult>& results,
                    const std::vector<core::TargetError>& errors,
                    const std::filesystem::path& output_path) const;

private:
    JsonReporterConfig config_;
};

} // namespace reporters

} // namespace nsioc
