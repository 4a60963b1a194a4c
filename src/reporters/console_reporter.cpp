/**
 * @file console_reporter.cpp
 * @brief Implementation of the terminal report
 *
 * @date 2025
 */

#include "nsioc/reporters/console_reporter.hpp"
#include "nsioc/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <sstream>

namespace nsioc {
namespace reporters {

using utils::StringUtils;

namespace {

constexpr std::size_t kBoxWidth = 63;

std::string BoxLine(const std::string& text) {
    std::string line = "║  " + text;
    // Width counts characters of the inner text, not UTF-8 bytes of the frame
    std::size_t used = 2 + text.size();
    if (used < kBoxWidth) {
        line += std::string(kBoxWidth - used, ' ');
    }
    return line + "║\n";
}

std::string OptionalTime(const std::optional<fs::Timestamp>& time) {
    return time ? StringUtils::FormatTimestamp(*time) : "unknown";
}

} // anonymous namespace

ConsoleReporter::ConsoleReporter(std::ostream& out, const ConsoleReporterConfig& config)
    : out_(out),
      config_(config) {
}

// ============================================================================
// TABLE RENDERING
// ============================================================================

std::string ConsoleReporter::FormatFindingsTable(const std::vector<core::Finding>& findings) {
    const std::array<std::string, 4> headers = {"Confidence", "Type", "Alert", "Artefact Location"};

    std::vector<std::array<std::string, 4>> rows;
    rows.reserve(findings.size());
    for (const auto& finding : findings) {
        rows.push_back({core::ConfidenceToString(finding.GetConfidence()),
                        core::FindingKindToString(finding.Kind()),
                        StringUtils::Sanitize(finding.Message()),
                        StringUtils::Sanitize(finding.Path())});
    }

    std::array<std::size_t, 4> widths{};
    for (std::size_t col = 0; col < headers.size(); ++col) {
        widths[col] = headers[col].size();
        for (const auto& row : rows) {
            widths[col] = std::max(widths[col], row[col].size());
        }
    }

    std::ostringstream oss;
    auto emit = [&](const std::array<std::string, 4>& cells) {
        std::string line;
        for (std::size_t col = 0; col < cells.size(); ++col) {
            line += cells[col];
            if (col + 1 < cells.size()) {
                line += std::string(widths[col] - cells[col].size() + 2, ' ');
            }
        }
        oss << line << "\n";
    };

    emit(headers);
    std::array<std::string, 4> rule;
    for (std::size_t col = 0; col < widths.size(); ++col) {
        rule[col] = std::string(widths[col], '-');
    }
    emit(rule);
    for (const auto& row : rows) {
        emit(row);
    }
    return oss.str();
}

// ============================================================================
// TARGET OUTPUT
// ============================================================================

void ConsoleReporter::PrintTargetInfo(const core::ScanResult& result) const {
    const auto& info = result.target_info;

    out_ << "\n";
    out_ << "╔═══════════════════════════════════════════════════════════════╗\n";
    out_ << "║                         TARGET SUMMARY                        ║\n";
    out_ << "╠═══════════════════════════════════════════════════════════════╣\n";
    out_ << BoxLine("Target:        " + StringUtils::Truncate(result.target_name, 44));
    out_ << BoxLine("OS:            " + info.os);
    out_ << BoxLine("Hostname:      " + StringUtils::Sanitize(info.hostname.value_or("unknown")));
    out_ << BoxLine("Version:       " + StringUtils::Sanitize(info.version.value_or("unknown")));
    out_ << BoxLine("Install time:  " + OptionalTime(info.install_time));
    out_ << BoxLine("Last activity: " + OptionalTime(info.last_activity));

    if (info.advisory.parsed) {
        std::string status;
        if (info.advisory.end_of_life) {
            status = "end of life";
        } else if (info.advisory.fips) {
            status = "FIPS/NDcPP";
        } else {
            status = "supported";
        }
        out_ << BoxLine("Release:       " + status);

        if (info.advisory.vulnerable.empty()) {
            out_ << BoxLine("Advisories:    none known");
        } else {
            for (std::size_t i = 0; i < info.advisory.vulnerable.size(); ++i) {
                const auto& cve = info.advisory.vulnerable[i];
                out_ << BoxLine(std::string(i == 0 ? "Vulnerable to: " : "               ") +
                                cve.cve + " (" + cve.bulletin + ")");
            }
        }
    }
    out_ << "╚═══════════════════════════════════════════════════════════════╝\n";
}

void ConsoleReporter::PrintCheckSummary(const core::ScanResult& result) const {
    out_ << "\n";
    for (const auto& check : result.checks) {
        out_ << "[" << (check.coverage_reduced ? "!" : "+") << "] "
             << check.check_name << ": " << check.findings.size() << " finding(s), "
             << check.entries_examined << " examined"
             << (check.coverage_reduced ? ", coverage reduced" : "") << "\n";

        if (config_.show_coverage_notes) {
            for (const auto& note : check.notes) {
                out_ << "      " << StringUtils::Sanitize(note) << "\n";
            }
        }
    }
}

void ConsoleReporter::PrintScanResult(const core::ScanResult& result) const {
    PrintTargetInfo(result);
    PrintCheckSummary(result);

    auto findings = core::FilterByConfidence(result.findings, config_.min_confidence);
    out_ << "\n";

    if (findings.empty()) {
        out_ << "[*] No hits found for IOC checks.\n";
        if (findings.size() != result.findings.size()) {
            out_ << "[i] " << result.findings.size() << " finding(s) below minimum confidence "
                 << core::ConfidenceToString(config_.min_confidence) << " hidden\n";
        }
        return;
    }

    out_ << "********************************************************************************\n";
    out_ << "***                                                                          ***\n";
    out_ << "*** There were findings for Indicators of Compromise.                        ***\n";
    out_ << "*** Please consider performing further forensic investigation of the system. ***\n";
    out_ << "***                                                                          ***\n";
    out_ << "********************************************************************************\n";
    out_ << "\n";
    out_ << FormatFindingsTable(findings);

    if (!result.evidence_hashes.empty()) {
        out_ << "\nEvidence SHA-256:\n";
        for (const auto& [path, digest] : result.evidence_hashes) {
            out_ << "  " << digest << "  " << StringUtils::Sanitize(path) << "\n";
        }
    }
}

void ConsoleReporter::PrintTargetError(const core::TargetError& error) const {
    out_ << "\n[ERROR] Target " << error.target << " could not be scanned: " << error.message << "\n";
}

void ConsoleReporter::PrintFooter(std::size_t targets, std::size_t failed) const {
    out_ << "\n\n";
    if (failed == 0) {
        out_ << "All targets analyzed.\n";
    } else {
        out_ << (targets - failed) << " of " << targets << " target(s) analyzed, "
             << failed << " failed.\n";
    }
}

} // namespace reporters
} // namespace nsioc
