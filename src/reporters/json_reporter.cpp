/**
 * @file json_reporter.cpp
 * @brief Implementation of the JSON report
 *
 * Timestamps are ISO 8601 UTC ("2025-07-21T10:00:00Z"). Unknown values are
 * emitted as null rather than omitted so consumers can rely on the keys.
 *
 * @date 2025
 */

#include "nsioc/reporters/json_reporter.hpp"
#include "nsioc/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>

namespace nsioc {
namespace reporters {

using json = nlohmann::json;
using utils::StringUtils;

namespace {

json OptionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

json OptionalTime(const std::optional<fs::Timestamp>& value) {
    return value ? json(StringUtils::FormatTimestamp(*value)) : json(nullptr);
}

json BuildAdvisory(const analyzers::AdvisoryResult& advisory) {
    json vulnerable = json::array();
    for (const auto& cve : advisory.vulnerable) {
        vulnerable.push_back({{"cve", cve.cve}, {"bulletin", cve.bulletin}});
    }

    return {
        {"parsed", advisory.parsed},
        {"fips", advisory.fips},
        {"end_of_life", advisory.end_of_life},
        {"vulnerable", vulnerable}
    };
}

json BuildFinding(const core::Finding& finding, const core::ScanResult& result) {
    json j = {
        {"kind", core::FindingKindToString(finding.Kind())},
        {"confidence", core::ConfidenceToString(finding.GetConfidence())},
        {"message", finding.Message()},
        {"path", finding.Path()}
    };

    auto hash = result.evidence_hashes.find(finding.Path());
    if (hash != result.evidence_hashes.end()) {
        j["sha256"] = hash->second;
    }
    return j;
}

json BuildTarget(const core::ScanResult& result, core::Confidence min_confidence) {
    const auto& info = result.target_info;

    json j;
    j["name"] = result.target_name;
    j["info"] = {
        {"os", info.os},
        {"hostname", OptionalString(info.hostname)},
        {"version", OptionalString(info.version)},
        {"install_time", OptionalTime(info.install_time)},
        {"last_activity", OptionalTime(info.last_activity)}
    };
    j["advisory"] = info.version ? BuildAdvisory(info.advisory) : json(nullptr);
    j["scan_start"] = StringUtils::FormatTimestamp(result.start_time);
    j["scan_end"] = StringUtils::FormatTimestamp(result.end_time);
    j["coverage_reduced"] = result.CoverageReduced();

    json checks = json::array();
    for (const auto& check : result.checks) {
        checks.push_back({
            {"name", check.check_name},
            {"findings", check.findings.size()},
            {"entries_examined", check.entries_examined},
            {"coverage_reduced", check.coverage_reduced},
            {"notes", check.notes}
        });
    }
    j["checks"] = checks;

    json findings = json::array();
    for (const auto& finding : core::FilterByConfidence(result.findings, min_confidence)) {
        findings.push_back(BuildFinding(finding, result));
    }
    j["findings"] = findings;

    return j;
}

} // anonymous namespace

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

std::string JsonReporter::GenerateJsonString(const std::vector<core::ScanResult>& results,
                                             const std::vector<core::TargetError>& errors) const {
    json j;
    j["tool"] = "nsioc";
    j["generated_at"] = StringUtils::FormatTimestamp(std::chrono::system_clock::now());
    j["min_confidence"] = core::ConfidenceToString(config_.min_confidence);

    std::size_t total_findings = 0;
    json by_confidence = {{"low", 0}, {"medium", 0}, {"high", 0}};

    json targets = json::array();
    for (const auto& result : results) {
        auto target = BuildTarget(result, config_.min_confidence);
        for (const auto& finding : target["findings"]) {
            auto confidence = finding["confidence"].get<std::string>();
            by_confidence[confidence] = by_confidence[confidence].get<int>() + 1;
            total_findings++;
        }
        targets.push_back(std::move(target));
    }
    j["targets"] = targets;

    json error_list = json::array();
    for (const auto& error : errors) {
        error_list.push_back({{"target", error.target}, {"message", error.message}});
    }
    j["errors"] = error_list;

    j["summary"] = {
        {"targets", results.size() + errors.size()},
        {"failed", errors.size()},
        {"findings", total_findings},
        {"by_confidence", by_confidence}
    };

    // Names from the image are raw bytes; invalid UTF-8 becomes U+FFFD instead of failing the report
    const int indent = config_.pretty_print ? config_.indent_size : -1;
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

bool JsonReporter::SaveReport(const std::vector<core::ScanResult>& results,
                              const std::vector<core::TargetError>& errors,
                              const std::filesystem::path& output_path) const {
    try {
        // Serialise first so a failure never leaves a truncated file behind
        const auto document = GenerateJsonString(results, errors);

        std::ofstream file(output_path);
        if (!file) {
            spdlog::error("Failed to open file for writing: {}", output_path.string());
            return false;
        }

        file << document << "\n";
        if (!file) {
            spdlog::error("Failed to write JSON report: {}", output_path.string());
            return false;
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to save JSON: {}", e.what());
        return false;
    }

    spdlog::info("JSON report written to {}", output_path.string());
    return true;
}

} // namespace reporters
} // namespace nsioc
