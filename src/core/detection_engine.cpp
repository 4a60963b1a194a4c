/**
 * @file detection_engine.cpp
 * @brief Implementation of the check orchestration pipeline
 *
 * **Pipeline**:
 * 1. Webshells in the web application trees
 * 2. Timestomped files in the same trees and /var/tmp
 * 3. Suspicious scheduled jobs on every volume
 * 4. Unexpected setuid binaries anywhere (dominates runtime)
 * 5. Optional SHA-256 of every flagged file
 *
 * A check that throws is logged and recorded as "no findings, coverage
 * reduced"; the remaining checks still run. Checks share no state, so the
 * order only determines the order of findings in the report.
 *
 * @date 2025
 */

#include "nsioc/core/detection_engine.hpp"
#include "nsioc/checks/cronjob_check.hpp"
#include "nsioc/checks/suid_check.hpp"
#include "nsioc/checks/timestomp_check.hpp"
#include "nsioc/checks/webshell_check.hpp"
#include "nsioc/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <set>
#include <stdexcept>

namespace nsioc {
namespace core {

bool ScanResult::CoverageReduced() const {
    for (const auto& check : checks) {
        if (check.coverage_reduced) {
            return true;
        }
    }
    return false;
}

DetectionEngine::DetectionEngine(std::shared_ptr<const config::IocRules> rules, DetectionConfig config)
    : rules_(std::move(rules)),
      config_(config) {
    if (!rules_) {
        throw std::invalid_argument("DetectionEngine requires a rule set");
    }
}

// ============================================================================
// CHECK ISOLATION
// ============================================================================

checks::CheckResult DetectionEngine::RunIsolated(const std::string& name,
                                                 const std::string& banner,
                                                 const std::function<checks::CheckResult()>& check) const {
    spdlog::info("*** {} ***", banner);

    auto started = std::chrono::steady_clock::now();
    checks::CheckResult result;
    try {
        result = check();
    } catch (const std::exception& e) {
        spdlog::error("Check '{}' failed: {}", name, e.what());
        result = checks::CheckResult{};
        result.check_name = name;
        result.ReduceCoverage(std::string("Check failed: ") + e.what());
    }

    for (const auto& finding : result.findings) {
        spdlog::warn("[{}] {}: {} ({})",
                     ConfidenceToString(finding.GetConfidence()),
                     FindingKindToString(finding.Kind()),
                     finding.Message(),
                     finding.Path());
    }
    for (const auto& note : result.notes) {
        spdlog::warn("Reduced coverage in {} check: {}", name, note);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::debug("{} check: {} entries, {} finding(s), {} ms",
                  name, result.entries_examined, result.findings.size(), elapsed.count());
    return result;
}

// ============================================================================
// PIPELINE
// ============================================================================

ScanResult DetectionEngine::Run(const Target& target) const {
    return Run(target.View(), target.Info());
}

ScanResult DetectionEngine::Run(const fs::FileSystemView& view, const analyzers::TargetInfo& info) const {
    ScanResult result;
    result.target_name = info.name;
    result.target_info = info;
    result.start_time = std::chrono::system_clock::now();

    const auto& rules = *rules_;

    spdlog::info("Scanning target {}", info.name);

    result.checks.push_back(RunIsolated("webshell", "Checking for webshells", [&]() {
        return checks::CheckWebshells(view, rules.webshell);
    }));

    result.checks.push_back(RunIsolated("timestomp", "Checking for timestomped files", [&]() {
        return checks::CheckTimestomps(view, rules.timestomp, info.install_time);
    }));

    result.checks.push_back(RunIsolated("cronjob", "Checking for suspicious cronjobs", [&]() {
        return checks::CheckCronjobs(view, rules.cronjob);
    }));

    result.checks.push_back(RunIsolated("suid", "Checking for SUID binaries", [&]() {
        return checks::CheckSuidBinaries(view, rules.suid, config_.parallel_suid_walk);
    }));

    for (const auto& check : result.checks) {
        result.findings.insert(result.findings.end(), check.findings.begin(), check.findings.end());
    }

    if (config_.hash_evidence) {
        HashEvidence(view, result);
    }

    result.end_time = std::chrono::system_clock::now();

    spdlog::info("Target {}: {} finding(s){}", info.name, result.findings.size(),
                 result.CoverageReduced() ? " (coverage reduced)" : "");
    return result;
}

void DetectionEngine::HashEvidence(const fs::FileSystemView& view, ScanResult& result) const {
    std::set<std::string> paths;
    for (const auto& finding : result.findings) {
        paths.insert(finding.Path());
    }

    for (const auto& path : paths) {
        try {
            auto digest = utils::HashUtils::HashEvidence(view, path, config_.max_evidence_bytes);
            if (digest) {
                result.evidence_hashes.emplace(path, *digest);
            }
        } catch (const std::exception& e) {
            spdlog::error("Hashing evidence {} failed: {}", path, e.what());
        }
    }

    spdlog::debug("Hashed {} of {} evidence file(s)", result.evidence_hashes.size(), paths.size());
}

} // namespace core
} // namespace nsioc
