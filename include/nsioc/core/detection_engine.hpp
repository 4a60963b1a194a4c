/**
 * @file detection_engine.hpp
 * @brief Orchestration of the IOC checks against one target
 *
 * Runs webshell, timestomp, cronjob and SUID checks in that fixed order,
 * isolates failures of individual checks and aggregates everything into a
 * ScanResult for the reporters.
 *
 * @date 2025
 */

#pragma once

#include "nsioc/analyzers/host_fingerprint.hpp"
#include "nsioc/checks/check_result.hpp"
#include "nsioc/config/ioc_rules.hpp"
#include "nsioc/core/finding.hpp"
#include "nsioc/core/target.hpp"
#include "nsioc/fs/filesystem_view.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace nsioc {

namespace core {

/**
 * @struct DetectionConfig
 * @brief Execution options of the detection engine
 */
struct DetectionConfig {
    bool parallel_suid_walk{false};                     ///< Walk top-level subtrees concurrently
    bool hash_evidence{false};                          ///< SHA-256 every flagged regular file
    std::size_t max_evidence_bytes{64 * 1024 * 1024};   ///< Larger evidence is not hashed
};

/**
 * @struct ScanResult
 * @brief Everything learned about one target
 */
struct ScanResult {
    std::string target_name;                        ///< As given on the command line
    analyzers::TargetInfo target_info;              ///< Fingerprint and advisory
    std::vector<checks::CheckResult> checks;        ///< webshell, timestomp, cronjob, suid
    std::vector<Finding> findings;                  ///< Concatenation in check order
    std::map<std::string, std::string> evidence_hashes;  ///< Path -> SHA-256 (--hash-evidence)

    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;

    bool HasFindings() const { return !findings.empty(); }

    /**
     * @brief True if any check could not evaluate part of its input
     */
    bool CoverageReduced() const;
};

/**
 * @class DetectionEngine
 * @brief Runs all IOC checks over a target
 *
 * The engine holds only immutable rules and options; Run() may be called
 * repeatedly and yields identical results for the same target.
 *
 * **Usage Example**:
 * @code
 * DetectionEngine engine(config::SharedDefaultRules());
 * auto target = Target::Open(TargetSpec::Parse("image/root,/var=image/var"),
 *                            engine.Rules().fingerprint);
 * auto result = engine.Run(target);
 * if (result.HasFindings()) { ... }
 * @endcode
 */
class DetectionEngine {
public:
    explicit DetectionEngine(std::shared_ptr<const config::IocRules> rules,
                             DetectionConfig config = DetectionConfig{});

    /**
     * @brief Scan an opened target
     */
    ScanResult Run(const Target& target) const;

    /**
     * @brief Scan any filesystem view with the given context
     */
    ScanResult Run(const fs::FileSystemView& view, const analyzers::TargetInfo& info) const;

    const config::IocRules& Rules() const { return *rules_; }
    const DetectionConfig& Config() const { return config_; }

private:
    /**
     * @brief Run one check, converting any escaping exception into an empty
     *        result with reduced coverage
     */
    checks::CheckResult RunIsolated(const std::string& name,
                                    const std::string& banner,
                                    const std::function<checks::CheckResult()>& check) const;

    void HashEvidence(const fs::FileSystemView& view, ScanResult& result) const;

    std::shared_ptr<const config::IocRules> rules_;
    DetectionConfig config_;
};

} // namespace core

} // namespace nsioc
