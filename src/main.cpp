/**
 * @file main.cpp
 * @brief nsioc - Citrix NetScaler IOC triage, command-line interface
 *
 * Entry point of the scanner. Opens every target given on the command line
 * (acquired filesystem images reconstructed into directories), runs the IOC
 * checks, prints a console report and optionally writes a JSON report.
 *
 * **Exit Status**:
 * - 0: no findings at or above the minimum confidence
 * - 2: findings present
 * - 1: bad arguments, unreadable rules file, or a target could not be opened
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "nsioc/config/ioc_rules.hpp"
#include "nsioc/core/detection_engine.hpp"
#include "nsioc/core/target.hpp"
#include "nsioc/reporters/console_reporter.hpp"
#include "nsioc/reporters/json_reporter.hpp"
#include "nsioc/utils/string_utils.hpp"

#include <iostream>
#include <filesystem>

namespace {

constexpr int kExitClean = 0;
constexpr int kExitError = 1;
constexpr int kExitFindings = 2;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintBanner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║        nsioc - Citrix NetScaler Indicator of Compromise       ║
║                   Triage for Forensic Images                  ║
║                            v1.0.0                             ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Analyze forensic images of Citrix NetScalers for Indicators of Compromise"};
    app.footer("\nTARGET is ROOT[,/mountpoint=DIR...], e.g. image/root,/var=image/var,/flash=image/flash");

    std::vector<std::string> targets;
    std::string rules_file;
    std::string json_file;
    std::string min_confidence = "low";
    std::string install_time;
    bool parallel = false;
    bool hash_evidence = false;
    bool verbose = false;
    bool quiet = false;

    app.add_option("targets", targets, "Target(s) to load")
        ->required();
    app.add_option("--rules", rules_file, "JSON file overriding the built-in rule tables")
        ->check(CLI::ExistingFile);
    app.add_option("--json", json_file, "Write a JSON report to this file");
    app.add_option("--min-confidence", min_confidence, "Hide findings below this confidence")
        ->check(CLI::IsMember({"low", "medium", "high"}, CLI::ignore_case))
        ->default_val("low");
    app.add_option("--install-time", install_time,
                   "Appliance install time (epoch seconds or YYYY-MM-DDTHH:MM:SSZ), overrides detection");
    app.add_flag("--parallel", parallel, "Walk top-level directories concurrently in the SUID check");
    app.add_flag("--hash-evidence", hash_evidence, "Record SHA-256 of every flagged file");

    auto* verbose_flag = app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("-q,--quiet", quiet, "Only log warnings and errors")
        ->excludes(verbose_flag);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e) == 0 ? kExitClean : kExitError;
    }

    // Configure logging level and format
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Verbose logging enabled");
    } else if (quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (!quiet) {
        PrintBanner();
    }

    try {
        auto confidence = nsioc::core::ParseConfidence(min_confidence);
        if (!confidence) {
            spdlog::error("Invalid minimum confidence: {}", min_confidence);
            return kExitError;
        }

        std::optional<nsioc::fs::Timestamp> install_override;
        if (!install_time.empty()) {
            install_override = nsioc::utils::StringUtils::ParseTimestamp(install_time);
            if (!install_override) {
                spdlog::error("Invalid install time: {}", install_time);
                return kExitError;
            }
        }

        auto rules = rules_file.empty() ? nsioc::config::SharedDefaultRules()
                                        : nsioc::config::LoadRules(rules_file);

        nsioc::core::DetectionConfig config;
        config.parallel_suid_walk = parallel;
        config.hash_evidence = hash_evidence;

        nsioc::core::DetectionEngine engine(rules, config);

        nsioc::reporters::ConsoleReporterConfig console_config;
        console_config.min_confidence = *confidence;
        nsioc::reporters::ConsoleReporter console(std::cout, console_config);

        std::vector<nsioc::core::ScanResult> results;
        std::vector<nsioc::core::TargetError> errors;
        bool any_findings = false;

        // Targets are independent; a failure to open one does not stop the rest
        for (const auto& text : targets) {
            try {
                auto spec = nsioc::core::TargetSpec::Parse(text);
                auto target = nsioc::core::Target::Open(spec, rules->fingerprint, install_override);

                auto result = engine.Run(target);
                console.PrintScanResult(result);

                if (!nsioc::core::FilterByConfidence(result.findings, *confidence).empty()) {
                    any_findings = true;
                }
                results.push_back(std::move(result));

            } catch (const nsioc::core::TargetOpenError& e) {
                spdlog::error("Cannot open target {}: {}", text, e.what());
                errors.push_back({text, e.what()});
                console.PrintTargetError(errors.back());
            }
        }

        console.PrintFooter(targets.size(), errors.size());

        if (!json_file.empty()) {
            nsioc::reporters::JsonReporterConfig json_config;
            json_config.min_confidence = *confidence;
            nsioc::reporters::JsonReporter json_reporter(json_config);
            if (!json_reporter.SaveReport(results, errors, json_file)) {
                return kExitError;
            }
        }

        if (!errors.empty()) {
            return kExitError;
        }
        return any_findings ? kExitFindings : kExitClean;

    } catch (const nsioc::config::RulesError& e) {
        spdlog::error("Rules error: {}", e.what());
        return kExitError;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return kExitError;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitError;
    }
}
