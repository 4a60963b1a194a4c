/**
 * @file cronjob_check.cpp
 * @brief Implementation of the cronjob check
 *
 * Post-exploitation on NetScaler commonly re-plants a webshell or starts a
 * reverse shell from cron, because /var and /flash survive the reboot that
 * resets the memory-backed root volume. Cron runs those jobs as `nobody`
 * when dropped through the web server.
 *
 * @date 2025
 */

#include "nsioc/checks/cronjob_check.hpp"
#include "nsioc/parsers/crontab_parser.hpp"
#include "nsioc/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <regex>
#include <set>

namespace nsioc {
namespace checks {

using utils::StringUtils;

namespace {

struct CompiledPattern {
    const config::CrontabPattern* pattern;
    std::regex regex;
};

struct DefinitionFile {
    std::string path;
    bool system;            ///< Entries carry a user column
    std::string owner;      ///< Owner implied by the file name, user crontabs only
};

bool IsSystemCrontab(const std::string& path, const std::vector<std::string>& system_crontabs) {
    for (const auto& system : system_crontabs) {
        if (path == system || fs::IsWithin(path, system)) {
            return true;
        }
    }
    return false;
}

std::vector<DefinitionFile> CollectDefinitionFiles(const fs::FileSystemView& view,
                                                   const config::CronjobRules& rules,
                                                   bool& any_location) {
    std::vector<DefinitionFile> files;
    std::set<std::string> seen;

    for (const auto& path : rules.paths) {
        auto stat = view.Stat(path);
        if (!stat) {
            spdlog::debug("Crontab location not present in target: {}", path);
            continue;
        }
        any_location = true;

        if (stat->IsRegular()) {
            if (seen.insert(path).second) {
                files.push_back({path, IsSystemCrontab(path, rules.system_crontabs), ""});
            }
            continue;
        }

        if (!stat->IsDirectory()) {
            continue;
        }

        const bool system = IsSystemCrontab(path, rules.system_crontabs);
        for (const auto& entry : view.List(path, false)) {
            if (!entry.stat.IsRegular() || !seen.insert(entry.path).second) {
                continue;
            }
            auto name = entry.path.substr(entry.path.find_last_of('/') + 1);
            files.push_back({entry.path, system, system ? "" : name});
        }
    }

    spdlog::debug("Found {} crontab definition file(s)", files.size());
    return files;
}

} // anonymous namespace

CheckResult CheckCronjobs(const fs::FileSystemView& view, const config::CronjobRules& rules) {
    CheckResult result;
    result.check_name = "cronjob";

    std::vector<CompiledPattern> patterns;
    patterns.reserve(rules.patterns.size());
    for (const auto& pattern : rules.patterns) {
        try {
            patterns.push_back({&pattern, std::regex(pattern.regex, std::regex::ECMAScript)});
        } catch (const std::regex_error& e) {
            throw config::RulesError("Invalid crontab pattern '" + pattern.name + "': " + e.what());
        }
    }

    parsers::CrontabParser parser;

    bool any_location = false;
    auto files = CollectDefinitionFiles(view, rules, any_location);
    if (!any_location) {
        result.ReduceCoverage("None of the crontab locations exist in this target");
    }

    for (const auto& file : files) {
        std::string content;
        try {
            content = view.Read(file.path, rules.max_crontab_bytes);
        } catch (const fs::NotReadableError& e) {
            spdlog::warn("Cannot read crontab {}: {}", file.path, e.what());
            result.ReduceCoverage("Crontab not readable: " + file.path);
            continue;
        }

        parsers::CrontabParseResult parsed;
        try {
            parsed = parser.Parse(content, file.system);
        } catch (const parsers::MalformedDefinitionError& e) {
            spdlog::warn("Skipping malformed crontab {}: {}", file.path, e.what());
            result.ReduceCoverage("Malformed crontab: " + file.path);
            continue;
        }

        result.entries_examined++;
        if (!parsed.malformed_lines.empty()) {
            result.ReduceCoverage(file.path + ": " + std::to_string(parsed.malformed_lines.size()) +
                                  " malformed line(s) skipped");
        }

        for (const auto& entry : parsed.entries) {
            // std::regex recurses per character; unbounded input exhausts the stack
            std::string command = entry.command;
            if (command.size() > rules.max_command_length) {
                spdlog::warn("Crontab command at {}:{} is {} bytes; matching the first {} only",
                             file.path, entry.line_number, command.size(), rules.max_command_length);
                result.ReduceCoverage(file.path + ":" + std::to_string(entry.line_number) +
                                      ": command longer than " + std::to_string(rules.max_command_length) +
                                      " bytes only partially matched");
                command.resize(rules.max_command_length);
            }

            const auto& owner = file.system ? entry.user : file.owner;
            if (!owner.empty() && rules.suspicious_users.count(owner) > 0) {
                result.findings.emplace_back(
                    core::FindingKind::CRONJOB_USER,
                    "Crontab by " + owner + " user observed: " + StringUtils::Sanitize(command),
                    core::Confidence::HIGH,
                    file.path);
            }

            for (const auto& compiled : patterns) {
                std::smatch match;
                if (!std::regex_search(command, match, compiled.regex)) {
                    continue;
                }
                result.findings.emplace_back(
                    core::FindingKind::CRONJOB_SUSPICIOUS,
                    compiled.pattern->name + " in crontab command (" + StringUtils::Sanitize(match.str(0)) +
                        "): " + StringUtils::Sanitize(command),
                    compiled.pattern->confidence,
                    file.path);
            }
        }
    }

    return result;
}

} // namespace checks
} // namespace nsioc
