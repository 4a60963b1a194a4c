/**
 * @file ioc_rules.hpp
 * @brief Detection rule tables: monitored paths, signatures, patterns, allowlists
 *
 * All tables the checks consume are gathered in IocRules. The defaults are
 * compiled in and describe a known-good Citrix NetScaler installation; a JSON
 * rules file can override any table. Once loaded the rules are shared as
 * `std::shared_ptr<const IocRules>` and never modified.
 *
 * @date 2025
 */

#pragma once

#include "nsioc/core/finding.hpp"

#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>

namespace nsioc {
namespace config {

/**
 * @class RulesError
 * @brief Rules file is unreadable, not JSON, or has a field of the wrong type
 */
class RulesError : public std::runtime_error {
public:
    explicit RulesError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct CrontabPattern
 * @brief Named regular expression tested against scheduled commands
 */
struct CrontabPattern {
    std::string name;                                   ///< Shown in the finding ("ip address")
    std::string regex;                                  ///< ECMAScript pattern, searched not anchored
    core::Confidence confidence{core::Confidence::MEDIUM};  ///< Confidence of a match
};

/**
 * @struct WebshellRules
 * @brief Inputs of the webshell check
 */
struct WebshellRules {
    std::vector<std::string> paths;                     ///< Web application roots to scan
    std::map<std::string, std::uint32_t> file_classes;  ///< Extension (".php") -> baseline mode
    std::vector<std::string> signatures;                ///< Case-insensitive content substrings
    std::size_t max_content_bytes{2048};                ///< Larger files skip the content test
    std::size_t signature_display_length{40};           ///< Truncation of signatures in messages
};

/**
 * @struct TimestompRules
 * @brief Inputs of the timestomp check
 */
struct TimestompRules {
    std::vector<std::string> paths;                     ///< Trees to inspect
    std::chrono::seconds threshold{60 * 60 * 24 * 7 * 2};  ///< Tolerated timestamp gap (two weeks)
};

/**
 * @struct CronjobRules
 * @brief Inputs of the cronjob check
 */
struct CronjobRules {
    std::vector<std::string> paths;                     ///< Files, or directories whose files are crontabs
    std::vector<std::string> system_crontabs;           ///< Files/directories whose entries carry a user column
    std::vector<CrontabPattern> patterns;               ///< Suspicious command patterns
    std::set<std::string> suspicious_users;             ///< Users that should never own cron entries
    std::size_t max_crontab_bytes{1024 * 1024};         ///< Read bound per definition file
    std::size_t max_command_length{4096};               ///< Longer commands are matched on this prefix only
};

/**
 * @struct SuidRules
 * @brief Inputs of the SUID check
 */
struct SuidRules {
    std::string root{"/"};                              ///< Walk origin
    std::set<std::string> allowlist;                    ///< Setuid binaries of a known-good install
};

/**
 * @struct FingerprintRules
 * @brief Locations used to derive report-header context
 */
struct FingerprintRules {
    std::vector<std::string> os_markers;                ///< Any existing => citrix-netscaler
    std::vector<std::string> config_files;              ///< ns.conf candidates, first readable wins
    std::vector<std::string> install_markers;           ///< Earliest birth/change time = install time
    std::vector<std::string> activity_logs;             ///< Latest mtime = last activity
};

/**
 * @struct IocRules
 * @brief Complete, immutable rule set for one process
 *
 * **Usage Example**:
 * @code
 * auto rules = config::LoadRules("site-rules.json");   // or DefaultRules()
 * auto result = checks::CheckWebshells(view, rules->webshell);
 * @endcode
 */
struct IocRules {
    WebshellRules webshell;
    TimestompRules timestomp;
    CronjobRules cronjob;
    SuidRules suid;
    FingerprintRules fingerprint;
};

/**
 * @brief Compiled-in rule set for Citrix NetScaler images
 */
IocRules DefaultRules();

/**
 * @brief Apply overrides from a parsed JSON document on top of base
 *
 * Recognised keys replace whole tables. Unknown keys are logged and ignored.
 *
 * @param json_text Rules document
 * @param base Rule set to start from
 * @throws RulesError on malformed JSON or wrongly typed values
 */
IocRules ApplyRulesJson(const std::string& json_text, IocRules base);

/**
 * @brief Load DefaultRules() overridden by a JSON rules file
 * @throws RulesError if the file cannot be read or parsed
 */
std::shared_ptr<const IocRules> LoadRules(const std::filesystem::path& rules_file);

/**
 * @brief Shared instance of DefaultRules()
 */
std::shared_ptr<const IocRules> SharedDefaultRules();

/**
 * @brief Parse an octal mode string ("0444", "444", "0o444")
 * @throws RulesError for invalid input
 */
std::uint32_t ParseOctalMode(const std::string& text);

} // namespace config
} // namespace nsioc
