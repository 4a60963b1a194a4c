/**
 * @file ioc_rules.cpp
 * @brief Default rule tables and JSON rules file loading
 *
 * **Rules File Format** (every key optional, each replaces the default table):
 * ```json
 * {
 *   "webshell_paths": ["/var/netscaler/logon/", "/var/vpn/"],
 *   "file_classes": {".php": "0444"},
 *   "php_signatures": ["eval($_", "base64_decode("],
 *   "max_content_bytes": 2048,
 *   "signature_display_length": 40,
 *   "timestomp_paths": ["/var/vpn/", "/var/tmp"],
 *   "timestomp_threshold_seconds": 1209600,
 *   "crontab_paths": ["/etc/crontab", "/var/cron/tabs"],
 *   "system_crontabs": ["/etc/crontab"],
 *   "crontab_patterns": [{"name": "/var/tmp", "regex": "/var/tmp", "confidence": "medium"}],
 *   "suspicious_cron_users": ["nobody"],
 *   "max_crontab_bytes": 1048576,
 *   "max_command_length": 4096,
 *   "suid_allowlist": ["/usr/bin/su"],
 *   "install_markers": ["/flash/.version"]
 * }
 * ```
 *
 * @date 2025
 */

#include "nsioc/config/ioc_rules.hpp"
#include "nsioc/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <regex>
#include <sstream>

using json = nlohmann::json;

namespace nsioc {
namespace config {

namespace {

// Setuid binaries shipped with the appliance firmware (FreeBSD base + NetScaler
// tools) and with the Linux-based SVM/SDX management images.
const char* const kKnownSuidBinaries[] = {
    "/netscaler/ping",
    "/netscaler/ping6",
    "/netscaler/traceroute",
    "/netscaler/traceroute6",
    "/sbin/mksnap_ffs",
    "/sbin/shutdown",
    "/sbin/poweroff",
    "/usr/bin/crontab",
    "/usr/bin/lock",
    "/usr/bin/login",
    "/usr/bin/passwd",
    "/usr/bin/yppasswd",
    "/usr/bin/su",
    "/usr/libexec/ssh-keysign",
    "/bin/umount",
    "/bin/ping",
    "/bin/mount",
    "/bin/su",
    "/bin/ping6",
    "/lib64/dbus-1/dbus-daemon-launch-helper",
    "/usr/bin/atq",
    "/usr/bin/at",
    "/usr/bin/sudo",
    "/usr/bin/newgrp",
    "/usr/bin/chsh",
    "/usr/bin/sg",
    "/usr/bin/gpasswd",
    "/usr/bin/chfn",
    "/usr/bin/sudoedit",
    "/usr/bin/staprun",
    "/usr/bin/atrm",
    "/usr/bin/chage",
    "/usr/libexec/openssh/ssh-keysign",
    "/usr/sbin/userhelper",
    "/usr/sbin/usernetctl",
    "/usr/sbin/ping6",
    "/opt/likewise/bin/ksu",
    "/sbin/umount.nfs",
    "/sbin/pam_timestamp_check",
    "/sbin/unix_chkpwd",
    "/sbin/mount.nfs",
    "/sbin/mount.nfs4",
    "/sbin/umount.nfs4",
};

std::vector<std::string> StringList(const json& value, const std::string& key) {
    if (!value.is_array()) {
        throw RulesError("'" + key + "' must be an array of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw RulesError("'" + key + "' must contain only strings");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

std::size_t PositiveSize(const json& value, const std::string& key) {
    if (!value.is_number_unsigned() || value.get<std::uint64_t>() == 0) {
        throw RulesError("'" + key + "' must be a positive integer");
    }
    return static_cast<std::size_t>(value.get<std::uint64_t>());
}

CrontabPattern ParsePattern(const json& value) {
    if (!value.is_object() || !value.contains("name") || !value.contains("regex") ||
        !value["name"].is_string() || !value["regex"].is_string()) {
        throw RulesError("'crontab_patterns' entries need string 'name' and 'regex'");
    }

    CrontabPattern pattern;
    pattern.name = value["name"].get<std::string>();
    pattern.regex = value["regex"].get<std::string>();

    if (value.contains("confidence")) {
        if (!value["confidence"].is_string()) {
            throw RulesError("'confidence' of pattern '" + pattern.name + "' must be a string");
        }
        auto confidence = core::ParseConfidence(value["confidence"].get<std::string>());
        if (!confidence) {
            throw RulesError("Unknown confidence for pattern '" + pattern.name + "'");
        }
        pattern.confidence = *confidence;
    }

    try {
        std::regex compiled(pattern.regex);
    } catch (const std::regex_error& e) {
        throw RulesError("Invalid regex for pattern '" + pattern.name + "': " + e.what());
    }
    return pattern;
}

} // anonymous namespace

// ============================================================================
// DEFAULT RULES
// ============================================================================

IocRules DefaultRules() {
    IocRules rules;

    rules.webshell.paths = {
        "/var/netscaler/logon/",
        "/var/vpn/",
        "/var/netscaler/ns_gui/",
    };
    rules.webshell.file_classes = {{".php", 0444}};
    rules.webshell.signatures = {
        "eval($_",
        "base64_decode(",
        "http_status_code(",
        "array_filter(",
    };

    rules.timestomp.paths = rules.webshell.paths;
    rules.timestomp.paths.push_back("/var/tmp");

    rules.cronjob.paths = {
        "/etc/crontab",
        "/etc/cron.d",
        "/var/cron/tabs",
        "/var/spool/cron",
        "/var/spool/cron/crontabs",
        "/nsconfig/crontab",
        "/flash/nsconfig/crontab",
    };
    rules.cronjob.system_crontabs = {"/etc/crontab", "/etc/cron.d"};
    rules.cronjob.patterns = {
        {"ip address", R"(\b(?:[0-9]{1,3}\.){3}[0-9]{1,3}\b)", core::Confidence::MEDIUM},
        {"/var/tmp", "/var/tmp", core::Confidence::MEDIUM},
        {"nobody user", "nobody", core::Confidence::MEDIUM},
        {"temporary path", R"((^|[\s;|&'"=<>])/(tmp|dev/shm)/)", core::Confidence::MEDIUM},
        {"download utility", R"((^|[\s;|&/'"(])(curl|wget|fetch|tftp|ncat|nc)(\s|$))",
         core::Confidence::HIGH},
        {"inline interpreter",
         R"(\b(python[23]?\s+-c|perl\s+-e|ruby\s+-e|php\s+-r|(ba|z|k|c)?sh\s+-i)\b)",
         core::Confidence::HIGH},
        {"base64 payload", R"(base64\s+(-d|-D|--decode)|base64_decode|[A-Za-z0-9+/]{40,}={0,2})",
         core::Confidence::HIGH},
    };
    rules.cronjob.suspicious_users = {"nobody"};

    rules.suid.allowlist.insert(std::begin(kKnownSuidBinaries), std::end(kKnownSuidBinaries));

    rules.fingerprint.os_markers = {"/netscaler", "/flash/nsconfig", "/nsconfig/ns.conf"};
    rules.fingerprint.config_files = {"/flash/nsconfig/ns.conf", "/nsconfig/ns.conf"};
    rules.fingerprint.install_markers = {"/flash/.version", "/var/nsinstall"};
    rules.fingerprint.activity_logs = {"/var/log/ns.log", "/var/log/messages", "/var/nslog/newnslog"};

    return rules;
}

std::shared_ptr<const IocRules> SharedDefaultRules() {
    static const std::shared_ptr<const IocRules> defaults =
        std::make_shared<const IocRules>(DefaultRules());
    return defaults;
}

// ============================================================================
// JSON OVERRIDES
// ============================================================================

IocRules ApplyRulesJson(const std::string& json_text, IocRules base) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw RulesError(std::string("Rules file is not valid JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw RulesError("Rules document must be a JSON object");
    }

    for (const auto& [key, value] : j.items()) {
        if (key == "webshell_paths") {
            base.webshell.paths = StringList(value, key);
        } else if (key == "file_classes") {
            if (!value.is_object()) {
                throw RulesError("'file_classes' must map extensions to octal mode strings");
            }
            base.webshell.file_classes.clear();
            for (const auto& [extension, mode] : value.items()) {
                if (!mode.is_string()) {
                    throw RulesError("Mode of file class '" + extension + "' must be a string");
                }
                base.webshell.file_classes[utils::StringUtils::ToLower(extension)] =
                    ParseOctalMode(mode.get<std::string>());
            }
        } else if (key == "php_signatures") {
            base.webshell.signatures = StringList(value, key);
        } else if (key == "max_content_bytes") {
            base.webshell.max_content_bytes = PositiveSize(value, key);
        } else if (key == "signature_display_length") {
            base.webshell.signature_display_length = PositiveSize(value, key);
        } else if (key == "timestomp_paths") {
            base.timestomp.paths = StringList(value, key);
        } else if (key == "timestomp_threshold_seconds") {
            base.timestomp.threshold = std::chrono::seconds(PositiveSize(value, key));
        } else if (key == "crontab_paths") {
            base.cronjob.paths = StringList(value, key);
        } else if (key == "system_crontabs") {
            base.cronjob.system_crontabs = StringList(value, key);
        } else if (key == "crontab_patterns") {
            if (!value.is_array()) {
                throw RulesError("'crontab_patterns' must be an array");
            }
            base.cronjob.patterns.clear();
            for (const auto& item : value) {
                base.cronjob.patterns.push_back(ParsePattern(item));
            }
        } else if (key == "suspicious_cron_users") {
            auto users = StringList(value, key);
            base.cronjob.suspicious_users = {users.begin(), users.end()};
        } else if (key == "max_crontab_bytes") {
            base.cronjob.max_crontab_bytes = PositiveSize(value, key);
        } else if (key == "max_command_length") {
            base.cronjob.max_command_length = PositiveSize(value, key);
        } else if (key == "suid_allowlist") {
            auto allowlist = StringList(value, key);
            base.suid.allowlist = {allowlist.begin(), allowlist.end()};
        } else if (key == "install_markers") {
            base.fingerprint.install_markers = StringList(value, key);
        } else {
            spdlog::warn("Ignoring unknown rules key '{}'", key);
        }
    }

    return base;
}

std::shared_ptr<const IocRules> LoadRules(const std::filesystem::path& rules_file) {
    std::ifstream file(rules_file);
    if (!file.is_open()) {
        throw RulesError("Cannot open rules file: " + rules_file.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto rules = ApplyRulesJson(buffer.str(), DefaultRules());
    spdlog::info("Loaded rules from {}", rules_file.string());
    spdlog::debug("  {} webshell paths, {} signatures, {} cron patterns, {} allowlisted SUID binaries",
                  rules.webshell.paths.size(), rules.webshell.signatures.size(),
                  rules.cronjob.patterns.size(), rules.suid.allowlist.size());
    return std::make_shared<const IocRules>(std::move(rules));
}

std::uint32_t ParseOctalMode(const std::string& text) {
    auto digits = utils::StringUtils::Trim(text);
    if (utils::StringUtils::StartsWith(digits, "0o") || utils::StringUtils::StartsWith(digits, "0O")) {
        digits = digits.substr(2);
    }
    if (digits.empty() || digits.size() > 5 ||
        digits.find_first_not_of("01234567") != std::string::npos) {
        throw RulesError("Invalid octal mode: '" + text + "'");
    }
    auto mode = static_cast<std::uint32_t>(std::stoul(digits, nullptr, 8));
    if (mode > 07777) {
        throw RulesError("Octal mode out of range: '" + text + "'");
    }
    return mode;
}

} // namespace config
} // namespace nsioc
