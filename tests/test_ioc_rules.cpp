#include "nsioc/config/ioc_rules.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <random>
#include <regex>

using namespace nsioc::config;
using nsioc::core::Confidence;

TEST(IocRulesTest, DefaultTablesArePopulated) {
    auto rules = DefaultRules();

    EXPECT_EQ(rules.webshell.paths.size(), 3u);
    EXPECT_EQ(rules.webshell.file_classes.at(".php"), 0444u);
    EXPECT_EQ(rules.webshell.signatures.size(), 4u);
    EXPECT_EQ(rules.timestomp.paths.back(), "/var/tmp");
    EXPECT_EQ(rules.timestomp.threshold, std::chrono::seconds(14 * 86400));
    EXPECT_EQ(rules.cronjob.suspicious_users.count("nobody"), 1u);
    EXPECT_EQ(rules.suid.root, "/");
    EXPECT_EQ(rules.suid.allowlist.count("/usr/bin/su"), 1u);
    EXPECT_EQ(rules.suid.allowlist.count("/netscaler/ping"), 1u);
    EXPECT_EQ(rules.suid.allowlist.count("/tmp/sh"), 0u);
}

TEST(IocRulesTest, DefaultPatternsCompile) {
    auto rules = DefaultRules();
    for (const auto& pattern : rules.cronjob.patterns) {
        EXPECT_NO_THROW({ std::regex compiled(pattern.regex, std::regex::ECMAScript); }) << pattern.name;
    }
}

TEST(IocRulesTest, SharedDefaultsAreSingleInstance) {
    EXPECT_EQ(SharedDefaultRules().get(), SharedDefaultRules().get());
}

TEST(IocRulesTest, JsonOverridesOnlyNamedTables) {
    auto rules = ApplyRulesJson(R"({
        "php_signatures": ["passthru("],
        "file_classes": {".PHP": "0440", ".phtml": "0o444"},
        "timestomp_threshold_seconds": 3600,
        "crontab_patterns": [{"name": "reverse shell", "regex": "/dev/tcp/", "confidence": "high"}],
        "suid_allowlist": ["/usr/bin/su"],
        "max_command_length": 512
    })", DefaultRules());

    EXPECT_EQ(rules.webshell.signatures, std::vector<std::string>{"passthru("});
    EXPECT_EQ(rules.webshell.file_classes.at(".php"), 0440u);
    EXPECT_EQ(rules.webshell.file_classes.at(".phtml"), 0444u);
    EXPECT_EQ(rules.timestomp.threshold, std::chrono::seconds(3600));
    ASSERT_EQ(rules.cronjob.patterns.size(), 1u);
    EXPECT_EQ(rules.cronjob.patterns[0].confidence, Confidence::HIGH);
    EXPECT_EQ(rules.suid.allowlist.size(), 1u);
    EXPECT_EQ(rules.cronjob.max_command_length, 512u);

    // Untouched tables keep their defaults
    EXPECT_EQ(rules.webshell.paths, DefaultRules().webshell.paths);
    EXPECT_EQ(rules.cronjob.paths, DefaultRules().cronjob.paths);
}

TEST(IocRulesTest, InvalidDocumentsAreRejected) {
    EXPECT_THROW(ApplyRulesJson("{not json", DefaultRules()), RulesError);
    EXPECT_THROW(ApplyRulesJson("[]", DefaultRules()), RulesError);
    EXPECT_THROW(ApplyRulesJson(R"({"webshell_paths": "/var/vpn"})", DefaultRules()), RulesError);
    EXPECT_THROW(ApplyRulesJson(R"({"max_content_bytes": 0})", DefaultRules()), RulesError);
    EXPECT_THROW(ApplyRulesJson(R"({"file_classes": {".php": "999"}})", DefaultRules()), RulesError);
    EXPECT_THROW(ApplyRulesJson(R"({"crontab_patterns": [{"name": "bad", "regex": "(["}]})",
                                DefaultRules()), RulesError);
    EXPECT_THROW(ApplyRulesJson(R"({"crontab_patterns": [{"name": "x", "regex": "x", "confidence": "severe"}]})",
                                DefaultRules()), RulesError);
}

TEST(IocRulesTest, UnknownKeysAreIgnored) {
    auto rules = ApplyRulesJson(R"({"comment": "site rules"})", DefaultRules());
    EXPECT_EQ(rules.webshell.signatures.size(), 4u);
}

TEST(IocRulesTest, ParseOctalMode) {
    EXPECT_EQ(ParseOctalMode("0444"), 0444u);
    EXPECT_EQ(ParseOctalMode("4755"), 04755u);
    EXPECT_EQ(ParseOctalMode("0o644"), 0644u);
    EXPECT_THROW(ParseOctalMode(""), RulesError);
    EXPECT_THROW(ParseOctalMode("0x1ff"), RulesError);
    EXPECT_THROW(ParseOctalMode("17777"), RulesError);
}

TEST(IocRulesTest, LoadRulesFromFile) {
    std::random_device rd;
    auto path = std::filesystem::temp_directory_path() / ("nsioc_rules_" + std::to_string(rd()) + ".json");
    {
        std::ofstream out(path);
        out << R"({"suspicious_cron_users": ["nobody", "www"]})";
    }

    auto rules = LoadRules(path);
    EXPECT_EQ(rules->cronjob.suspicious_users.size(), 2u);
    std::filesystem::remove(path);

    EXPECT_THROW(LoadRules(path), RulesError);
}
