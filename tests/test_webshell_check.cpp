#include "nsioc/checks/webshell_check.hpp"
#include "nsioc/fs/memory_filesystem.hpp"

#include <gtest/gtest.h>

using namespace nsioc;
using core::Confidence;
using core::FindingKind;

class WebshellCheckTest : public ::testing::Test {
protected:
    void SetUp() override {
        rules_ = config::DefaultRules().webshell;
        view_.AddDirectory("/var/netscaler/logon");
        view_.AddDirectory("/var/vpn");
        view_.AddDirectory("/var/netscaler/ns_gui");
    }

    config::WebshellRules rules_;
    fs::MemoryFileSystem view_;
};

TEST_F(WebshellCheckTest, CleanInstallHasNoFindings) {
    view_.AddFile("/var/vpn/index.php", "<?php include 'themes/x.php'; ?>", 0444);
    view_.AddFile("/var/vpn/themes/style.css", "body {}", 0644);

    auto result = checks::CheckWebshells(view_, rules_);
    EXPECT_TRUE(result.findings.empty());
    EXPECT_FALSE(result.coverage_reduced);
    EXPECT_EQ(result.entries_examined, 1u);
    EXPECT_EQ(result.check_name, "webshell");
}

TEST_F(WebshellCheckTest, WritablePhpFileIsFlagged) {
    view_.AddFile("/var/netscaler/logon/LogonPoint/shell.php", "<?php echo 1; ?>", 0644);

    auto result = checks::CheckWebshells(view_, rules_);
    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings[0].Kind(), FindingKind::PHP_FILE_PERMISSION);
    EXPECT_EQ(result.findings[0].GetConfidence(), Confidence::HIGH);
    EXPECT_EQ(result.findings[0].Message(), "Suspicious php permission 0644");
    EXPECT_EQ(result.findings[0].Path(), "/var/netscaler/logon/LogonPoint/shell.php");
}

TEST_F(WebshellCheckTest, PermissionAndSignatureBothReported) {
    view_.AddFile("/var/vpn/config.php", "<?php eval($_POST['cmd']); ?>", 0644);

    auto result = checks::CheckWebshells(view_, rules_);
    ASSERT_EQ(result.findings.size(), 2u);
    EXPECT_EQ(result.findings[0].Kind(), FindingKind::PHP_FILE_PERMISSION);
    EXPECT_EQ(result.findings[1].Kind(), FindingKind::PHP_FILE_CONTENTS);
    EXPECT_EQ(result.findings[1].Message(), "Suspicious PHP code 'eval($_'");
    EXPECT_EQ(result.findings[1].GetConfidence(), Confidence::HIGH);
}

TEST_F(WebshellCheckTest, SignatureMatchIsCaseInsensitiveAndPerSignature) {
    view_.AddFile("/var/vpn/a.php", "<?php EVAL($_GET[1]); Base64_Decode($x); ?>", 0444);

    auto result = checks::CheckWebshells(view_, rules_);
    ASSERT_EQ(result.findings.size(), 2u);
    EXPECT_EQ(result.findings[0].Message(), "Suspicious PHP code 'eval($_'");
    EXPECT_EQ(result.findings[1].Message(), "Suspicious PHP code 'base64_decode('");
}

TEST_F(WebshellCheckTest, ExtensionMatchIsCaseInsensitive) {
    view_.AddFile("/var/vpn/SHELL.PHP", "", 0666);

    auto result = checks::CheckWebshells(view_, rules_);
    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings[0].Message(), "Suspicious php permission 0666");
}

TEST_F(WebshellCheckTest, OversizedFilesSkipContentTest) {
    std::string big(rules_.max_content_bytes + 1, 'a');
    big += "eval($_POST";
    view_.AddFile("/var/vpn/big.php", big, 0444);

    auto result = checks::CheckWebshells(view_, rules_);
    EXPECT_TRUE(result.findings.empty());
    EXPECT_EQ(result.entries_examined, 1u);
}

TEST_F(WebshellCheckTest, UnreadableContentReducesCoverage) {
    view_.AddFile("/var/vpn/locked.php", "<?php eval($_POST[0]); ?>", 0444).content_readable = false;

    auto result = checks::CheckWebshells(view_, rules_);
    EXPECT_TRUE(result.findings.empty());
    EXPECT_TRUE(result.coverage_reduced);
}

TEST_F(WebshellCheckTest, NonRegularEntriesAreIgnored) {
    view_.AddSymlink("/var/vpn/link.php", "/etc/passwd");
    view_.AddSpecial("/var/vpn/pipe.php", fs::FileType::FIFO, 0666);

    auto result = checks::CheckWebshells(view_, rules_);
    EXPECT_TRUE(result.findings.empty());
    EXPECT_EQ(result.entries_examined, 0u);
}

TEST(WebshellCheckStandaloneTest, MissingWebDirectoriesReduceCoverage) {
    fs::MemoryFileSystem view;
    auto result = checks::CheckWebshells(view, config::DefaultRules().webshell);
    EXPECT_TRUE(result.findings.empty());
    EXPECT_TRUE(result.coverage_reduced);
}

TEST(BaselineModeTest, LooksUpByLowercaseExtension) {
    std::map<std::string, std::uint32_t> classes{{".php", 0444}};
    EXPECT_EQ(checks::BaselineModeFor("/var/vpn/a.php", classes), 0444u);
    EXPECT_EQ(checks::BaselineModeFor("/var/vpn/a.PhP", classes), 0444u);
    EXPECT_FALSE(checks::BaselineModeFor("/var/vpn/a.php.bak", classes).has_value());
    EXPECT_FALSE(checks::BaselineModeFor("/var/vpn/.php", classes).has_value());
    EXPECT_FALSE(checks::BaselineModeFor("/var/vpn/README", classes).has_value());
}
