#include "nsioc/checks/suid_check.hpp"
#include "nsioc/fs/memory_filesystem.hpp"

#include <gtest/gtest.h>

using namespace nsioc;
using core::Confidence;
using core::FindingKind;

class SuidCheckTest : public ::testing::Test {
protected:
    void SetUp() override {
        rules_ = config::DefaultRules().suid;
        view_.AddFile("/usr/bin/su", "", 04555);
        view_.AddFile("/usr/bin/passwd", "", 04555);
        view_.AddFile("/bin/ls", "", 0555);
        view_.AddFile("/netscaler/ping", "", 04555);
    }

    config::SuidRules rules_;
    fs::MemoryFileSystem view_;
};

TEST_F(SuidCheckTest, AllowlistedBinariesAreSilent) {
    auto result = checks::CheckSuidBinaries(view_, rules_);
    EXPECT_TRUE(result.findings.empty());
    EXPECT_EQ(result.entries_examined, 4u);
    EXPECT_EQ(result.check_name, "suid");
}

TEST_F(SuidCheckTest, UnknownSetuidBinaryIsMedium) {
    view_.AddFile("/var/tmp/sh", "", 04755);

    auto result = checks::CheckSuidBinaries(view_, rules_);
    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings[0].Kind(), FindingKind::BINARY_SUID);
    EXPECT_EQ(result.findings[0].GetConfidence(), Confidence::MEDIUM);
    EXPECT_EQ(result.findings[0].Message(), "Binary with SUID bit set observed (mode 4755)");
    EXPECT_EQ(result.findings[0].Path(), "/var/tmp/sh");
}

TEST_F(SuidCheckTest, AllowlistIsExactPathMatch) {
    view_.AddFile("/var/tmp/usr/bin/su", "", 04555);

    auto result = checks::CheckSuidBinaries(view_, rules_);
    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings[0].Path(), "/var/tmp/usr/bin/su");
}

TEST_F(SuidCheckTest, SetgidAloneIsNotReported) {
    view_.AddFile("/usr/bin/wall", "", 02555);
    EXPECT_TRUE(checks::CheckSuidBinaries(view_, rules_).findings.empty());
}

TEST_F(SuidCheckTest, NonRegularEntriesAreIgnored) {
    view_.AddSpecial("/dev/weird", fs::FileType::CHARACTER_DEVICE, 04666);
    view_.AddDirectory("/var/odd", 04755);

    auto result = checks::CheckSuidBinaries(view_, rules_);
    EXPECT_TRUE(result.findings.empty());
}

TEST_F(SuidCheckTest, ParallelWalkMatchesSequential) {
    view_.AddFile("/var/tmp/sh", "", 04755);
    view_.AddFile("/flash/b", "", 06711);
    view_.AddFile("/topfile", "", 04700);

    auto sequential = checks::CheckSuidBinaries(view_, rules_, false);
    auto parallel = checks::CheckSuidBinaries(view_, rules_, true);

    EXPECT_EQ(sequential.findings, parallel.findings);
    EXPECT_EQ(sequential.entries_examined, parallel.entries_examined);
    ASSERT_EQ(parallel.findings.size(), 3u);
    EXPECT_EQ(parallel.findings[0].Path(), "/flash/b");
    EXPECT_EQ(parallel.findings[0].Message(), "Binary with SUID bit set observed (mode 6711)");
}

TEST_F(SuidCheckTest, MissingRootReducesCoverage) {
    rules_.root = "/nonexistent";

    auto result = checks::CheckSuidBinaries(view_, rules_);
    EXPECT_TRUE(result.findings.empty());
    EXPECT_TRUE(result.coverage_reduced);
}
