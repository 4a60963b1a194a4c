#include "nsioc/analyzers/host_fingerprint.hpp"
#include "nsioc/fs/memory_filesystem.hpp"

#include <gtest/gtest.h>

using namespace nsioc;
using analyzers::HostFingerprint;

namespace {

fs::Timestamp At(std::int64_t seconds) {
    return fs::Timestamp(std::chrono::seconds(seconds));
}

const char* const kNsConf =
    "#NS13.1 Build 49.15\n"
    "# Last modified by `save config`, Mon Jul 21 10:00:00 2025\n"
    "set ns config -IPAddress 192.0.2.10 -netmask 255.255.255.0\n"
    "set ns hostName \"gw-ams-01\"\n"
    "add ns ip 192.0.2.11 255.255.255.0 -vServer DISABLED\n";

} // namespace

class HostFingerprintTest : public ::testing::Test {
protected:
    void SetUp() override {
        rules_ = config::DefaultRules().fingerprint;
    }

    config::FingerprintRules rules_;
    fs::MemoryFileSystem view_;
};

TEST_F(HostFingerprintTest, FullNetScalerImage) {
    view_.AddDirectory("/netscaler");
    view_.AddFile("/flash/nsconfig/ns.conf", kNsConf);
    view_.AddFile("/flash/.version", "NS13.1: Build 49.15.nc");
    view_.SetTimes("/flash/.version", At(1700000000), At(1700000500), At(1690000000));
    view_.AddDirectory("/var/nsinstall");
    view_.SetTimes("/var/nsinstall", At(1695000000), At(1695000000), std::nullopt);
    view_.AddFile("/var/log/ns.log", "");
    view_.SetTimes("/var/log/ns.log", At(1753000000), At(1753000000), std::nullopt);
    view_.AddFile("/var/log/messages", "");
    view_.SetTimes("/var/log/messages", At(1752000000), At(1752000000), std::nullopt);

    auto info = HostFingerprint(rules_).Collect(view_, "case-42/root");

    EXPECT_EQ(info.name, "case-42/root");
    EXPECT_EQ(info.os, "citrix-netscaler");
    EXPECT_EQ(info.hostname, "gw-ams-01");
    EXPECT_EQ(info.version, "13.1-49.15");
    EXPECT_EQ(info.install_time, At(1690000000));
    EXPECT_EQ(info.last_activity, At(1753000000));
    EXPECT_TRUE(info.advisory.parsed);
    EXPECT_EQ(info.advisory.vulnerable.size(), 6u);
}

TEST_F(HostFingerprintTest, UnknownSystem) {
    view_.AddFile("/etc/os-release", "ID=debian\n");

    auto info = HostFingerprint(rules_).Collect(view_, "other");
    EXPECT_EQ(info.os, "unknown");
    EXPECT_FALSE(info.hostname.has_value());
    EXPECT_FALSE(info.version.has_value());
    EXPECT_FALSE(info.install_time.has_value());
    EXPECT_FALSE(info.last_activity.has_value());
    EXPECT_FALSE(info.advisory.parsed);
}

TEST_F(HostFingerprintTest, FallsBackToSecondConfigWhenFirstUnreadable) {
    view_.AddFile("/flash/nsconfig/ns.conf", kNsConf).content_readable = false;
    view_.AddFile("/nsconfig/ns.conf", "#NS14.1 Build 47.48\nset ns hostName edge\n");

    auto info = HostFingerprint(rules_).Collect(view_, "t");
    EXPECT_EQ(info.version, "14.1-47.48");
    EXPECT_EQ(info.hostname, "edge");
    EXPECT_TRUE(info.advisory.vulnerable.empty());
}

TEST_F(HostFingerprintTest, ChangeTimeUsedWhenBirthTimeMissing) {
    view_.AddDirectory("/var/nsinstall");
    view_.SetTimes("/var/nsinstall", At(1695000000), At(1694000000), std::nullopt);

    auto info = HostFingerprint(rules_).Collect(view_, "t");
    EXPECT_EQ(info.install_time, At(1694000000));
}

TEST(HostFingerprintParseTest, VersionHeader) {
    EXPECT_EQ(HostFingerprint::ParseVersionHeader("#NS13.1 Build 49.15"), "13.1-49.15");
    EXPECT_EQ(HostFingerprint::ParseVersionHeader("#NS12.1 Build 55.328"), "12.1-55.328");
    EXPECT_FALSE(HostFingerprint::ParseVersionHeader("# NS13.1 Build 49.15").has_value());
    EXPECT_FALSE(HostFingerprint::ParseVersionHeader("set ns hostName x").has_value());
}

TEST(HostFingerprintParseTest, HostnameLine) {
    EXPECT_EQ(HostFingerprint::ParseHostnameLine("set ns hostName gw01"), "gw01");
    EXPECT_EQ(HostFingerprint::ParseHostnameLine("set ns HOSTNAME \"gw01\""), "gw01");
    EXPECT_FALSE(HostFingerprint::ParseHostnameLine("set ns config -IPAddress 1.2.3.4").has_value());
    EXPECT_FALSE(HostFingerprint::ParseHostnameLine("set ns hostName").has_value());
}
