#include "nsioc/fs/filesystem_view.hpp"

#include <gtest/gtest.h>

using namespace nsioc::fs;

TEST(NormalizePathTest, CollapsesSeparatorsAndDots) {
    EXPECT_EQ(NormalizePath("/"), "/");
    EXPECT_EQ(NormalizePath("/var/vpn/"), "/var/vpn");
    EXPECT_EQ(NormalizePath("//var///netscaler/./logon"), "/var/netscaler/logon");
}

TEST(NormalizePathTest, RejectsRelativeAndParentComponents) {
    EXPECT_THROW(NormalizePath(""), std::invalid_argument);
    EXPECT_THROW(NormalizePath("var/vpn"), std::invalid_argument);
    EXPECT_THROW(NormalizePath("/var/../etc/passwd"), std::invalid_argument);
}

TEST(PathHelpersTest, ParentPath) {
    EXPECT_EQ(ParentPath("/var/vpn/config.php"), "/var/vpn");
    EXPECT_EQ(ParentPath("/var"), "/");
    EXPECT_EQ(ParentPath("/"), "/");
}

TEST(PathHelpersTest, JoinPath) {
    EXPECT_EQ(JoinPath("/", "var"), "/var");
    EXPECT_EQ(JoinPath("/var", "vpn"), "/var/vpn");
    EXPECT_EQ(JoinPath("/var/", "vpn"), "/var/vpn");
}

TEST(PathHelpersTest, IsWithinRespectsComponentBoundaries) {
    EXPECT_TRUE(IsWithin("/var/vpn/a.php", "/var/vpn"));
    EXPECT_TRUE(IsWithin("/var/vpn", "/var/vpn"));
    EXPECT_TRUE(IsWithin("/etc", "/"));
    EXPECT_FALSE(IsWithin("/var/vpnx/a.php", "/var/vpn"));
    EXPECT_FALSE(IsWithin("/var", "/var/vpn"));
}
