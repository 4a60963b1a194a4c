#include "nsioc/fs/mounted_filesystem.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <random>

#include <fcntl.h>
#include <sys/stat.h>

namespace stdfs = std::filesystem;
using namespace nsioc::fs;

class MountedFileSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        base_ = stdfs::temp_directory_path() / ("nsioc_mount_test_" + std::to_string(rd()));
        stdfs::create_directories(base_ / "root/etc");
        stdfs::create_directories(base_ / "root/var");
        stdfs::create_directories(base_ / "var/vpn/themes");

        WriteFile(base_ / "root/etc/crontab", "0 * * * * root /bin/true\n");
        WriteFile(base_ / "root/var/shadowed.txt", "hidden by the /var mount");
        WriteFile(base_ / "var/vpn/index.php", "<?php echo 1; ?>");
        stdfs::permissions(base_ / "var/vpn/index.php", stdfs::perms::owner_read |
                           stdfs::perms::group_read | stdfs::perms::others_read);
        stdfs::create_symlink("/etc/passwd", base_ / "var/vpn/link");
    }

    void TearDown() override {
        std::error_code ec;
        stdfs::remove_all(base_, ec);
    }

    static void WriteFile(const stdfs::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    MountedFileSystem MakeView() const {
        return MountedFileSystem({{"/", base_ / "root"}, {"/var", base_ / "var"}});
    }

    stdfs::path base_;
};

TEST_F(MountedFileSystemTest, RequiresRootMount) {
    EXPECT_THROW(MountedFileSystem({{"/var", base_ / "var"}}), std::invalid_argument);
}

TEST_F(MountedFileSystemTest, ResolvesLongestMountFirst) {
    auto view = MakeView();
    EXPECT_TRUE(view.Exists("/var/vpn/index.php"));
    EXPECT_FALSE(view.Exists("/var/shadowed.txt"));
    EXPECT_TRUE(view.Exists("/etc/crontab"));
}

TEST_F(MountedFileSystemTest, StatReportsTypeModeAndTimes) {
    auto view = MakeView();

    auto stat = view.Stat("/var/vpn/index.php");
    ASSERT_TRUE(stat.has_value());
    EXPECT_TRUE(stat->IsRegular());
    EXPECT_EQ(stat->mode, 0444u);
    EXPECT_EQ(stat->size, 16u);
    EXPECT_TRUE(stat->mtime.has_value());
    EXPECT_TRUE(stat->ctime.has_value());

    auto link = view.Stat("/var/vpn/link");
    ASSERT_TRUE(link.has_value());
    EXPECT_EQ(link->type, FileType::SYMLINK);

    EXPECT_FALSE(view.Stat("/var/vpn/missing.php").has_value());
}

TEST_F(MountedFileSystemTest, ListRecursesAcrossMountsInPathOrder) {
    auto view = MakeView();
    std::vector<std::string> paths;
    for (const auto& entry : view.List("/", true)) {
        paths.push_back(entry.path);
    }

    const std::vector<std::string> expected{
        "/etc", "/etc/crontab", "/var", "/var/vpn",
        "/var/vpn/index.php", "/var/vpn/link", "/var/vpn/themes"};
    EXPECT_EQ(paths, expected);
}

TEST_F(MountedFileSystemTest, ReadFollowsBoundAndRejectsNonRegular) {
    auto view = MakeView();
    EXPECT_EQ(view.Read("/var/vpn/index.php", 5), "<?php");
    EXPECT_THROW(view.Read("/var/vpn/link", 100), NotReadableError);
    EXPECT_THROW(view.Read("/var/vpn", 100), NotReadableError);
    EXPECT_THROW(view.Read("/nope", 100), NotReadableError);
}

TEST_F(MountedFileSystemTest, DeepMountCreatesIntermediateDirectories) {
    MountedFileSystem view({{"/", base_ / "root"}, {"/flash/nsconfig", base_ / "var"}});

    auto stat = view.Stat("/flash");
    ASSERT_TRUE(stat.has_value());
    EXPECT_TRUE(stat->IsDirectory());

    auto children = view.List("/flash", false);
    ASSERT_EQ(children.size(), 1u);
    EXPECT_EQ(children[0].path, "/flash/nsconfig");
}

TEST_F(MountedFileSystemTest, FinalSymlinkIsReportedButNotEntered) {
    stdfs::create_directory_symlink("themes", base_ / "var/vpn/themes_link");
    WriteFile(base_ / "var/vpn/themes/default.css", "body {}");
    auto view = MakeView();

    std::vector<std::string> paths;
    for (const auto& entry : view.List("/var/vpn", true)) {
        paths.push_back(entry.path);
    }
    const std::vector<std::string> expected{
        "/var/vpn/index.php", "/var/vpn/link", "/var/vpn/themes",
        "/var/vpn/themes/default.css", "/var/vpn/themes_link"};
    EXPECT_EQ(paths, expected);
    EXPECT_TRUE(view.List("/var/vpn/themes_link", true).empty());
    EXPECT_EQ(view.Stat("/var/vpn/themes_link")->type, FileType::SYMLINK);
}

TEST_F(MountedFileSystemTest, AbsoluteIntermediateSymlinkStaysInsideTarget) {
    // Host directory outside every mounted volume
    auto outside = base_ / "outside";
    stdfs::create_directories(outside / "vpn");
    WriteFile(outside / "vpn/hostfile.php", "<?php eval($_POST['x']); ?>");
    stdfs::create_directory_symlink(outside, base_ / "var/netscaler");
    auto view = MakeView();

    EXPECT_FALSE(view.Exists("/var/netscaler/vpn"));
    EXPECT_FALSE(view.Exists("/var/netscaler/vpn/hostfile.php"));
    EXPECT_FALSE(view.Stat("/var/netscaler/vpn/hostfile.php").has_value());
    EXPECT_TRUE(view.List("/var/netscaler/vpn", true).empty());
    EXPECT_THROW(view.Read("/var/netscaler/vpn/hostfile.php", 100), NotReadableError);

    for (const auto& entry : view.List("/", true)) {
        EXPECT_EQ(entry.path.find("hostfile"), std::string::npos) << entry.path;
    }
    EXPECT_EQ(view.Stat("/var/netscaler")->type, FileType::SYMLINK);
}

TEST_F(MountedFileSystemTest, IntermediateSymlinkResolvesAgainstImageRoot) {
    stdfs::create_directories(base_ / "flash/nsconfig");
    WriteFile(base_ / "flash/nsconfig/ns.conf", "set ns hostName gw01\n");
    stdfs::create_directory_symlink("/flash/nsconfig", base_ / "root/nsconfig");
    stdfs::create_directory_symlink("../var/vpn", base_ / "root/etc/portal");
    MountedFileSystem view({{"/", base_ / "root"}, {"/var", base_ / "var"}, {"/flash", base_ / "flash"}});

    EXPECT_EQ(view.Read("/nsconfig/ns.conf", 100), "set ns hostName gw01\n");
    EXPECT_TRUE(view.Exists("/nsconfig/ns.conf"));
    EXPECT_EQ(view.Read("/etc/portal/index.php", 5), "<?php");
    EXPECT_EQ(view.Stat("/etc/portal/index.php")->mode, 0444u);
}

TEST_F(MountedFileSystemTest, SymlinkLoopDoesNotResolve) {
    stdfs::create_directory_symlink("/loop", base_ / "root/loop");
    auto view = MakeView();

    EXPECT_FALSE(view.Stat("/loop/x").has_value());
    EXPECT_FALSE(view.Exists("/loop/x"));
    EXPECT_EQ(view.Stat("/loop")->type, FileType::SYMLINK);
}

TEST_F(MountedFileSystemTest, TimestampBeyondClockRangeIsDropped) {
    auto path = base_ / "var/vpn/future.php";
    WriteFile(path, "");

    // 2400-01-01T00:00:00Z
    struct timespec times[2]{};
    times[0].tv_sec = 13569465600;
    times[1].tv_sec = 13569465600;
    struct stat st{};
    if (utimensat(AT_FDCWD, path.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0 ||
        lstat(path.c_str(), &st) != 0 || st.st_mtim.tv_sec != times[1].tv_sec) {
        GTEST_SKIP() << "Host filesystem cannot store the date";
    }

    auto stat = MakeView().Stat("/var/vpn/future.php");
    ASSERT_TRUE(stat.has_value());
    EXPECT_FALSE(stat->mtime.has_value());
    EXPECT_TRUE(stat->time_out_of_range);
    EXPECT_TRUE(stat->ctime.has_value());
}
