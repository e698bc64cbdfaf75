/**
 * @file VolumeCollectorTest.cpp
 * @brief Unit tests for VolumeCollector
 */

#include "services/VolumeCollector.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>

namespace {

constexpr uint64_t GIB = 1024ULL * 1024ULL * 1024ULL;

const MountEntry ROOT_MOUNT{.source = "/dev/nvme0n1p2", .mount_point = "/", .filesystem = "ext4"};

}  // namespace

class VolumeCollectorTest : public ::testing::Test {
protected:
    std::filesystem::path mount_table;

    void SetUp() override {
        mount_table = std::filesystem::temp_directory_path() /
                      ("drivewatch_mounts_" + std::to_string(::getpid()));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(mount_table, ec);
    }

    void write_mount_table(const std::string& content) {
        std::ofstream out(mount_table);
        out << content;
    }
};

// ========== make_volume Tests ==========

TEST(VolumeCollectorStaticTest, MakeVolume_ComputesRoundedSizes) {
    auto volume = VolumeCollector::make_volume(ROOT_MOUNT, 100 * GIB, 25 * GIB);

    ASSERT_TRUE(volume.has_value());
    EXPECT_EQ(volume->drive_letter, "/");
    EXPECT_EQ(volume->volume_name, "/dev/nvme0n1p2");
    EXPECT_DOUBLE_EQ(volume->free_gb, 25.0);
    EXPECT_DOUBLE_EQ(volume->used_gb, 75.0);
    EXPECT_DOUBLE_EQ(volume->usage_percent, 75.0);
}

TEST(VolumeCollectorStaticTest, MakeVolume_RoundsToTwoAndOneDecimals) {
    // 1 GiB total, one third available
    auto volume = VolumeCollector::make_volume(ROOT_MOUNT, 3 * GIB, GIB);

    ASSERT_TRUE(volume.has_value());
    EXPECT_DOUBLE_EQ(volume->free_gb, 1.0);
    EXPECT_DOUBLE_EQ(volume->used_gb, 2.0);
    EXPECT_DOUBLE_EQ(volume->usage_percent, 66.7);
}

TEST(VolumeCollectorStaticTest, MakeVolume_ZeroSized_ReturnsNullopt) {
    EXPECT_FALSE(VolumeCollector::make_volume(ROOT_MOUNT, 0, 0).has_value());
}

TEST(VolumeCollectorStaticTest, MakeVolume_AvailableAboveTotal_IsClamped) {
    auto volume = VolumeCollector::make_volume(ROOT_MOUNT, 10 * GIB, 20 * GIB);

    ASSERT_TRUE(volume.has_value());
    EXPECT_DOUBLE_EQ(volume->free_gb, 10.0);
    EXPECT_DOUBLE_EQ(volume->used_gb, 0.0);
    EXPECT_DOUBLE_EQ(volume->usage_percent, 0.0);
}

// ========== is_pseudo_filesystem Tests ==========

TEST(VolumeCollectorStaticTest, IsPseudoFilesystem_KnownTypes) {
    EXPECT_TRUE(VolumeCollector::is_pseudo_filesystem("proc"));
    EXPECT_TRUE(VolumeCollector::is_pseudo_filesystem("tmpfs"));
    EXPECT_TRUE(VolumeCollector::is_pseudo_filesystem("overlay"));
    EXPECT_FALSE(VolumeCollector::is_pseudo_filesystem("ext4"));
    EXPECT_FALSE(VolumeCollector::is_pseudo_filesystem("xfs"));
    EXPECT_FALSE(VolumeCollector::is_pseudo_filesystem("vfat"));
}

// ========== read_mount_table Tests ==========

TEST_F(VolumeCollectorTest, ReadMountTable_SkipsPseudoFilesystems) {
    write_mount_table("proc /proc proc rw,nosuid 0 0\n"
                      "/dev/sda1 /boot vfat rw 0 0\n"
                      "tmpfs /run tmpfs rw 0 0\n"
                      "/dev/sda2 /home ext4 rw,relatime 0 0\n");

    auto entries = VolumeCollector::read_mount_table(mount_table);

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].source, "/dev/sda1");
    EXPECT_EQ(entries[0].mount_point, "/boot");
    EXPECT_EQ(entries[0].filesystem, "vfat");
    EXPECT_EQ(entries[1].mount_point, "/home");
}

TEST_F(VolumeCollectorTest, ReadMountTable_DecodesEscapedSpaces) {
    write_mount_table("/dev/sdb1 /media/usb\\040stick exfat rw 0 0\n");

    auto entries = VolumeCollector::read_mount_table(mount_table);

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].mount_point, "/media/usb stick");
}

TEST_F(VolumeCollectorTest, ReadMountTable_MissingFile_ReturnsEmpty) {
    EXPECT_TRUE(VolumeCollector::read_mount_table("/nonexistent/mounts").empty());
}

// ========== collect Tests ==========

TEST_F(VolumeCollectorTest, Collect_DeduplicatesSourcesAndSkipsUnreachableMounts) {
    write_mount_table("/dev/test0 / ext4 rw 0 0\n"
                      "/dev/test0 /tmp ext4 rw 0 0\n"
                      "/dev/test1 /nonexistent/mount/point ext4 rw 0 0\n");

    VolumeCollector collector(mount_table);
    auto volumes = collector.collect();

    ASSERT_EQ(volumes.size(), 1u);
    EXPECT_EQ(volumes[0].drive_letter, "/");
    EXPECT_EQ(volumes[0].volume_name, "/dev/test0");
    EXPECT_GE(volumes[0].usage_percent, 0.0);
    EXPECT_LE(volumes[0].usage_percent, 100.0);
}
