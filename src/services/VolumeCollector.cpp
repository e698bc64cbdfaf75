/**
 * @file VolumeCollector.cpp
 * @brief IVolumeCollector reading the mount table and statvfs
 */

#include "services/VolumeCollector.hpp"

#include "util/Logger.hpp"

#include <mntent.h>
#include <sys/statvfs.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <format>
#include <memory>
#include <unordered_set>
#include <utility>

namespace {

constexpr std::array<std::string_view, 24> PSEUDO_FILESYSTEMS{
    "proc",     "sysfs",    "devtmpfs",  "devpts",     "tmpfs",    "cgroup",
    "cgroup2",  "pstore",   "securityfs", "bpf",       "autofs",   "mqueue",
    "hugetlbfs", "configfs", "debugfs",  "tracefs",    "nsfs",     "ramfs",
    "fusectl",  "fuse.portal", "overlay", "squashfs",  "efivarfs", "binfmt_misc",
};

constexpr double BYTES_PER_GIB = 1024.0 * 1024.0 * 1024.0;

// Long enough for mount options of container overlay mounts
constexpr int MNTENT_BUFFER_SIZE = 16 * 1024;

auto round_to(double value, double scale) -> double {
    return std::round(value * scale) / scale;
}

}  // namespace

VolumeCollector::VolumeCollector(std::filesystem::path mount_table)
    : mount_table_(std::move(mount_table)) {}

auto VolumeCollector::collect() -> std::vector<VolumeInfo> {
    std::vector<VolumeInfo> volumes;
    std::unordered_set<std::string> seen_sources;

    for (const auto& mount : read_mount_table(mount_table_)) {
        if (!seen_sources.insert(mount.source).second) {
            continue;
        }

        struct statvfs vfs{};
        if (::statvfs(mount.mount_point.c_str(), &vfs) != 0) {
            LOG_DEBUG("VolumeCollector", std::format("statvfs({}) failed: {}", mount.mount_point,
                                                     std::strerror(errno)));
            continue;
        }

        const auto total = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
        const auto avail = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
        if (auto volume = make_volume(mount, total, avail)) {
            volumes.push_back(std::move(*volume));
        }
    }

    std::ranges::sort(volumes, {}, &VolumeInfo::drive_letter);
    return volumes;
}

auto VolumeCollector::read_mount_table(const std::filesystem::path& path)
    -> std::vector<MountEntry> {
    std::vector<MountEntry> entries;

    auto mtab_deleter = [](FILE* f) {
        if (f)
            ::endmntent(f);
    };

    std::unique_ptr<FILE, decltype(mtab_deleter)> mtab{::setmntent(path.c_str(), "r"),
                                                       mtab_deleter};
    if (!mtab) {
        LOG_WARNING("VolumeCollector",
                    std::format("Cannot open {}: {}", path.string(), std::strerror(errno)));
        return entries;
    }

    struct mntent entry{};
    std::array<char, MNTENT_BUFFER_SIZE> buffer{};
    while (::getmntent_r(mtab.get(), &entry, buffer.data(), static_cast<int>(buffer.size())) !=
           nullptr) {
        if (is_pseudo_filesystem(entry.mnt_type)) {
            continue;
        }
        entries.push_back(MountEntry{
            .source = entry.mnt_fsname,
            .mount_point = entry.mnt_dir,
            .filesystem = entry.mnt_type,
        });
    }
    return entries;
}

auto VolumeCollector::is_pseudo_filesystem(std::string_view fstype) -> bool {
    return std::ranges::find(PSEUDO_FILESYSTEMS, fstype) != PSEUDO_FILESYSTEMS.end();
}

auto VolumeCollector::make_volume(const MountEntry& mount, uint64_t total_bytes,
                                  uint64_t avail_bytes) -> std::optional<VolumeInfo> {
    if (total_bytes == 0) {
        return std::nullopt;
    }
    avail_bytes = std::min(avail_bytes, total_bytes);

    const double total_gb = static_cast<double>(total_bytes) / BYTES_PER_GIB;
    const double used_gb =
        round_to(static_cast<double>(total_bytes - avail_bytes) / BYTES_PER_GIB, 100.0);

    return VolumeInfo{
        .drive_letter = mount.mount_point,
        .volume_name = mount.source,
        .free_gb = round_to(static_cast<double>(avail_bytes) / BYTES_PER_GIB, 100.0),
        .used_gb = used_gb,
        .usage_percent = round_to(used_gb / total_gb * 100.0, 10.0),
    };
}
