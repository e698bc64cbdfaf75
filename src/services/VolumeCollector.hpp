/**
 * @file VolumeCollector.hpp
 * @brief IVolumeCollector reading the mount table and statvfs
 */

#pragma once

#include "services/IVolumeCollector.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

/**
 * @struct MountEntry
 * @brief One line of the mount table
 */
struct MountEntry {
    std::string source;       // e.g., "/dev/sda1"
    std::string mount_point;  // e.g., "/home"
    std::string filesystem;   // e.g., "ext4"
};

class VolumeCollector : public IVolumeCollector {
public:
    static constexpr std::string_view DEFAULT_MOUNT_TABLE = "/proc/self/mounts";

    explicit VolumeCollector(std::filesystem::path mount_table = DEFAULT_MOUNT_TABLE);
    ~VolumeCollector() override = default;

    [[nodiscard]] auto collect() -> std::vector<VolumeInfo> override;

    /**
     * @brief Parse a mount table file
     * @return Entries in file order, pseudo file systems excluded
     */
    [[nodiscard]] static auto read_mount_table(const std::filesystem::path& path)
        -> std::vector<MountEntry>;

    /**
     * @brief Whether a file system type carries no user data (proc, tmpfs, overlay, ...)
     */
    [[nodiscard]] static auto is_pseudo_filesystem(std::string_view fstype) -> bool;

    /**
     * @brief Build a volume record from raw sizes
     * @param total_bytes File system size
     * @param avail_bytes Space available to unprivileged users
     * @return Record, or nullopt for a zero-sized file system
     */
    [[nodiscard]] static auto make_volume(const MountEntry& mount, uint64_t total_bytes,
                                          uint64_t avail_bytes) -> std::optional<VolumeInfo>;

private:
    std::filesystem::path mount_table_;
};
