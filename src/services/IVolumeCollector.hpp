/**
 * @file IVolumeCollector.hpp
 * @brief Interface for mounted volume usage
 */

#pragma once

#include "models/Snapshot.hpp"

#include <vector>

class IVolumeCollector {
public:
    virtual ~IVolumeCollector() = default;

    /**
     * @brief Collect usage of every real mounted file system
     * @return Volumes sorted by mount point; empty if the mount table is unreadable
     */
    [[nodiscard]] virtual auto collect() -> std::vector<VolumeInfo> = 0;
};
