/**
 * @file SnapshotStore.hpp
 * @brief Holder of the most recently published snapshot
 */

#pragma once

#include "models/Snapshot.hpp"

#include <cstdint>
#include <memory>
#include <mutex>

/**
 * @class SnapshotStore
 * @brief Single-writer, many-reader cache of the last complete snapshot
 *
 * Readers get a shared_ptr to an immutable snapshot and may keep it as long
 * as they like; publish() only swaps the pointer.
 */
class SnapshotStore {
public:
    SnapshotStore() = default;

    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    /**
     * @brief Latest snapshot, nullptr before the first publish
     */
    [[nodiscard]] auto current() const -> std::shared_ptr<const Snapshot>;

    /**
     * @brief Replace the current snapshot
     * @param snapshot New contents; its sequence field is overwritten
     * @return Sequence number assigned (1 for the first publish)
     */
    auto publish(Snapshot snapshot) -> uint64_t;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const Snapshot> current_;
    uint64_t last_sequence_ = 0;
};
