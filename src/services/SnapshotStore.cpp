/**
 * @file SnapshotStore.cpp
 * @brief Holder of the most recently published snapshot
 */

#include "services/SnapshotStore.hpp"

#include <utility>

auto SnapshotStore::current() const -> std::shared_ptr<const Snapshot> {
    std::lock_guard lock(mutex_);
    return current_;
}

auto SnapshotStore::publish(Snapshot snapshot) -> uint64_t {
    // Built outside the lock; only the swap is serialized
    auto published = std::make_shared<Snapshot>(std::move(snapshot));

    std::lock_guard lock(mutex_);
    published->sequence = ++last_sequence_;
    current_ = std::move(published);
    return last_sequence_;
}
