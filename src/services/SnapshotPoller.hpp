/**
 * @file SnapshotPoller.hpp
 * @brief Periodic and on-demand poll cycles feeding the SnapshotStore
 */

#pragma once

#include "services/IDeviceEnumerator.hpp"
#include "services/IDeviceReader.hpp"
#include "services/IVolumeCollector.hpp"
#include "services/SnapshotStore.hpp"
#include "util/Error.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

/**
 * @struct PollerOptions
 * @brief Scheduling and probing behaviour of the poller
 */
struct PollerOptions {
    std::chrono::milliseconds interval{std::chrono::seconds{30}};
    bool parallel_probes = true;  ///< One std::async task per device
};

enum class PollerState {
    IDLE,
    POLLING
};

[[nodiscard]] constexpr auto poller_state_name(PollerState state) -> std::string_view {
    return state == PollerState::POLLING ? "polling" : "idle";
}

/**
 * @struct TriggerResult
 * @brief Outcome of a manual refresh request
 */
struct TriggerResult {
    bool accepted = false;   ///< false when the worker is not running
    bool coalesced = false;  ///< Folded into an already scheduled follow-up cycle
};

/**
 * @struct PollerStatus
 * @brief Counters and last failure, for the status endpoint
 */
struct PollerStatus {
    PollerState state = PollerState::IDLE;
    uint64_t cycles_completed = 0;
    uint64_t cycles_failed = 0;
    uint64_t triggers_coalesced = 0;
    std::string last_error;  ///< Empty after a successful cycle
};

/**
 * @class SnapshotPoller
 * @brief Sole writer of the SnapshotStore
 *
 * The worker thread runs a cycle immediately after start(), then once per
 * interval. trigger() requests an extra cycle; triggers arriving while a
 * cycle is in flight collapse into a single follow-up cycle. Cycles never
 * overlap, including cycles run directly through run_cycle().
 */
class SnapshotPoller {
public:
    /**
     * @param volume_collector May be null to skip volume collection
     */
    SnapshotPoller(std::shared_ptr<IDeviceEnumerator> enumerator,
                   std::shared_ptr<IDeviceReader> reader,
                   std::shared_ptr<IVolumeCollector> volume_collector,
                   std::shared_ptr<SnapshotStore> store, PollerOptions options = {});
    ~SnapshotPoller();

    SnapshotPoller(const SnapshotPoller&) = delete;
    SnapshotPoller& operator=(const SnapshotPoller&) = delete;
    SnapshotPoller(SnapshotPoller&&) = delete;
    SnapshotPoller& operator=(SnapshotPoller&&) = delete;

    /**
     * @brief Start the worker thread (no-op if already running)
     */
    void start();

    /**
     * @brief Stop the worker, waiting for an in-flight cycle to finish
     */
    void stop();

    /**
     * @brief Request a cycle as soon as possible
     */
    auto trigger() -> TriggerResult;

    /**
     * @brief Run one cycle on the calling thread and publish its snapshot
     * @return Published sequence number, or the cycle-level failure
     *
     * On failure the previously published snapshot stays current.
     */
    auto run_cycle() -> std::expected<uint64_t, util::Error>;

    /**
     * @brief Wait until no cycle is running or scheduled by trigger()
     * @return false on timeout
     */
    auto wait_until_idle(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto state() const -> PollerState;
    [[nodiscard]] auto status() const -> PollerStatus;

private:
    void worker_loop();

    [[nodiscard]] auto execute_cycle() -> std::expected<Snapshot, util::Error>;
    [[nodiscard]] auto read_devices(const std::vector<std::string>& devices)
        -> std::vector<DriveEntry>;
    [[nodiscard]] auto read_device(const std::string& device) -> DriveEntry;

    std::shared_ptr<IDeviceEnumerator> enumerator_;
    std::shared_ptr<IDeviceReader> reader_;
    std::shared_ptr<IVolumeCollector> volume_collector_;
    std::shared_ptr<SnapshotStore> store_;
    PollerOptions options_;

    std::mutex cycle_mutex_;  // Serializes run_cycle()

    mutable std::mutex mutex_;  // Protects everything below
    std::condition_variable wake_cv_;
    std::condition_variable idle_cv_;
    PollerState state_ = PollerState::IDLE;
    bool pending_ = false;
    bool running_ = false;
    bool stop_requested_ = false;
    uint64_t cycles_completed_ = 0;
    uint64_t cycles_failed_ = 0;
    uint64_t triggers_coalesced_ = 0;
    std::string last_error_;

    std::thread worker_;
};
