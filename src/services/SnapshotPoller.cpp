/**
 * @file SnapshotPoller.cpp
 * @brief Periodic and on-demand poll cycles feeding the SnapshotStore
 */

#include "services/SnapshotPoller.hpp"

#include "services/AttributeNormalizer.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <future>
#include <system_error>
#include <utility>

SnapshotPoller::SnapshotPoller(std::shared_ptr<IDeviceEnumerator> enumerator,
                               std::shared_ptr<IDeviceReader> reader,
                               std::shared_ptr<IVolumeCollector> volume_collector,
                               std::shared_ptr<SnapshotStore> store, PollerOptions options)
    : enumerator_(std::move(enumerator)),
      reader_(std::move(reader)),
      volume_collector_(std::move(volume_collector)),
      store_(std::move(store)),
      options_(options) {}

SnapshotPoller::~SnapshotPoller() {
    stop();
}

void SnapshotPoller::start() {
    std::lock_guard lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    stop_requested_ = false;
    worker_ = std::thread([this]() { worker_loop(); });
    LOG_INFO("SnapshotPoller",
             std::format("Polling every {} ms ({} probes)", options_.interval.count(),
                         options_.parallel_probes ? "parallel" : "sequential"));
}

void SnapshotPoller::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
    }
    wake_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard lock(mutex_);
    running_ = false;
    pending_ = false;
    idle_cv_.notify_all();
}

auto SnapshotPoller::trigger() -> TriggerResult {
    std::lock_guard lock(mutex_);
    if (!running_ || stop_requested_) {
        return TriggerResult{.accepted = false, .coalesced = false};
    }
    if (state_ == PollerState::POLLING || pending_) {
        pending_ = true;
        ++triggers_coalesced_;
        return TriggerResult{.accepted = true, .coalesced = true};
    }
    pending_ = true;
    wake_cv_.notify_all();
    return TriggerResult{.accepted = true, .coalesced = false};
}

void SnapshotPoller::worker_loop() {
    std::unique_lock lock(mutex_);
    auto next_tick = std::chrono::steady_clock::now();

    while (!stop_requested_) {
        wake_cv_.wait_until(lock, next_tick, [this]() { return stop_requested_ || pending_; });
        if (stop_requested_) {
            break;
        }

        // Enter POLLING before dropping the lock so a trigger arriving now coalesces
        pending_ = false;
        state_ = PollerState::POLLING;
        lock.unlock();

        (void)run_cycle();

        lock.lock();
        next_tick = std::chrono::steady_clock::now() + options_.interval;
    }
}

auto SnapshotPoller::run_cycle() -> std::expected<uint64_t, util::Error> {
    std::lock_guard cycle_lock(cycle_mutex_);
    {
        std::lock_guard lock(mutex_);
        state_ = PollerState::POLLING;
    }

    const auto started = std::chrono::steady_clock::now();
    auto snapshot = execute_cycle();

    std::expected<uint64_t, util::Error> result;
    if (snapshot) {
        const auto drive_count = snapshot->drives.size();
        const auto failed_count = std::ranges::count_if(snapshot->drives, is_error_entry);
        const auto volume_count = snapshot->volumes.size();
        const auto scan_status = snapshot->scan_status;

        const auto sequence = store_->publish(std::move(*snapshot));
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        LOG_INFO("SnapshotPoller",
                 std::format("Cycle {} published {} drive(s) ({} unreadable), {} volume(s), "
                             "scan {}, {} ms",
                             sequence, drive_count, failed_count, volume_count,
                             scan_status_name(scan_status), elapsed.count()));
        result = sequence;
    } else {
        LOG_ERROR("SnapshotPoller",
                  std::format("Cycle failed, keeping previous snapshot: {}",
                              snapshot.error().message));
        result = std::unexpected(snapshot.error());
    }

    {
        std::lock_guard lock(mutex_);
        state_ = PollerState::IDLE;
        if (result) {
            ++cycles_completed_;
            last_error_.clear();
        } else {
            ++cycles_failed_;
            last_error_ = result.error().message;
        }
    }
    idle_cv_.notify_all();
    return result;
}

auto SnapshotPoller::execute_cycle() -> std::expected<Snapshot, util::Error> {
    auto scan = enumerator_->enumerate();
    if (!scan) {
        return std::unexpected(scan.error());
    }

    // Volumes are independent of the tool; collect them while devices are probed
    std::future<std::vector<VolumeInfo>> volumes;
    if (volume_collector_) {
        volumes = std::async(std::launch::async,
                             [collector = volume_collector_]() { return collector->collect(); });
    }

    Snapshot snapshot;
    snapshot.scan_status = scan->status;
    snapshot.drives = read_devices(scan->devices);
    std::ranges::sort(snapshot.drives, {},
                      [](const DriveEntry& entry) -> const std::string& { return entry_device(entry); });

    if (volumes.valid()) {
        try {
            snapshot.volumes = volumes.get();
        } catch (const std::exception& e) {
            LOG_WARNING("SnapshotPoller", std::format("Volume collection failed: {}", e.what()));
        }
    }

    snapshot.generated_at = std::chrono::system_clock::now();
    return snapshot;
}

auto SnapshotPoller::read_devices(const std::vector<std::string>& devices)
    -> std::vector<DriveEntry> {
    std::vector<DriveEntry> entries;
    entries.reserve(devices.size());

    if (!options_.parallel_probes || devices.size() < 2) {
        for (const auto& device : devices) {
            entries.push_back(read_device(device));
        }
        return entries;
    }

    // Every future is waited on before returning, so capturing this is safe
    std::vector<std::future<DriveEntry>> futures;
    futures.reserve(devices.size());
    for (const auto& device : devices) {
        try {
            futures.push_back(
                std::async(std::launch::async, [this, device]() { return read_device(device); }));
        } catch (const std::system_error& e) {
            LOG_WARNING("SnapshotPoller",
                        std::format("Cannot start probe task for {}: {}", device, e.what()));
            futures.push_back(std::async(std::launch::deferred,
                                         [this, device]() { return read_device(device); }));
        }
    }

    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            entries.push_back(futures[i].get());
        } catch (const std::exception& e) {
            LOG_WARNING("SnapshotPoller",
                        std::format("Probe task for {} failed: {}", devices[i], e.what()));
            entries.push_back(DriveError{.device = devices[i],
                                         .message = std::format("Probe failed: {}", e.what())});
        }
    }
    return entries;
}

auto SnapshotPoller::read_device(const std::string& device) -> DriveEntry {
    try {
        auto telemetry = reader_->read(device);
        if (!telemetry) {
            LOG_WARNING("SnapshotPoller", telemetry.error().message);
            return DriveError{.device = device, .message = telemetry.error().message};
        }
        return AttributeNormalizer::normalize(device, *telemetry);
    } catch (const std::exception& e) {
        LOG_WARNING("SnapshotPoller", std::format("Reading {} threw: {}", device, e.what()));
        return DriveError{.device = device, .message = std::format("Probe failed: {}", e.what())};
    }
}

auto SnapshotPoller::wait_until_idle(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock(mutex_);
    return idle_cv_.wait_for(lock, timeout,
                             [this]() { return state_ == PollerState::IDLE && !pending_; });
}

auto SnapshotPoller::state() const -> PollerState {
    std::lock_guard lock(mutex_);
    return state_;
}

auto SnapshotPoller::status() const -> PollerStatus {
    std::lock_guard lock(mutex_);
    return PollerStatus{
        .state = state_,
        .cycles_completed = cycles_completed_,
        .cycles_failed = cycles_failed_,
        .triggers_coalesced = triggers_coalesced_,
        .last_error = last_error_,
    };
}
