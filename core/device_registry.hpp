// filename: core/device_registry.hpp
#pragma once
#include "core/device.hpp"
#include "core/probe_outcome.hpp"
#include "core/suspension.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

enum class CapacityPolicy { RejectNew, EvictLeastRecentlySeen };

struct RegistryOptions {
    std::size_t max_devices = 20000;
    CapacityPolicy capacity_policy = CapacityPolicy::EvictLeastRecentlySeen;
    SuspensionPolicy suspension;
};

struct RegistryHealth {
    std::size_t device_count = 0;
    int ping_suspended = 0;
    int snmp_suspended = 0;
};

// Address -> Device map shared by every monitor, the discovery feed and the
// pruner. All writes go through one exclusive lock; the suspended counters
// are only ever changed by the Transition a write produced, so they can be
// read without the lock.
class DeviceRegistry {
public:
    explicit DeviceRegistry(RegistryOptions opts,
                            Clock clock = &std::chrono::system_clock::now);

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // true only if a new record was stored. A known address is left as is
    // (apart from lazy expiry cleanup) and its last_seen is not refreshed.
    bool add(const std::string& address);

    // Probe outcome or enrichment. A ProbeSuccess for an unknown address is an
    // implicit add; anything else for an unknown address is dropped.
    void update(const std::string& address, const ProbeOutcome& outcome);

    bool remove(const std::string& address);

    // Removes the device only if it is still unseen since cutoff.
    bool remove_stale(const std::string& address, TimePoint cutoff);

    // Copies ordered by address.
    std::vector<Device> snapshot() const;
    std::optional<Device> find(const std::string& address) const;
    bool is_suspended(const std::string& address, Protocol p) const;

    // Amortized O(1), not strictly lock-free: plain atomic reads while no
    // suspension deadline has passed, otherwise it first takes the write lock
    // once to acknowledge the due expiries.
    RegistryHealth health();

    // Acknowledges every lapsed suspension; returns how many were cleared.
    std::size_t expire_due();

    // O(n) scan of actively suspended devices, independent of the counters.
    std::size_t recount_suspended(Protocol p) const;

    std::size_t size() const noexcept { return device_count_.load(std::memory_order_acquire); }
    TimePoint now() const { return clock_(); }
    const RegistryOptions& options() const noexcept { return opts_; }

private:
    using DeviceMap = std::map<std::string, Device>;
    using Index = std::set<std::pair<TimePoint, std::string>>;

    // The fields the side indexes are keyed on, captured before a mutation.
    struct Keys {
        TimePoint last_seen;
        std::array<TimePoint, kProtocolCount> timers;
    };
    static Keys keys_of(const Device& d);

    DeviceMap::iterator insert_locked(const std::string& address, TimePoint now);
    void erase_locked(DeviceMap::iterator it, TimePoint now);
    void commit_locked(const Keys& before, const Device& after, const Transition& t);
    void publish_deadline_locked(Protocol p);
    std::size_t expire_due_locked(TimePoint now);
    static void require_address(const std::string& address);

    RegistryOptions opts_;
    Clock clock_;

    mutable std::shared_mutex mu_;
    DeviceMap devices_;
    Index by_last_seen_;                          // eviction order
    std::array<Index, kProtocolCount> deadlines_; // pending suspension ends

    // Written under mu_ only.
    std::array<std::atomic<std::int64_t>, kProtocolCount> next_deadline_ns_;
    std::array<std::atomic<int>, kProtocolCount> suspended_;
    std::atomic<std::size_t> device_count_{0};
};
