// filename: src/device_registry.cpp
#include "core/device_registry.hpp"
#include <iostream>
#include <limits>
#include <mutex>
#include <stdexcept>

namespace {
    constexpr std::int64_t kNoDeadline = std::numeric_limits<std::int64_t>::max();

    std::int64_t to_ns(TimePoint tp) {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
    }

    // Logged after the lock is released.
    void log_edges(const std::string& address, const Transition& t, const Device& dev,
                   const SuspensionPolicy& policy) {
        for (Protocol p : kProtocols) {
            const Edge& e = t[p];
            if (e.became_suspended()) {
                std::cerr << "[registry] " << address << " " << to_string(p)
                          << " suspended for "
                          << std::chrono::duration_cast<std::chrono::seconds>(policy.of(p).suspension).count()
                          << "s after " << fail_count(dev, p) << " consecutive failures\n";
            } else if (e.recovered()) {
                std::cout << "[registry] " << address << " " << to_string(p)
                          << " recovered during suspension\n";
            } else if (e.lapsed) {
                std::cout << "[registry] " << address << " " << to_string(p)
                          << " suspension expired\n";
            }
        }
    }
}

DeviceRegistry::DeviceRegistry(RegistryOptions opts, Clock clock)
    : opts_(std::move(opts)),
      clock_(std::move(clock))
{
    if (!clock_) throw std::invalid_argument("DeviceRegistry: clock must be callable");
    if (opts_.max_devices == 0) throw std::invalid_argument("DeviceRegistry: max_devices must be positive");
    for (Protocol p : kProtocols) {
        next_deadline_ns_[index(p)].store(kNoDeadline, std::memory_order_relaxed);
        suspended_[index(p)].store(0, std::memory_order_relaxed);
    }
}

void DeviceRegistry::require_address(const std::string& address) {
    if (address.empty()) throw std::invalid_argument("DeviceRegistry: empty device address");
}

DeviceRegistry::Keys DeviceRegistry::keys_of(const Device& d) {
    return Keys{d.last_seen, {d.suspended_until, d.snmp_suspended_until}};
}

bool DeviceRegistry::add(const std::string& address) {
    require_address(address);
    std::unique_lock<std::shared_mutex> lk(mu_);
    const TimePoint now = clock_();

    auto it = devices_.find(address);
    if (it != devices_.end()) {
        const Keys before = keys_of(it->second);
        // Being listed is not an observation: only answered probes and
        // enrichment move last_seen.
        const Transition t = acknowledge_lapsed(it->second, now);
        commit_locked(before, it->second, t);
        return false;
    }
    return insert_locked(address, now) != devices_.end();
}

void DeviceRegistry::update(const std::string& address, const ProbeOutcome& outcome) {
    require_address(address);
    std::unique_lock<std::shared_mutex> lk(mu_);
    const TimePoint now = clock_();

    auto it = devices_.find(address);
    if (it == devices_.end()) {
        if (!std::holds_alternative<ProbeSuccess>(outcome)) return;
        it = insert_locked(address, now);
        if (it == devices_.end()) return;
    }

    const Keys before = keys_of(it->second);
    const Transition t = apply_outcome(it->second, outcome, now, opts_.suspension);
    commit_locked(before, it->second, t);
    const Device after = it->second;
    lk.unlock();

    log_edges(address, t, after, opts_.suspension);
}

bool DeviceRegistry::remove(const std::string& address) {
    require_address(address);
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = devices_.find(address);
    if (it == devices_.end()) return false;
    erase_locked(it, clock_());
    return true;
}

bool DeviceRegistry::remove_stale(const std::string& address, TimePoint cutoff) {
    require_address(address);
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = devices_.find(address);
    if (it == devices_.end() || !(it->second.last_seen < cutoff)) return false;
    erase_locked(it, clock_());
    return true;
}

std::vector<Device> DeviceRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    std::vector<Device> out;
    out.reserve(devices_.size());
    for (const auto& kv : devices_) out.push_back(kv.second);
    return out;
}

std::optional<Device> DeviceRegistry::find(const std::string& address) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = devices_.find(address);
    if (it == devices_.end()) return std::nullopt;
    return it->second;
}

bool DeviceRegistry::is_suspended(const std::string& address, Protocol p) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = devices_.find(address);
    if (it == devices_.end()) return false;
    return is_actively_suspended(suspension_timer(it->second, p), clock_());
}

RegistryHealth DeviceRegistry::health() {
    const std::int64_t now_ns = to_ns(clock_());
    for (Protocol p : kProtocols) {
        if (next_deadline_ns_[index(p)].load(std::memory_order_acquire) <= now_ns) {
            expire_due();
            break;
        }
    }
    RegistryHealth h;
    h.device_count = device_count_.load(std::memory_order_acquire);
    h.ping_suspended = suspended_[index(Protocol::Ping)].load(std::memory_order_acquire);
    h.snmp_suspended = suspended_[index(Protocol::Snmp)].load(std::memory_order_acquire);
    return h;
}

std::size_t DeviceRegistry::expire_due() {
    std::unique_lock<std::shared_mutex> lk(mu_);
    return expire_due_locked(clock_());
}

std::size_t DeviceRegistry::recount_suspended(Protocol p) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    const TimePoint now = clock_();
    std::size_t n = 0;
    for (const auto& kv : devices_) {
        if (is_actively_suspended(suspension_timer(kv.second, p), now)) ++n;
    }
    return n;
}

DeviceRegistry::DeviceMap::iterator DeviceRegistry::insert_locked(const std::string& address,
                                                                  TimePoint now) {
    if (devices_.size() >= opts_.max_devices) {
        if (opts_.capacity_policy == CapacityPolicy::RejectNew || by_last_seen_.empty()) {
            std::cerr << "[registry] device limit reached (" << devices_.size() << "/"
                      << opts_.max_devices << "), rejecting " << address << "\n";
            return devices_.end();
        }
        const std::string victim = by_last_seen_.begin()->second;
        std::cerr << "[registry] device limit reached (" << devices_.size() << "/"
                  << opts_.max_devices << "), evicting least recently seen " << victim
                  << " for " << address << "\n";
        erase_locked(devices_.find(victim), now);
    }

    Device dev;
    dev.address = address;
    dev.last_seen = now;
    dev.enrichment.hostname = address;
    auto it = devices_.emplace(address, std::move(dev)).first;
    by_last_seen_.emplace(now, address);
    device_count_.store(devices_.size(), std::memory_order_release);
    return it;
}

void DeviceRegistry::erase_locked(DeviceMap::iterator it, TimePoint now) {
    const Keys before = keys_of(it->second);
    const Transition t = retire(it->second, now);
    commit_locked(before, it->second, t);
    by_last_seen_.erase({it->second.last_seen, it->first});
    devices_.erase(it);
    device_count_.store(devices_.size(), std::memory_order_release);
}

// Single point where the counters move. Every caller passes the Transition
// produced by suspension.cpp for this exact mutation.
void DeviceRegistry::commit_locked(const Keys& before, const Device& after, const Transition& t) {
    if (before.last_seen != after.last_seen) {
        by_last_seen_.erase({before.last_seen, after.address});
        by_last_seen_.emplace(after.last_seen, after.address);
    }
    for (Protocol p : kProtocols) {
        const TimePoint old_until = before.timers[index(p)];
        const TimePoint new_until = suspension_timer(after, p);
        if (old_until != new_until) {
            Index& deadlines = deadlines_[index(p)];
            if (old_until != TimePoint{}) deadlines.erase({old_until, after.address});
            if (new_until != TimePoint{}) deadlines.emplace(new_until, after.address);
            publish_deadline_locked(p);
        }
        if (const int d = t[p].delta()) {
            suspended_[index(p)].fetch_add(d, std::memory_order_acq_rel);
        }
    }
}

void DeviceRegistry::publish_deadline_locked(Protocol p) {
    const Index& deadlines = deadlines_[index(p)];
    next_deadline_ns_[index(p)].store(deadlines.empty() ? kNoDeadline : to_ns(deadlines.begin()->first),
                                      std::memory_order_release);
}

std::size_t DeviceRegistry::expire_due_locked(TimePoint now) {
    std::size_t cleared = 0;
    for (Protocol p : kProtocols) {
        Index& deadlines = deadlines_[index(p)];
        while (!deadlines.empty() && deadlines.begin()->first <= now) {
            auto it = devices_.find(deadlines.begin()->second);
            const Keys before = keys_of(it->second);
            const Transition t = acknowledge_lapsed(it->second, now);
            commit_locked(before, it->second, t);
            for (const Edge& e : t.edges) {
                if (e.lapsed) ++cleared;
            }
        }
    }
    return cleared;
}
