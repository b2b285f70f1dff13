// filename: src/config.cpp
#include "core/config.hpp"
#include "core/prober.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string_view>
#include <thread>

namespace {
    constexpr std::uint64_t kMaxSeconds = 365ull * 24 * 3600;
    constexpr std::uint64_t kMaxMillis = 24ull * 3600 * 1000;
    constexpr std::size_t kMaxDevices = 100000;
    constexpr std::size_t kMaxWorkers = 2000;
    constexpr std::size_t kMaxBacklog = 1000000;
    constexpr std::uint64_t kMaxThreshold = 1000;

    std::string_view trim(std::string_view s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
        return s;
    }

    std::string lower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    // Keeps `current` unless name holds a non-negative integer.
    std::uint64_t read_uint(const EnvLookup& lookup, const char* name, std::uint64_t current,
                            std::uint64_t max_cap) {
        const char* env = lookup(name);
        if (!env) return current;
        const std::string_view v = trim(env);

        std::uint64_t n = 0;
        auto res = std::from_chars(v.data(), v.data() + v.size(), n, 10);
        if (v.empty() || res.ec != std::errc{} || res.ptr != v.data() + v.size()) {
            std::cerr << "[config] ignoring " << name << " (not a non-negative integer): '" << env << "'\n";
            return current;
        }
        if (n > max_cap) {
            std::cerr << "[config] " << name << "=" << n << " too large; clamping to " << max_cap << "\n";
            n = max_cap;
        }
        return n;
    }

    void read_seconds(const EnvLookup& lookup, const char* name, std::chrono::milliseconds& out) {
        const auto current = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(out).count());
        const std::uint64_t s = read_uint(lookup, name, current, kMaxSeconds);
        if (s != current) out = std::chrono::seconds(s);
    }

    void read_millis(const EnvLookup& lookup, const char* name, std::chrono::milliseconds& out) {
        out = std::chrono::milliseconds(
            read_uint(lookup, name, static_cast<std::uint64_t>(out.count()), kMaxMillis));
    }

    void read_size(const EnvLookup& lookup, const char* name, std::size_t& out, std::size_t max_cap) {
        out = static_cast<std::size_t>(read_uint(lookup, name, out, max_cap));
    }

    void read_threshold(const EnvLookup& lookup, const char* name, int& out) {
        out = static_cast<int>(read_uint(lookup, name, static_cast<std::uint64_t>(std::max(out, 0)),
                                         kMaxThreshold));
    }

    std::vector<std::string> split_targets(std::string_view list) {
        std::vector<std::string> out;
        while (!list.empty()) {
            const auto comma = list.find(',');
            const std::string_view item = trim(list.substr(0, comma));
            if (!item.empty() && std::find(out.begin(), out.end(), item) == out.end()) {
                out.emplace_back(item);
            }
            if (comma == std::string_view::npos) break;
            list.remove_prefix(comma + 1);
        }
        return out;
    }

    void require(bool ok, const std::string& what) {
        if (!ok) throw std::invalid_argument("invalid configuration: " + what);
    }

    void require_positive(std::chrono::milliseconds d, const char* name) {
        require(d.count() >= 1, std::string(name) + " must be at least 1 ms");
    }
}

MonitorConfig load_config(const EnvLookup& lookup) {
    MonitorConfig cfg;
    const std::size_t hw = std::thread::hardware_concurrency() ?
                           std::thread::hardware_concurrency() : 1;
    cfg.io_threads = hw;

    if (const char* env = lookup("NETMON_TARGETS")) cfg.targets = split_targets(env);

    read_threshold(lookup, "NETMON_PING_FAIL_THRESHOLD", cfg.registry.suspension.ping.fail_threshold);
    read_seconds(lookup, "NETMON_PING_SUSPEND_SEC", cfg.registry.suspension.ping.suspension);
    read_threshold(lookup, "NETMON_SNMP_FAIL_THRESHOLD", cfg.registry.suspension.snmp.fail_threshold);
    read_seconds(lookup, "NETMON_SNMP_SUSPEND_SEC", cfg.registry.suspension.snmp.suspension);
    read_seconds(lookup, "NETMON_RETENTION_SEC", cfg.retention);

    read_size(lookup, "NETMON_MAX_DEVICES", cfg.registry.max_devices, kMaxDevices);
    if (const char* env = lookup("NETMON_CAPACITY_POLICY")) {
        const std::string v = lower(trim(env));
        if (v == "reject") {
            cfg.registry.capacity_policy = CapacityPolicy::RejectNew;
        } else if (v == "evict") {
            cfg.registry.capacity_policy = CapacityPolicy::EvictLeastRecentlySeen;
        } else {
            std::cerr << "[config] ignoring NETMON_CAPACITY_POLICY (expected reject or evict): '"
                      << env << "'\n";
        }
    }
    read_size(lookup, "NETMON_MAX_MONITORS", cfg.max_monitors, kMaxDevices);
    read_size(lookup, "NETMON_WORKERS", cfg.workers, kMaxWorkers);
    read_size(lookup, "NETMON_WORKER_BACKLOG", cfg.worker_backlog, kMaxBacklog);
    read_size(lookup, "NETMON_IO_THREADS", cfg.io_threads, std::min<std::size_t>(hw * 4, 256));

    read_millis(lookup, "NETMON_PROBE_INTERVAL_MS", cfg.probe_interval);
    read_millis(lookup, "NETMON_PROBE_TIMEOUT_MS", cfg.probe_timeout);
    read_millis(lookup, "NETMON_RECONCILE_INTERVAL_MS", cfg.reconcile_interval);
    read_millis(lookup, "NETMON_PRUNE_INTERVAL_MS", cfg.prune_interval);
    read_seconds(lookup, "NETMON_DISCOVERY_INTERVAL_SEC", cfg.discovery_interval);
    read_seconds(lookup, "NETMON_MIN_SCAN_INTERVAL_SEC", cfg.min_scan_interval);
    read_seconds(lookup, "NETMON_HEALTH_INTERVAL_SEC", cfg.health_interval);

    if (const char* env = lookup("NETMON_VERBOSE")) {
        const std::string v = lower(trim(env));
        cfg.verbose = !(v.empty() || v == "0" || v == "false" || v == "no");
    }
    if (const char* env = lookup("NETMON_SAMPLE_LOG")) cfg.sample_log = std::string(trim(env));
    return cfg;
}

void validate_config(const MonitorConfig& cfg) {
    for (Protocol p : kProtocols) {
        const ProtocolPolicy& policy = cfg.registry.suspension.of(p);
        require(policy.fail_threshold >= 1,
                std::string(to_string(p)) + " failure threshold must be at least 1");
        require(policy.suspension.count() >= 0,
                std::string(to_string(p)) + " suspension must not be negative");
    }
    require_positive(cfg.retention, "retention");
    require(cfg.registry.max_devices >= 1 && cfg.registry.max_devices <= kMaxDevices,
            "max_devices must be between 1 and 100000, got " + std::to_string(cfg.registry.max_devices));
    require(cfg.max_monitors >= 1 && cfg.max_monitors <= kMaxDevices,
            "max_monitors must be between 1 and 100000, got " + std::to_string(cfg.max_monitors));
    require(cfg.workers >= 1 && cfg.workers <= kMaxWorkers,
            "workers must be between 1 and 2000, got " + std::to_string(cfg.workers));
    require(cfg.worker_backlog >= 1, "worker backlog must be at least 1");
    require(cfg.io_threads >= 1, "io threads must be at least 1");

    require_positive(cfg.probe_interval, "probe interval");
    require_positive(cfg.probe_timeout, "probe timeout");
    require_positive(cfg.reconcile_interval, "reconcile interval");
    require_positive(cfg.prune_interval, "prune interval");
    require_positive(cfg.discovery_interval, "discovery interval");
    require_positive(cfg.health_interval, "health interval");
    require(cfg.min_scan_interval.count() >= 0, "min scan interval must not be negative");

    for (const std::string& target : cfg.targets) {
        if (const char* why = probe_target_rejection(target)) {
            require(false, "target '" + target + "': " + why);
        }
    }
}
