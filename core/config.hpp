// filename: core/config.hpp
#pragma once
#include "core/device_registry.hpp"
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <functional>
#include <string>
#include <vector>

// Daemon settings, read once at startup from NETMON_* environment variables.
struct MonitorConfig {
    std::vector<std::string> targets;
    RegistryOptions registry;
    std::chrono::milliseconds retention{std::chrono::hours(24)};
    std::size_t max_monitors = 20000;
    std::size_t workers = 256;
    std::size_t worker_backlog = 4096;
    std::size_t io_threads = 1;

    std::chrono::milliseconds probe_interval{5000};
    std::chrono::milliseconds probe_timeout{2000};
    std::chrono::milliseconds reconcile_interval{5000};
    std::chrono::milliseconds prune_interval{60000};
    std::chrono::milliseconds discovery_interval{std::chrono::minutes(5)};
    std::chrono::milliseconds min_scan_interval{std::chrono::minutes(1)};
    std::chrono::milliseconds health_interval{std::chrono::seconds(10)};

    bool verbose = false;
    std::string sample_log;   // empty: samples go to stdout
};

using EnvLookup = std::function<const char*(const char*)>;

// Unparsable values are ignored with a warning, oversized ones clamped.
MonitorConfig load_config(const EnvLookup& lookup = &std::getenv);

// Throws std::invalid_argument naming the first offending setting.
void validate_config(const MonitorConfig& cfg);
