// filename: core/discovery_feed.hpp
#pragma once
#include "core/device_registry.hpp"
#include "core/metrics.hpp"
#include "core/periodic_timer.hpp"
#include "core/thread_pool.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

// Addresses found by a sweep (static list, scanner, ...).
using TargetSource = std::function<std::vector<std::string>()>;

// Blocking device query (SNMP system group in production). Runs on the
// enrichment pool, never on an io thread. nullopt means the device did not
// answer.
class Enricher {
public:
    virtual ~Enricher() = default;
    virtual std::optional<Enrichment> enrich(const std::string& address) = 0;
};

struct DiscoveryOptions {
    std::chrono::milliseconds interval{std::chrono::minutes(5)};
    std::chrono::milliseconds min_scan_interval{std::chrono::minutes(1)};
};

struct SweepStats {
    bool rate_limited = false;
    std::size_t discovered = 0;
    std::size_t added = 0;
    std::size_t queued = 0;
    std::size_t skipped_suspended = 0;
    std::size_t skipped_in_flight = 0;
    std::size_t deferred = 0;   // enrichment pool backlog full
};

// Printable ASCII only: \n \r \t become spaces, other control and non-ASCII
// bytes are dropped, the result is capped at 1024 bytes and trimmed.
// nullopt for input containing NUL or nothing left after cleaning.
std::optional<std::string> sanitize_snmp_string(const std::string& raw);

class DiscoveryFeed {
public:
    DiscoveryFeed(boost::asio::io_context& io,
                  DeviceRegistry& registry,
                  ThreadPool& pool,
                  TargetSource targets,
                  std::shared_ptr<Enricher> enricher,
                  Metrics& metrics,
                  DiscoveryOptions opts);

    // Waits for enrichment jobs already handed to the pool.
    ~DiscoveryFeed();

    DiscoveryFeed(const DiscoveryFeed&) = delete;
    DiscoveryFeed& operator=(const DiscoveryFeed&) = delete;

    void start();

    // Queued jobs that have not started yet become no-ops.
    void stop();

    SweepStats sweep();

    std::size_t in_flight() const;

private:
    void enrich_one(const std::string& address);
    void finish(const std::string& address);

    DeviceRegistry& registry_;
    ThreadPool& pool_;
    TargetSource targets_;
    std::shared_ptr<Enricher> enricher_;
    Metrics& metrics_;
    DiscoveryOptions opts_;
    PeriodicTimer timer_;

    mutable std::mutex mu_;
    std::condition_variable idle_cv_;
    std::unordered_set<std::string> in_flight_;
    bool stopping_{false};
    std::optional<std::chrono::steady_clock::time_point> last_scan_;
};
