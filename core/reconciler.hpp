// filename: core/reconciler.hpp
#pragma once
#include "core/device_registry.hpp"
#include "core/monitor.hpp"
#include "core/periodic_timer.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct ReconcilerOptions {
    std::chrono::milliseconds interval{5000};
    std::size_t max_monitors = 20000;
};

struct ReconcileStats {
    std::size_t started = 0;
    std::size_t stopped = 0;
    std::size_t deferred = 0;   // wanted a monitor but the cap was reached
};

using MonitorFactory = std::function<std::shared_ptr<Monitor>(const std::string& address)>;

// Keeps exactly one running Monitor per registry device. Owns the task
// registry (address -> monitor); the device registry knows nothing of tasks.
class Reconciler {
public:
    Reconciler(boost::asio::io_context& io,
               DeviceRegistry& registry,
               MonitorFactory make_monitor,
               ReconcilerOptions opts);
    ~Reconciler();

    Reconciler(const Reconciler&) = delete;
    Reconciler& operator=(const Reconciler&) = delete;

    void start();

    // Stops the tick and every monitor, waiting for each to finish reporting.
    void stop();

    ReconcileStats reconcile_once();

    std::size_t running() const;
    bool is_monitoring(const std::string& address) const;
    std::vector<std::string> monitored() const;

private:
    DeviceRegistry& registry_;
    MonitorFactory make_monitor_;
    ReconcilerOptions opts_;
    PeriodicTimer timer_;

    mutable std::mutex tasks_mu_;
    std::unordered_map<std::string, std::shared_ptr<Monitor>> tasks_;
    bool stopping_{false};
};
