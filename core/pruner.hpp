// filename: core/pruner.hpp
#pragma once
#include "core/device_registry.hpp"
#include "core/periodic_timer.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <string>
#include <vector>

struct PrunerOptions {
    std::chrono::milliseconds interval{std::chrono::minutes(1)};
    std::chrono::milliseconds retention{std::chrono::hours(24)};
};

// Evicts devices unseen for longer than the retention window. Their monitors
// are stopped by the next reconciliation tick.
class Pruner {
public:
    Pruner(boost::asio::io_context& io, DeviceRegistry& registry, PrunerOptions opts);

    void start() { timer_.start(); }
    void stop() { timer_.stop(); }

    // Returns the removed addresses.
    std::vector<std::string> prune_once();

private:
    DeviceRegistry& registry_;
    PrunerOptions opts_;
    PeriodicTimer timer_;
};
