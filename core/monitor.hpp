// filename: core/monitor.hpp
#pragma once
#include "core/device_registry.hpp"
#include "core/metrics.hpp"
#include "core/metrics_sink.hpp"
#include "core/prober.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct MonitorOptions {
    std::chrono::milliseconds interval{5000};
    bool verbose = false;
};

// Liveness loop for one device: probe, report to the registry, forward the
// sample to the sink, wait for the next tick. Runs on its own strand.
class Monitor : public std::enable_shared_from_this<Monitor> {
public:
    Monitor(boost::asio::io_context& io,
            std::string address,
            DeviceRegistry& registry,
            MetricsSink& sink,
            const ProberFactory& make_prober,
            Metrics& metrics,
            const std::atomic<bool>& shutting_down,
            MonitorOptions opts);

    Monitor(const Monitor&) = delete;
    Monitor& operator=(const Monitor&) = delete;

    void start();

    // Once this returns the monitor issues no further registry or sink call;
    // a report already in progress is waited for. Timer and probe are
    // cancelled asynchronously.
    void stop();

    bool stopped() const;
    const std::string& address() const noexcept { return address_; }
    std::uint64_t completed_probes() const noexcept { return completed_.load(std::memory_order_relaxed); }

private:
    struct Sample {
        std::chrono::nanoseconds rtt;
        bool success;
    };

    void arm(std::chrono::steady_clock::time_point at);
    void on_tick(const boost::system::error_code& ec);
    void on_probe(const ProbeResult& result);
    void deliver_locked(const Sample& sample);

    Strand strand_;
    boost::asio::steady_timer timer_;
    std::string address_;
    DeviceRegistry& registry_;
    MetricsSink& sink_;
    std::shared_ptr<Prober> prober_;
    Metrics& metrics_;
    const std::atomic<bool>& shutting_down_;
    MonitorOptions opts_;

    std::chrono::steady_clock::time_point next_tick_{};
    bool rejected_logged_{false};
    std::atomic<std::uint64_t> completed_{0};

    mutable std::mutex mu_;          // guards stopped_ and the report path
    bool stopped_{false};
    std::optional<Sample> unsent_;   // last sample the sink refused
};
