// filename: src/netmon.cpp
#include "core/config.hpp"
#include "core/device_registry.hpp"
#include "core/discovery_feed.hpp"
#include "core/icmp_prober.hpp"
#include "core/metrics.hpp"
#include "core/metrics_sink.hpp"
#include "core/monitor.hpp"
#include "core/periodic_timer.hpp"
#include "core/pruner.hpp"
#include "core/reconciler.hpp"
#include "core/thread_pool.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <csignal>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {
    void log_health(DeviceRegistry& registry, const Reconciler& reconciler, const Metrics& m) {
        const RegistryHealth h = registry.health();
        std::cout << "[netmon] health: devices=" << h.device_count
                  << " ping_suspended=" << h.ping_suspended
                  << " snmp_suspended=" << h.snmp_suspended
                  << " monitors=" << reconciler.running()
                  << " probes=" << m.probes_sent.load(std::memory_order_relaxed)
                  << " ok=" << m.probes_succeeded.load(std::memory_order_relaxed)
                  << " sink_failures=" << m.sink_failures.load(std::memory_order_relaxed)
                  << " enrichments=" << m.enrichments.load(std::memory_order_relaxed)
                  << "/" << m.enrichment_failures.load(std::memory_order_relaxed) << " failed\n";
    }
}

int main(int argc, char* argv[]) {
    std::cout << "[netmon] main() starting\n";
    if (argc != 1) {
        std::cerr << "Usage: " << argv[0] << " (settings are read from NETMON_* environment variables)\n";
        return 1;
    }

    MonitorConfig cfg;
    try {
        cfg = load_config();
        validate_config(cfg);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[netmon] " << e.what() << "\n";
        return 1;
    }
    if (cfg.targets.empty()) {
        std::cerr << "[netmon] NETMON_TARGETS is empty; nothing will be monitored until devices appear\n";
    }

    std::ofstream sample_file;
    std::ostream* sample_out = &std::cout;
    if (!cfg.sample_log.empty()) {
        sample_file.open(cfg.sample_log, std::ios::app);
        if (!sample_file) {
            std::cerr << "[netmon] cannot open sample log '" << cfg.sample_log << "'\n";
            return 1;
        }
        sample_out = &sample_file;
    }
    LogMetricsSink sink(*sample_out);

    boost::asio::io_context io;
    auto work = boost::asio::make_work_guard(io);

    Metrics metrics;
    std::atomic<bool> shutting_down{false};
    DeviceRegistry registry(cfg.registry);
    ThreadPool enrich_pool(cfg.workers, cfg.worker_backlog);

    const std::chrono::milliseconds probe_timeout = cfg.probe_timeout;
    const ProberFactory make_prober = [probe_timeout](Strand strand) -> std::shared_ptr<Prober> {
        return std::make_shared<IcmpProber>(std::move(strand), probe_timeout);
    };
    const MonitorOptions monitor_opts{cfg.probe_interval, cfg.verbose};

    Reconciler reconciler(
        io, registry,
        [&](const std::string& address) {
            return std::make_shared<Monitor>(io, address, registry, sink, make_prober,
                                             metrics, shutting_down, monitor_opts);
        },
        ReconcilerOptions{cfg.reconcile_interval, cfg.max_monitors});

    Pruner pruner(io, registry, PrunerOptions{cfg.prune_interval, cfg.retention});

    // No SNMP client is linked in; sweeps only register the configured targets.
    std::cout << "[netmon] snmp enrichment disabled (no enricher configured)\n";
    const std::vector<std::string> targets = cfg.targets;
    DiscoveryFeed discovery(io, registry, enrich_pool, [targets] { return targets; },
                            nullptr, metrics,
                            DiscoveryOptions{cfg.discovery_interval, cfg.min_scan_interval});

    PeriodicTimer health(io, cfg.health_interval,
                         [&] { log_health(registry, reconciler, metrics); });

    std::promise<int> stop_requested;
    auto stop_signal = stop_requested.get_future();
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        shutting_down.store(true, std::memory_order_release);
        stop_requested.set_value(signo);
    });

    discovery.start();
    reconciler.start();
    pruner.start();
    health.start();

    std::vector<std::thread> io_threads;
    io_threads.reserve(cfg.io_threads);
    for (std::size_t i = 0; i < cfg.io_threads; ++i) {
        io_threads.emplace_back([&io] { io.run(); });
    }
    std::cout << "[netmon] running: " << cfg.targets.size() << " targets, "
              << cfg.io_threads << " io threads, " << enrich_pool.size() << " enrichment workers\n";

    const int signo = stop_signal.get();
    std::cout << "[netmon] signal " << signo << " received, shutting down\n";

    discovery.stop();
    pruner.stop();
    health.stop();
    reconciler.stop();
    enrich_pool.shutdown();

    work.reset();
    io.stop();
    for (auto& t : io_threads) t.join();

    // Run what stop() left queued so monitors and probers release their sockets.
    io.restart();
    io.poll();

    log_health(registry, reconciler, metrics);
    std::cout << "[netmon] stopped\n";
    return 0;
}
