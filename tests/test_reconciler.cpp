// filename: tests/test_reconciler.cpp
#include <gtest/gtest.h>
#include "core/pruner.hpp"
#include "core/reconciler.hpp"
#include "test_helpers.hpp"
#include <map>
#include <mutex>

using namespace std::chrono_literals;

namespace {
    // Leaves every probe outstanding so monitors never touch the registry.
    class SilentProber : public Prober {
    public:
        explicit SilentProber(Strand strand) : strand_(std::move(strand)) {}

        void async_probe(const std::string&, Handler handler) override { handler_ = std::move(handler); }
        void cancel() override {
            if (!handler_) return;
            auto h = std::move(handler_);
            handler_ = nullptr;
            boost::asio::post(strand_, [h] {
                h(ProbeResult{0ns, make_error_code(boost::asio::error::operation_aborted)});
            });
        }

    private:
        Strand strand_;
        Handler handler_;
    };

    class NullSink : public MetricsSink {
    public:
        boost::system::error_code write_probe_result(const std::string&, std::chrono::nanoseconds,
                                                     bool) override {
            return {};
        }
    };

    // Everything a Reconciler needs, wired the way the daemon wires it.
    struct Harness {
        explicit Harness(Clock clock = &std::chrono::system_clock::now,
                         std::size_t max_monitors = 100)
            : registry(RegistryOptions{}, std::move(clock)),
              reconciler(runner.io(), registry,
                         [this](const std::string& address) {
                             auto m = std::make_shared<Monitor>(runner.io(), address, registry, sink,
                                                                make_prober, metrics, shutting_down,
                                                                MonitorOptions{20ms, false});
                             std::lock_guard<std::mutex> lk(mu);
                             created[address] = m;
                             return m;
                         },
                         ReconcilerOptions{20ms, max_monitors}) {}

        ~Harness() {
            reconciler.stop();
            runner.stop();
        }

        std::shared_ptr<Monitor> monitor_for(const std::string& address) {
            std::lock_guard<std::mutex> lk(mu);
            auto it = created.find(address);
            return it == created.end() ? nullptr : it->second;
        }

        IoRunner runner;
        DeviceRegistry registry;
        NullSink sink;
        Metrics metrics;
        std::atomic<bool> shutting_down{false};
        ProberFactory make_prober = [](Strand s) -> std::shared_ptr<Prober> {
            return std::make_shared<SilentProber>(std::move(s));
        };
        std::mutex mu;
        std::map<std::string, std::shared_ptr<Monitor>> created;
        Reconciler reconciler;
    };
}

TEST(ReconcilerTest, StartsOneMonitorPerDevice) {
    Harness h;
    h.registry.add("192.0.2.3");
    h.registry.add("192.0.2.1");
    h.registry.add("192.0.2.2");

    const ReconcileStats stats = h.reconciler.reconcile_once();
    EXPECT_EQ(stats.started, 3u);
    EXPECT_EQ(stats.stopped, 0u);
    EXPECT_EQ(h.reconciler.monitored(),
              (std::vector<std::string>{"192.0.2.1", "192.0.2.2", "192.0.2.3"}));
}

TEST(ReconcilerTest, SecondTickWithoutChangesIsNoOp) {
    Harness h;
    h.registry.add("192.0.2.1");
    h.registry.add("192.0.2.2");
    h.reconciler.reconcile_once();

    const ReconcileStats stats = h.reconciler.reconcile_once();
    EXPECT_EQ(stats.started, 0u);
    EXPECT_EQ(stats.stopped, 0u);
    EXPECT_EQ(stats.deferred, 0u);
    EXPECT_EQ(h.reconciler.running(), 2u);
}

TEST(ReconcilerTest, RemovedDeviceLosesItsMonitor) {
    Harness h;
    h.registry.add("192.0.2.1");
    h.registry.add("192.0.2.2");
    h.reconciler.reconcile_once();
    auto gone = h.monitor_for("192.0.2.2");
    ASSERT_NE(gone, nullptr);

    h.registry.remove("192.0.2.2");
    const ReconcileStats stats = h.reconciler.reconcile_once();
    EXPECT_EQ(stats.stopped, 1u);
    EXPECT_TRUE(gone->stopped());
    EXPECT_FALSE(h.reconciler.is_monitoring("192.0.2.2"));
    EXPECT_TRUE(h.reconciler.is_monitoring("192.0.2.1"));
}

TEST(ReconcilerTest, CapDefersExtraDevices) {
    Harness h(&std::chrono::system_clock::now, 2);
    h.registry.add("192.0.2.1");
    h.registry.add("192.0.2.2");
    h.registry.add("192.0.2.3");

    ReconcileStats stats = h.reconciler.reconcile_once();
    EXPECT_EQ(stats.started, 2u);
    EXPECT_EQ(stats.deferred, 1u);
    EXPECT_EQ(h.reconciler.monitored(), (std::vector<std::string>{"192.0.2.1", "192.0.2.2"}));

    h.registry.remove("192.0.2.1");
    stats = h.reconciler.reconcile_once();
    EXPECT_EQ(stats.stopped, 1u);
    EXPECT_EQ(stats.started, 1u);
    EXPECT_EQ(stats.deferred, 0u);
    EXPECT_EQ(h.reconciler.monitored(), (std::vector<std::string>{"192.0.2.2", "192.0.2.3"}));
}

TEST(ReconcilerTest, TimerDrivenTicksFollowRegistry) {
    Harness h;
    h.registry.add("192.0.2.1");
    h.reconciler.start();
    ASSERT_TRUE(wait_until([&] { return h.reconciler.running() == 1; }));

    h.registry.add("192.0.2.2");
    ASSERT_TRUE(wait_until([&] { return h.reconciler.running() == 2; }));

    h.registry.remove("192.0.2.1");
    ASSERT_TRUE(wait_until([&] { return !h.reconciler.is_monitoring("192.0.2.1"); }));
}

TEST(ReconcilerTest, StopHaltsEveryMonitor) {
    Harness h;
    h.registry.add("192.0.2.1");
    h.registry.add("192.0.2.2");
    h.reconciler.reconcile_once();

    h.reconciler.stop();
    EXPECT_EQ(h.reconciler.running(), 0u);
    EXPECT_TRUE(h.monitor_for("192.0.2.1")->stopped());
    EXPECT_TRUE(h.monitor_for("192.0.2.2")->stopped());

    const ReconcileStats stats = h.reconciler.reconcile_once();
    EXPECT_EQ(stats.started, 0u);
}

TEST(ReconcilerTest, PrunedSuspendedDeviceLeavesEverywhere) {
    FakeClock clock;
    Harness h(clock.fn());
    Pruner pruner(h.runner.io(), h.registry, PrunerOptions{60000ms, 3600s});

    h.registry.add("192.0.2.50");
    for (int i = 0; i < 3; ++i) h.registry.update("192.0.2.50", ProbeFailure{Protocol::Ping});
    h.reconciler.reconcile_once();
    ASSERT_TRUE(h.reconciler.is_monitoring("192.0.2.50"));
    ASSERT_EQ(h.registry.health().ping_suspended, 1);

    clock.advance(100s);   // still suspended
    h.registry.add("192.0.2.51");
    clock.advance(3550s);  // .50 unseen for more than an hour, .51 is not
    // The first window lapsed long ago; a fresh run of failures suspends again.
    for (int i = 0; i < 3; ++i) h.registry.update("192.0.2.50", ProbeFailure{Protocol::Ping});
    ASSERT_EQ(h.registry.health().ping_suspended, 1);

    const auto removed = pruner.prune_once();
    EXPECT_EQ(removed, std::vector<std::string>{"192.0.2.50"});
    EXPECT_EQ(h.registry.health().ping_suspended, 0);
    for (const Device& d : h.registry.snapshot()) EXPECT_NE(d.address, "192.0.2.50");

    const ReconcileStats stats = h.reconciler.reconcile_once();
    EXPECT_EQ(stats.stopped, 1u);
    EXPECT_TRUE(h.monitor_for("192.0.2.50")->stopped());
}
