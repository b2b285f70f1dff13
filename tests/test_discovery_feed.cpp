// filename: tests/test_discovery_feed.cpp
#include <gtest/gtest.h>
#include "core/discovery_feed.hpp"
#include "test_helpers.hpp"
#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>

using namespace std::chrono_literals;

namespace {
    class ScriptedEnricher : public Enricher {
    public:
        std::optional<Enrichment> enrich(const std::string& address) override {
            ++calls;
            std::unique_lock<std::mutex> lk(mu_);
            gate_cv_.wait(lk, [this] { return open_; });
            auto it = answers_.find(address);
            if (it == answers_.end()) return std::nullopt;
            return it->second;
        }

        void answer(const std::string& address, Enrichment e) {
            std::lock_guard<std::mutex> lk(mu_);
            answers_[address] = std::move(e);
        }

        void close_gate() {
            std::lock_guard<std::mutex> lk(mu_);
            open_ = false;
        }
        void open_gate() {
            {
                std::lock_guard<std::mutex> lk(mu_);
                open_ = true;
            }
            gate_cv_.notify_all();
        }

        std::atomic<int> calls{0};

    private:
        std::mutex mu_;
        std::condition_variable gate_cv_;
        bool open_ = true;
        std::map<std::string, Enrichment> answers_;
    };

    class ThrowingEnricher : public Enricher {
    public:
        std::optional<Enrichment> enrich(const std::string&) override {
            throw std::runtime_error("agent timed out");
        }
    };

    RegistryOptions registry_options() {
        RegistryOptions o;
        o.suspension.snmp = ProtocolPolicy{2, 300s};
        return o;
    }

    TargetSource fixed(std::vector<std::string> targets) {
        return [targets] { return targets; };
    }

    const DiscoveryOptions kNoRateLimit{60000ms, 0ms};
}

TEST(SanitizeSnmpStringTest, CleansAgentText) {
    EXPECT_EQ(sanitize_snmp_string("  core-sw1  "), std::optional<std::string>("core-sw1"));
    EXPECT_EQ(sanitize_snmp_string("Cisco IOS\r\nVersion 15.2\t(3)"),
              std::optional<std::string>("Cisco IOS  Version 15.2 (3)"));
    EXPECT_EQ(sanitize_snmp_string("bell\x07here\x7f\xc3\xa9"), std::optional<std::string>("bellhere"));
}

TEST(SanitizeSnmpStringTest, RejectsUnusableText) {
    EXPECT_FALSE(sanitize_snmp_string(std::string("abc\0def", 7)).has_value());
    EXPECT_FALSE(sanitize_snmp_string("").has_value());
    EXPECT_FALSE(sanitize_snmp_string(" \r\n\t ").has_value());
    EXPECT_FALSE(sanitize_snmp_string("\x01\x02").has_value());
}

TEST(SanitizeSnmpStringTest, CapsLength) {
    const auto clean = sanitize_snmp_string(std::string(5000, 'x'));
    ASSERT_TRUE(clean.has_value());
    EXPECT_EQ(clean->size(), 1024u);
}

TEST(DiscoveryFeedTest, SweepAddsTargetsAndEnriches) {
    IoRunner runner;
    DeviceRegistry registry(registry_options());
    ThreadPool pool(2, 16);
    Metrics metrics;
    auto enricher = std::make_shared<ScriptedEnricher>();
    enricher->answer("192.0.2.1", Enrichment{" core-sw1\n", "Core switch", "1.3.6.1.4.1.9.1.1"});

    DiscoveryFeed feed(runner.io(), registry, pool, fixed({"192.0.2.1", "192.0.2.2", ""}),
                       enricher, metrics, kNoRateLimit);
    const SweepStats stats = feed.sweep();
    EXPECT_EQ(stats.discovered, 2u);
    EXPECT_EQ(stats.added, 2u);
    EXPECT_EQ(stats.queued, 2u);

    ASSERT_TRUE(wait_until([&] { return feed.in_flight() == 0; }));
    const auto sw = registry.find("192.0.2.1");
    EXPECT_EQ(sw->enrichment.hostname, "core-sw1");
    EXPECT_EQ(sw->enrichment.description, "Core switch");
    EXPECT_EQ(sw->snmp_consecutive_fails, 0);

    const auto silent = registry.find("192.0.2.2");
    EXPECT_EQ(silent->enrichment.hostname, "192.0.2.2");
    EXPECT_EQ(silent->snmp_consecutive_fails, 1);
    EXPECT_EQ(metrics.enrichments.load(), 1u);
    EXPECT_EQ(metrics.enrichment_failures.load(), 1u);
    runner.stop();
}

TEST(DiscoveryFeedTest, RediscoveryIsNotNew) {
    IoRunner runner;
    DeviceRegistry registry(registry_options());
    ThreadPool pool(1, 16);
    Metrics metrics;
    DiscoveryFeed feed(runner.io(), registry, pool, fixed({"192.0.2.1"}), nullptr, metrics,
                       kNoRateLimit);

    EXPECT_EQ(feed.sweep().added, 1u);
    const SweepStats again = feed.sweep();
    EXPECT_EQ(again.discovered, 1u);
    EXPECT_EQ(again.added, 0u);
    EXPECT_EQ(again.queued, 0u);
    runner.stop();
}

TEST(DiscoveryFeedTest, RepeatedFailuresSuspendSnmpAndSkipDevice) {
    IoRunner runner;
    DeviceRegistry registry(registry_options());
    ThreadPool pool(1, 16);
    Metrics metrics;
    auto enricher = std::make_shared<ScriptedEnricher>();
    DiscoveryFeed feed(runner.io(), registry, pool, fixed({"192.0.2.9"}), enricher, metrics,
                       kNoRateLimit);

    for (int i = 0; i < 2; ++i) {
        feed.sweep();
        ASSERT_TRUE(wait_until([&] { return feed.in_flight() == 0; }));
    }
    EXPECT_TRUE(registry.is_suspended("192.0.2.9", Protocol::Snmp));
    EXPECT_EQ(registry.health().snmp_suspended, 1);

    const SweepStats stats = feed.sweep();
    EXPECT_EQ(stats.skipped_suspended, 1u);
    EXPECT_EQ(stats.queued, 0u);
    EXPECT_EQ(enricher->calls.load(), 2);
    runner.stop();
}

TEST(DiscoveryFeedTest, InFlightDeviceIsNotQueuedTwice) {
    IoRunner runner;
    DeviceRegistry registry(registry_options());
    ThreadPool pool(1, 16);
    Metrics metrics;
    auto enricher = std::make_shared<ScriptedEnricher>();
    enricher->close_gate();
    DiscoveryFeed feed(runner.io(), registry, pool, fixed({"192.0.2.1"}), enricher, metrics,
                       kNoRateLimit);

    EXPECT_EQ(feed.sweep().queued, 1u);
    const SweepStats second = feed.sweep();
    EXPECT_EQ(second.queued, 0u);
    EXPECT_EQ(second.skipped_in_flight, 1u);

    enricher->open_gate();
    ASSERT_TRUE(wait_until([&] { return feed.in_flight() == 0; }));
    runner.stop();
}

TEST(DiscoveryFeedTest, FullBacklogDefersToNextSweep) {
    IoRunner runner;
    DeviceRegistry registry(registry_options());
    ThreadPool pool(1, 1);
    Metrics metrics;
    auto enricher = std::make_shared<ScriptedEnricher>();
    enricher->close_gate();
    DiscoveryFeed feed(runner.io(), registry, pool,
                       fixed({"192.0.2.1", "192.0.2.2", "192.0.2.3"}), enricher, metrics,
                       kNoRateLimit);

    // One job blocks the only worker; the backlog holds one more.
    feed.sweep();
    ASSERT_TRUE(wait_until([&] { return enricher->calls.load() == 1; }));
    const SweepStats stats = feed.sweep();
    EXPECT_EQ(stats.skipped_in_flight + stats.queued + stats.deferred, 3u);
    EXPECT_GE(stats.deferred, 1u);
    EXPECT_EQ(pool.backlog(), 1u);
    EXPECT_EQ(feed.in_flight(), 2u);

    enricher->open_gate();
    ASSERT_TRUE(wait_until([&] { return feed.in_flight() == 0; }));
    runner.stop();
}

TEST(DiscoveryFeedTest, MinScanIntervalLimitsSweeps) {
    IoRunner runner;
    DeviceRegistry registry(registry_options());
    ThreadPool pool(1, 16);
    Metrics metrics;
    DiscoveryFeed feed(runner.io(), registry, pool, fixed({"192.0.2.1"}), nullptr, metrics,
                       DiscoveryOptions{60000ms, 3600s});

    EXPECT_FALSE(feed.sweep().rate_limited);
    const SweepStats limited = feed.sweep();
    EXPECT_TRUE(limited.rate_limited);
    EXPECT_EQ(limited.discovered, 0u);
    runner.stop();
}

TEST(DiscoveryFeedTest, ThrowingEnricherCountsAsFailure) {
    IoRunner runner;
    DeviceRegistry registry(registry_options());
    ThreadPool pool(1, 16);
    Metrics metrics;
    DiscoveryFeed feed(runner.io(), registry, pool, fixed({"192.0.2.1"}),
                       std::make_shared<ThrowingEnricher>(), metrics, kNoRateLimit);

    feed.sweep();
    ASSERT_TRUE(wait_until([&] { return feed.in_flight() == 0; }));
    EXPECT_EQ(registry.find("192.0.2.1")->snmp_consecutive_fails, 1);
    EXPECT_EQ(metrics.enrichment_failures.load(), 1u);
    runner.stop();
}

TEST(DiscoveryFeedTest, StoppedFeedDropsQueuedJobs) {
    IoRunner runner;
    DeviceRegistry registry(registry_options());
    ThreadPool pool(1, 16);
    Metrics metrics;
    auto enricher = std::make_shared<ScriptedEnricher>();
    enricher->close_gate();
    DiscoveryFeed feed(runner.io(), registry, pool, fixed({"192.0.2.1", "192.0.2.2"}), enricher,
                       metrics, kNoRateLimit);

    EXPECT_EQ(feed.sweep().queued, 2u);
    ASSERT_TRUE(wait_until([&] { return enricher->calls.load() == 1; }));
    feed.stop();
    enricher->open_gate();
    ASSERT_TRUE(wait_until([&] { return feed.in_flight() == 0; }));

    EXPECT_EQ(enricher->calls.load(), 1);
    EXPECT_EQ(metrics.enrichments.load() + metrics.enrichment_failures.load(), 0u);
    EXPECT_EQ(feed.sweep().discovered, 0u);
    runner.stop();
}

TEST(DiscoveryFeedTest, TimerSweepsImmediatelyOnStart) {
    IoRunner runner;
    DeviceRegistry registry(registry_options());
    ThreadPool pool(1, 16);
    Metrics metrics;
    DiscoveryFeed feed(runner.io(), registry, pool, fixed({"192.0.2.1", "192.0.2.2"}), nullptr,
                       metrics, kNoRateLimit);

    feed.start();
    EXPECT_TRUE(wait_until([&] { return registry.size() == 2; }));
    feed.stop();
    runner.stop();
}
