// filename: src/discovery_feed.cpp
#include "core/discovery_feed.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>

namespace {
    constexpr std::size_t kMaxSnmpString = 1024;

    bool clean_field(std::string& field) {
        auto clean = sanitize_snmp_string(field);
        if (!clean) return false;
        field = std::move(*clean);
        return true;
    }
}

std::optional<std::string> sanitize_snmp_string(const std::string& raw) {
    if (raw.find('\0') != std::string::npos) return std::nullopt;

    const std::size_t n = std::min(raw.size(), kMaxSnmpString);
    std::string out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(raw[i]);
        if (c == '\n' || c == '\r' || c == '\t') {
            out.push_back(' ');
        } else if (c >= 32 && c <= 126) {
            out.push_back(static_cast<char>(c));
        }
    }

    const auto first = out.find_first_not_of(' ');
    if (first == std::string::npos) return std::nullopt;
    const auto last = out.find_last_not_of(' ');
    return out.substr(first, last - first + 1);
}

DiscoveryFeed::DiscoveryFeed(boost::asio::io_context& io,
                             DeviceRegistry& registry,
                             ThreadPool& pool,
                             TargetSource targets,
                             std::shared_ptr<Enricher> enricher,
                             Metrics& metrics,
                             DiscoveryOptions opts)
    : registry_(registry),
      pool_(pool),
      targets_(std::move(targets)),
      enricher_(std::move(enricher)),
      metrics_(metrics),
      opts_(opts),
      timer_(io, opts.interval, [this] { sweep(); })
{
    if (!targets_) throw std::invalid_argument("DiscoveryFeed: target source must be callable");
    if (opts_.min_scan_interval.count() < 0)
        throw std::invalid_argument("DiscoveryFeed: min_scan_interval must not be negative");
}

DiscoveryFeed::~DiscoveryFeed() {
    stop();
    std::unique_lock<std::mutex> lk(mu_);
    idle_cv_.wait(lk, [this] { return in_flight_.empty(); });
}

void DiscoveryFeed::start() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopping_ = false;
    }
    timer_.start(true);
}

void DiscoveryFeed::stop() {
    timer_.stop();
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
}

std::size_t DiscoveryFeed::in_flight() const {
    std::lock_guard<std::mutex> lk(mu_);
    return in_flight_.size();
}

SweepStats DiscoveryFeed::sweep() {
    SweepStats stats;
    const auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_) return stats;
        if (last_scan_ && now - *last_scan_ < opts_.min_scan_interval) {
            stats.rate_limited = true;
        } else {
            last_scan_ = now;
        }
    }
    if (stats.rate_limited) {
        std::cout << "[discovery] sweep rate limited (min interval "
                  << std::chrono::duration_cast<std::chrono::seconds>(opts_.min_scan_interval).count()
                  << "s), skipping\n";
        return stats;
    }

    for (const std::string& address : targets_()) {
        if (address.empty()) continue;
        ++stats.discovered;
        if (registry_.add(address)) ++stats.added;
    }

    if (enricher_) {
        for (const Device& d : registry_.snapshot()) {
            if (registry_.is_suspended(d.address, Protocol::Snmp)) {
                ++stats.skipped_suspended;
                continue;
            }
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (stopping_) break;
                if (!in_flight_.insert(d.address).second) {
                    ++stats.skipped_in_flight;
                    continue;
                }
            }
            const std::string address = d.address;
            if (pool_.try_post([this, address] { enrich_one(address); })) {
                ++stats.queued;
            } else {
                finish(address);
                ++stats.deferred;
            }
        }
    }

    std::cout << "[discovery] sweep: " << stats.discovered << " targets, " << stats.added
              << " new, " << stats.queued << " enrichments queued\n";
    if (stats.deferred) {
        std::cerr << "[discovery] enrichment backlog full, deferring " << stats.deferred
                  << " devices to the next sweep\n";
    }
    return stats;
}

void DiscoveryFeed::finish(const std::string& address) {
    std::lock_guard<std::mutex> lk(mu_);
    in_flight_.erase(address);
    if (in_flight_.empty()) idle_cv_.notify_all();
}

void DiscoveryFeed::enrich_one(const std::string& address) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_) {
            in_flight_.erase(address);
            if (in_flight_.empty()) idle_cv_.notify_all();
            return;
        }
    }
    // Pruned or suspended while queued.
    if (!registry_.find(address) || registry_.is_suspended(address, Protocol::Snmp)) {
        finish(address);
        return;
    }

    std::optional<Enrichment> result;
    try {
        result = enricher_->enrich(address);
    } catch (const std::exception& e) {
        std::cerr << "[discovery] enrichment of " << address << " threw: " << e.what() << "\n";
        result.reset();
    }

    if (result && !(clean_field(result->hostname) && clean_field(result->description))) {
        std::cerr << "[discovery] " << address << " returned unusable system strings\n";
        result.reset();
    }
    if (result && !result->object_id.empty() && !clean_field(result->object_id)) {
        result->object_id.clear();
    }

    bool gone = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        gone = stopping_;
    }
    if (!gone && registry_.find(address)) {
        if (result) {
            metrics_.enrichments.fetch_add(1, std::memory_order_relaxed);
            registry_.update(address, ProbeSuccess{Protocol::Snmp});
            registry_.update(address, *result);
        } else {
            metrics_.enrichment_failures.fetch_add(1, std::memory_order_relaxed);
            registry_.update(address, ProbeFailure{Protocol::Snmp});
        }
    }
    finish(address);
}
