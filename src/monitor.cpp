// filename: src/monitor.cpp
#include "core/monitor.hpp"
#include <iostream>
#include <random>
#include <stdexcept>

namespace {
    // Spread the first probe of a freshly started fleet across one interval.
    std::chrono::milliseconds initial_offset(std::chrono::milliseconds interval) {
        thread_local std::minstd_rand rng{std::random_device{}()};
        std::uniform_int_distribution<long long> dist(0, interval.count() - 1);
        return std::chrono::milliseconds(dist(rng));
    }
}

Monitor::Monitor(boost::asio::io_context& io,
                 std::string address,
                 DeviceRegistry& registry,
                 MetricsSink& sink,
                 const ProberFactory& make_prober,
                 Metrics& metrics,
                 const std::atomic<bool>& shutting_down,
                 MonitorOptions opts)
    : strand_(io.get_executor()),
      timer_(strand_),
      address_(std::move(address)),
      registry_(registry),
      sink_(sink),
      prober_(make_prober(strand_)),
      metrics_(metrics),
      shutting_down_(shutting_down),
      opts_(opts)
{
    if (!prober_) throw std::invalid_argument("Monitor: prober factory returned null");
    if (opts_.interval.count() <= 0) throw std::invalid_argument("Monitor: interval must be positive");
}

void Monitor::start() {
    auto self = shared_from_this();
    boost::asio::post(strand_, [self] {
        self->next_tick_ = std::chrono::steady_clock::now() + initial_offset(self->opts_.interval);
        self->arm(self->next_tick_);
    });
}

void Monitor::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopped_) return;
        stopped_ = true;
    }
    auto self = shared_from_this();
    boost::asio::post(strand_, [self] {
        self->timer_.cancel();
        self->prober_->cancel();
    });
}

bool Monitor::stopped() const {
    std::lock_guard<std::mutex> lk(mu_);
    return stopped_;
}

void Monitor::arm(std::chrono::steady_clock::time_point at) {
    auto self = shared_from_this();
    timer_.expires_at(at);
    timer_.async_wait([self](const boost::system::error_code& ec) { self->on_tick(ec); });
}

void Monitor::on_tick(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) return;
    if (stopped() || shutting_down_.load(std::memory_order_acquire)) return;

    if (const char* why = probe_target_rejection(address_)) {
        if (!rejected_logged_) {
            std::cerr << "[monitor] not probing " << address_ << ": " << why << "\n";
            rejected_logged_ = true;
        }
        next_tick_ += opts_.interval;
        arm(next_tick_);
        return;
    }

    metrics_.probes_sent.fetch_add(1, std::memory_order_relaxed);
    auto self = shared_from_this();
    prober_->async_probe(address_, [self](const ProbeResult& r) {
        boost::asio::dispatch(self->strand_, [self, r] { self->on_probe(r); });
    });
}

void Monitor::on_probe(const ProbeResult& result) {
    if (result.ec == boost::asio::error::operation_aborted) return;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopped_) return;

        const bool ok = result.succeeded();
        if (ok) {
            metrics_.probes_succeeded.fetch_add(1, std::memory_order_relaxed);
            registry_.update(address_, ProbeSuccess{Protocol::Ping});
        } else {
            registry_.update(address_, ProbeFailure{Protocol::Ping});
        }
        deliver_locked(Sample{ok ? result.rtt : std::chrono::nanoseconds(0), ok});
        completed_.fetch_add(1, std::memory_order_relaxed);

        if (opts_.verbose) {
            if (ok) {
                std::cout << "[monitor] " << address_ << " ok rtt="
                          << std::chrono::duration<double, std::milli>(result.rtt).count() << "ms\n";
            } else {
                std::cout << "[monitor] " << address_ << " no reply"
                          << (result.ec ? " (" + result.ec.message() + ")" : std::string()) << "\n";
            }
        }
    }

    const auto now = std::chrono::steady_clock::now();
    next_tick_ += opts_.interval;
    if (next_tick_ < now) next_tick_ = now;
    arm(next_tick_);
}

// Sink errors never reach the probe loop: the refused sample is kept and
// retried on the next tick. Only the newest refused sample is kept.
void Monitor::deliver_locked(const Sample& sample) {
    if (unsent_) {
        if (auto ec = sink_.write_probe_result(address_, unsent_->rtt, unsent_->success)) {
            metrics_.sink_failures.fetch_add(1, std::memory_order_relaxed);
            std::cerr << "[monitor] sink retry failed for " << address_ << ": " << ec.message()
                      << " (dropping older sample)\n";
            unsent_ = sample;
            return;
        }
        unsent_.reset();
    }
    if (auto ec = sink_.write_probe_result(address_, sample.rtt, sample.success)) {
        metrics_.sink_failures.fetch_add(1, std::memory_order_relaxed);
        std::cerr << "[monitor] sink write failed for " << address_ << ": " << ec.message()
                  << " (retry next tick)\n";
        unsent_ = sample;
    }
}
