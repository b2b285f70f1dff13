// filename: src/periodic_timer.cpp
#include "core/periodic_timer.hpp"
#include <stdexcept>

PeriodicTimer::PeriodicTimer(boost::asio::io_context& io, std::chrono::milliseconds interval,
                             std::function<void()> on_tick)
    : timer_(io),
      interval_(interval),
      on_tick_(std::move(on_tick))
{
    if (interval_.count() <= 0) throw std::invalid_argument("PeriodicTimer: interval must be positive");
}

PeriodicTimer::~PeriodicTimer() {
    stop();
}

void PeriodicTimer::start(bool tick_now) {
    std::lock_guard<std::mutex> lk(mu_);
    if (running_) return;
    running_ = true;
    next_ = std::chrono::steady_clock::now();
    if (!tick_now) next_ += interval_;
    timer_.expires_at(next_);
    timer_.async_wait([this](const boost::system::error_code& ec) { on_timer(ec); });
}

void PeriodicTimer::stop() {
    std::lock_guard<std::mutex> lk(mu_);
    if (!running_) return;
    running_ = false;
    timer_.cancel();
}

bool PeriodicTimer::running() const {
    std::lock_guard<std::mutex> lk(mu_);
    return running_;
}

void PeriodicTimer::arm_locked() {
    const auto now = std::chrono::steady_clock::now();
    next_ += interval_;
    if (next_ < now) next_ = now;
    timer_.expires_at(next_);
    timer_.async_wait([this](const boost::system::error_code& ec) { on_timer(ec); });
}

void PeriodicTimer::on_timer(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) return; // stopped or re-armed
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_) return;
    }
    on_tick_();
    std::lock_guard<std::mutex> lk(mu_);
    if (running_) arm_locked();
}
