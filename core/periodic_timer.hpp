// filename: core/periodic_timer.hpp
#pragma once
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <mutex>

// Fixed-rate tick on an io_context. A tick that overruns the interval is
// followed immediately by the next one; missed ticks are not replayed.
// stop() may be called from any thread; the io_context must outlive this.
class PeriodicTimer {
public:
    PeriodicTimer(boost::asio::io_context& io, std::chrono::milliseconds interval,
                  std::function<void()> on_tick);
    ~PeriodicTimer();

    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    void start(bool tick_now = false);
    void stop();
    bool running() const;

    std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
    void arm_locked();
    void on_timer(const boost::system::error_code& ec);

    boost::asio::steady_timer timer_;
    std::chrono::milliseconds interval_;
    std::function<void()> on_tick_;

    mutable std::mutex mu_;   // guards timer_ and running_
    bool running_{false};
    std::chrono::steady_clock::time_point next_{};
};
