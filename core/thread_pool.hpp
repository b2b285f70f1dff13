// filename: core/thread_pool.hpp
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Fixed set of workers for blocking jobs (enrichment queries). A max_backlog
// of 0 leaves the queue unbounded.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t n, std::size_t max_backlog = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // false if the pool is stopping or the backlog is at its bound.
    template <class F>
    bool try_post(F&& f) {
        if (stop_.load(std::memory_order_acquire)) return false;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (stop_) return false;
            if (max_backlog_ && tasks_.size() >= max_backlog_) return false;
            tasks_.emplace(std::forward<F>(f));
        }
        cv_.notify_one();
        return true;
    }

    // Runs what is queued, then joins. Idempotent.
    void shutdown();

    std::size_t size() const noexcept { return threads_.size(); }
    std::size_t backlog() const;
    std::size_t max_backlog() const noexcept { return max_backlog_; }

private:
    void worker_loop();

    const std::size_t max_backlog_;
    std::atomic<bool> stop_{false};
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> tasks_;
    std::vector<std::thread> threads_;
    std::once_flag joined_;
};
