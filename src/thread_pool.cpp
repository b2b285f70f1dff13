// filename: src/thread_pool.cpp
#include "core/thread_pool.hpp"
#include <exception>
#include <iostream>

ThreadPool::ThreadPool(std::size_t n, std::size_t max_backlog)
    : max_backlog_(max_backlog)
{
    if (n == 0) n = 1;
    threads_.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        threads_.emplace_back([this] { worker_loop(); });
    }
}

void ThreadPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [this]{
                return stop_.load(std::memory_order_acquire) || !tasks_.empty();
            });
            if (stop_.load(std::memory_order_relaxed) && tasks_.empty())
                return; // graceful shutdown after draining
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        try {
            task();
        } catch (const std::exception& e) {
            // keep the pool alive if a task throws
            std::cerr << "[thread_pool] task threw std::exception: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[thread_pool] task threw unknown exception\n";
        }
    }
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
    std::call_once(joined_, [this] {
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
    });
}

std::size_t ThreadPool::backlog() const {
    std::lock_guard<std::mutex> lk(mu_);
    return tasks_.size();
}

ThreadPool::~ThreadPool() {
    shutdown();
}
