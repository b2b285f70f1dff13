// filename: src/reconciler.cpp
#include "core/reconciler.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

Reconciler::Reconciler(boost::asio::io_context& io,
                       DeviceRegistry& registry,
                       MonitorFactory make_monitor,
                       ReconcilerOptions opts)
    : registry_(registry),
      make_monitor_(std::move(make_monitor)),
      opts_(opts),
      timer_(io, opts.interval, [this] { reconcile_once(); })
{
    if (!make_monitor_) throw std::invalid_argument("Reconciler: monitor factory must be callable");
}

Reconciler::~Reconciler() {
    stop();
}

void Reconciler::start() {
    {
        std::lock_guard<std::mutex> lk(tasks_mu_);
        stopping_ = false;
    }
    timer_.start(true);
}

void Reconciler::stop() {
    timer_.stop();
    std::unordered_map<std::string, std::shared_ptr<Monitor>> tasks;
    {
        std::lock_guard<std::mutex> lk(tasks_mu_);
        stopping_ = true;
        tasks.swap(tasks_);
    }
    for (auto& kv : tasks) kv.second->stop();
    if (!tasks.empty()) {
        std::cout << "[reconciler] stopped " << tasks.size() << " monitors\n";
    }
}

ReconcileStats Reconciler::reconcile_once() {
    ReconcileStats stats;

    // Taken before tasks_mu_ so the two locks never nest.
    std::vector<std::string> devices;
    std::unordered_set<std::string> wanted;
    for (const Device& d : registry_.snapshot()) {
        devices.push_back(d.address);
        wanted.insert(d.address);
    }

    std::lock_guard<std::mutex> lk(tasks_mu_);
    if (stopping_) return stats;

    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (wanted.count(it->first)) {
            ++it;
            continue;
        }
        it->second->stop();
        std::cout << "[reconciler] stopped monitor for " << it->first << "\n";
        it = tasks_.erase(it);
        ++stats.stopped;
    }

    // Snapshot order is address order, so admission under the cap is stable.
    for (const std::string& address : devices) {
        if (tasks_.count(address)) continue;
        if (tasks_.size() >= opts_.max_monitors) {
            ++stats.deferred;
            continue;
        }
        auto monitor = make_monitor_(address);
        monitor->start();
        tasks_.emplace(address, std::move(monitor));
        ++stats.started;
    }

    if (stats.started) {
        std::cout << "[reconciler] started " << stats.started << " monitors ("
                  << tasks_.size() << " running)\n";
    }
    if (stats.deferred) {
        std::cerr << "[reconciler] monitor limit reached (" << opts_.max_monitors
                  << "), deferring " << stats.deferred << " devices to the next tick\n";
    }
    return stats;
}

std::size_t Reconciler::running() const {
    std::lock_guard<std::mutex> lk(tasks_mu_);
    return tasks_.size();
}

bool Reconciler::is_monitoring(const std::string& address) const {
    std::lock_guard<std::mutex> lk(tasks_mu_);
    return tasks_.count(address) != 0;
}

std::vector<std::string> Reconciler::monitored() const {
    std::vector<std::string> out;
    {
        std::lock_guard<std::mutex> lk(tasks_mu_);
        out.reserve(tasks_.size());
        for (const auto& kv : tasks_) out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}
