// filename: src/pruner.cpp
#include "core/pruner.hpp"
#include <iostream>
#include <stdexcept>

Pruner::Pruner(boost::asio::io_context& io, DeviceRegistry& registry, PrunerOptions opts)
    : registry_(registry),
      opts_(opts),
      timer_(io, opts.interval, [this] { prune_once(); })
{
    if (opts_.retention.count() <= 0) throw std::invalid_argument("Pruner: retention must be positive");
}

std::vector<std::string> Pruner::prune_once() {
    std::vector<std::string> removed;
    const TimePoint now = registry_.now();
    const TimePoint cutoff = now - opts_.retention;

    const std::size_t expired = registry_.expire_due();
    if (expired) {
        std::cout << "[pruner] acknowledged " << expired << " expired suspensions\n";
    }

    for (const Device& d : registry_.snapshot()) {
        if (!(d.last_seen < cutoff)) continue;
        // Re-checked under the registry lock: a device seen since the
        // snapshot survives.
        if (!registry_.remove_stale(d.address, cutoff)) continue;
        const auto unseen = std::chrono::duration_cast<std::chrono::seconds>(now - d.last_seen);
        std::cout << "[pruner] pruned " << d.address << " (" << d.enrichment.hostname
                  << "), unseen for " << unseen.count() << "s\n";
        removed.push_back(d.address);
    }
    return removed;
}
