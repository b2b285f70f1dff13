// filename: core/metrics.hpp
#pragma once
#include <atomic>
#include <cstdint>

// Process-wide activity counters, reported next to the registry health.
struct Metrics {
    std::atomic<uint64_t> probes_sent{0};
    std::atomic<uint64_t> probes_succeeded{0};
    std::atomic<uint64_t> sink_failures{0};
    std::atomic<uint64_t> enrichments{0};
    std::atomic<uint64_t> enrichment_failures{0};
};
