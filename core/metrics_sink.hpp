// filename: core/metrics_sink.hpp
#pragma once
#include <boost/system/error_code.hpp>
#include <chrono>
#include <iosfwd>
#include <mutex>
#include <string>

// Destination for per-probe samples (a time-series writer in production).
// Implementations must be safe to call from many monitors at once.
class MetricsSink {
public:
    virtual ~MetricsSink() = default;
    virtual boost::system::error_code write_probe_result(const std::string& address,
                                                         std::chrono::nanoseconds rtt,
                                                         bool success) = 0;
};

// Writes one line per sample to a stream; a failed stream is a write error.
class LogMetricsSink : public MetricsSink {
public:
    explicit LogMetricsSink(std::ostream& out);

    boost::system::error_code write_probe_result(const std::string& address,
                                                 std::chrono::nanoseconds rtt,
                                                 bool success) override;

private:
    std::mutex mu_;
    std::ostream& out_;
};
