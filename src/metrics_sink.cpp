// filename: src/metrics_sink.cpp
#include "core/metrics_sink.hpp"
#include <boost/system/error_code.hpp>
#include <ostream>

LogMetricsSink::LogMetricsSink(std::ostream& out) : out_(out) {}

boost::system::error_code LogMetricsSink::write_probe_result(const std::string& address,
                                                            std::chrono::nanoseconds rtt,
                                                            bool success) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!out_) return boost::system::errc::make_error_code(boost::system::errc::io_error);

    const double rtt_ms = std::chrono::duration<double, std::milli>(rtt).count();
    out_ << "[sink] ping ip=" << address
         << " rtt_ms=" << rtt_ms
         << " success=" << (success ? "true" : "false") << "\n";
    if (!out_) return boost::system::errc::make_error_code(boost::system::errc::io_error);
    return {};
}
