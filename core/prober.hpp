// filename: core/prober.hpp
#pragma once
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

struct ProbeResult {
    std::chrono::nanoseconds rtt{0};
    boost::system::error_code ec;

    // Success means a measured round trip, nothing else. Packet counters of
    // the underlying mechanism are not trusted.
    bool succeeded() const noexcept { return rtt.count() > 0; }
};

// One single-shot liveness probe at a time.
class Prober {
public:
    using Handler = std::function<void(const ProbeResult&)>;

    virtual ~Prober() = default;

    // handler is invoked exactly once, on the strand the prober was built with.
    virtual void async_probe(const std::string& address, Handler handler) = 0;

    // Aborts an in-flight probe; its handler sees operation_aborted.
    // Must be called on the prober's strand.
    virtual void cancel() = 0;
};

using ProberFactory = std::function<std::shared_ptr<Prober>(Strand)>;

// nullptr if address may be probed, otherwise why not (unparsable, IPv6,
// loopback, multicast, link-local, unspecified).
const char* probe_target_rejection(const std::string& address);
