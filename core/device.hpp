// filename: core/device.hpp
#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

using TimePoint = std::chrono::system_clock::time_point;
using Clock = std::function<TimePoint()>;

// Each protocol carries its own failure counter and suspension timer.
enum class Protocol : std::size_t { Ping = 0, Snmp = 1 };

constexpr std::size_t kProtocolCount = 2;
constexpr std::array<Protocol, kProtocolCount> kProtocols{Protocol::Ping, Protocol::Snmp};

constexpr std::size_t index(Protocol p) noexcept { return static_cast<std::size_t>(p); }

inline const char* to_string(Protocol p) {
    return p == Protocol::Ping ? "ping" : "snmp";
}

struct Enrichment {
    std::string hostname;
    std::string description;
    std::string object_id;
};

struct Device {
    std::string address;
    TimePoint last_seen{};
    int consecutive_fails{0};
    int snmp_consecutive_fails{0};
    // TimePoint{} means not suspended; a value in the past is a lapsed
    // suspension the registry has not acknowledged yet.
    TimePoint suspended_until{};
    TimePoint snmp_suspended_until{};
    Enrichment enrichment;
};

inline int& fail_count(Device& d, Protocol p) {
    return p == Protocol::Ping ? d.consecutive_fails : d.snmp_consecutive_fails;
}

inline int fail_count(const Device& d, Protocol p) {
    return p == Protocol::Ping ? d.consecutive_fails : d.snmp_consecutive_fails;
}

inline TimePoint& suspension_timer(Device& d, Protocol p) {
    return p == Protocol::Ping ? d.suspended_until : d.snmp_suspended_until;
}

inline TimePoint suspension_timer(const Device& d, Protocol p) {
    return p == Protocol::Ping ? d.suspended_until : d.snmp_suspended_until;
}

inline bool is_actively_suspended(TimePoint until, TimePoint now) {
    return until != TimePoint{} && now < until;
}
