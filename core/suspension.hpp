// filename: core/suspension.hpp
#pragma once
#include "core/device.hpp"
#include "core/probe_outcome.hpp"
#include <array>
#include <chrono>

struct ProtocolPolicy {
    int fail_threshold = 3;
    std::chrono::milliseconds suspension{std::chrono::minutes(5)};
};

struct SuspensionPolicy {
    ProtocolPolicy ping;
    ProtocolPolicy snmp;

    const ProtocolPolicy& of(Protocol p) const { return p == Protocol::Ping ? ping : snmp; }
};

// What one mutation did to a single protocol's classification.
struct Edge {
    bool lapsed = false;         // an expired timer was acknowledged and cleared
    bool was_suspended = false;  // after acknowledging, before the outcome
    bool is_suspended = false;   // after the outcome

    // Change owed to the aggregate counter. A lapsed timer was counted while
    // it was active, so acknowledging it costs exactly one.
    int delta() const noexcept {
        return (lapsed ? -1 : 0) + (is_suspended ? 1 : 0) - (was_suspended ? 1 : 0);
    }

    bool became_suspended() const noexcept { return !was_suspended && is_suspended; }
    bool recovered() const noexcept { return was_suspended && !is_suspended; }
};

struct Transition {
    std::array<Edge, kProtocolCount> edges{};

    Edge& operator[](Protocol p) { return edges[index(p)]; }
    const Edge& operator[](Protocol p) const { return edges[index(p)]; }
};

// The only functions that may change a suspension timer. DeviceRegistry feeds
// each returned Transition straight into its counters.

// Clears lapsed timers (and their failure counters); no outcome applied.
Transition acknowledge_lapsed(Device& dev, TimePoint now);

Transition apply_outcome(Device& dev, const ProbeOutcome& outcome, TimePoint now,
                         const SuspensionPolicy& policy);

// The device is going away: every protocol ends up not suspended.
Transition retire(Device& dev, TimePoint now);
