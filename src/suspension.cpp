// filename: src/suspension.cpp
#include "core/suspension.hpp"

Transition acknowledge_lapsed(Device& dev, TimePoint now) {
    Transition t;
    for (Protocol p : kProtocols) {
        Edge& e = t[p];
        TimePoint& until = suspension_timer(dev, p);
        if (until != TimePoint{} && now >= until) {
            e.lapsed = true;
            until = TimePoint{};
            fail_count(dev, p) = 0;
        }
        e.was_suspended = is_actively_suspended(until, now);
        e.is_suspended = e.was_suspended;
    }
    return t;
}

Transition apply_outcome(Device& dev, const ProbeOutcome& outcome, TimePoint now,
                         const SuspensionPolicy& policy) {
    Transition t = acknowledge_lapsed(dev, now);

    if (const auto* ok = std::get_if<ProbeSuccess>(&outcome)) {
        // Recovery is immediate, even with suspension time left.
        fail_count(dev, ok->protocol) = 0;
        suspension_timer(dev, ok->protocol) = TimePoint{};
        dev.last_seen = now;
    } else if (const auto* fail = std::get_if<ProbeFailure>(&outcome)) {
        const ProtocolPolicy& pp = policy.of(fail->protocol);
        int& fails = fail_count(dev, fail->protocol);
        ++fails;
        // A failure while suspended keeps counting but never restarts the window.
        if (!t[fail->protocol].was_suspended && fails >= pp.fail_threshold &&
            pp.suspension.count() > 0) {
            suspension_timer(dev, fail->protocol) = now + pp.suspension;
        }
    } else if (const auto* fields = std::get_if<Enrichment>(&outcome)) {
        dev.enrichment = *fields;
        dev.last_seen = now;
    }

    for (Protocol p : kProtocols) {
        t[p].is_suspended = is_actively_suspended(suspension_timer(dev, p), now);
    }
    return t;
}

Transition retire(Device& dev, TimePoint now) {
    Transition t = acknowledge_lapsed(dev, now);
    for (Protocol p : kProtocols) {
        suspension_timer(dev, p) = TimePoint{};
        t[p].is_suspended = false;
    }
    return t;
}
