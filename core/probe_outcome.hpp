// filename: core/probe_outcome.hpp
#pragma once
#include "core/device.hpp"
#include <variant>

struct ProbeSuccess {
    Protocol protocol{Protocol::Ping};
};

struct ProbeFailure {
    Protocol protocol{Protocol::Ping};
};

// Everything a producer may report about a device through DeviceRegistry::update.
using ProbeOutcome = std::variant<ProbeSuccess, ProbeFailure, Enrichment>;
