#pragma once

#include "enums.hpp"
#include <array>
#include <cstdint>
#include <string_view>

namespace probelink {

struct Proximity {
    std::string_view label;
    Severity severity = Severity::Neutral;

    bool operator==(const Proximity&) const = default;
};

struct ProximityThreshold {
    int bound;  // reading must be strictly greater
    std::string_view label;
    Severity severity;
};

// Strongest first. classify() takes the first match, so order matters.
constexpr std::array<ProximityThreshold, 4> PROXIMITY_THRESHOLDS = {{
    {-60, "VERY CLOSE", Severity::Strong},
    {-70, "NEAR", Severity::Good},
    {-85, "FAR", Severity::Weak},
    {-95, "VERY FAR", Severity::Poor},
}};

constexpr Proximity UNKNOWN_PROXIMITY = {"Unknown", Severity::Neutral};

// Map a signal strength reading (dBm) to a proximity band
Proximity classify(int signal_strength);

} // namespace probelink
