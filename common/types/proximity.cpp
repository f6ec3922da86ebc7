#include "proximity.hpp"

namespace probelink {

Proximity classify(int signal_strength) {
    for (const auto& threshold : PROXIMITY_THRESHOLDS) {
        if (signal_strength > threshold.bound) {
            return {threshold.label, threshold.severity};
        }
    }
    return UNKNOWN_PROXIMITY;
}

} // namespace probelink
