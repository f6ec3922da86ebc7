#pragma once

#include "enums.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace probelink {

// Decoded manufacturer payload
struct ParsedIdentity {
    uint32_t model_id = 0;
    uint32_t probe_id = 0;
    std::string serial_number;        // lowercase hex, no prefix
    uint8_t battery_state_of_charge = 0;  // percent, not range checked

    std::string_view probe_name() const { return probelink::probe_name(probe_id); }

    bool operator==(const ParsedIdentity&) const = default;
};

struct DeviceRecord {
    // Identity
    std::string id;
    std::optional<std::string> display_name;

    // Latest advertisement
    int16_t signal_strength = 0;
    std::optional<std::vector<uint8_t>> raw_manufacturer_payload;

    // Decoded from raw_manufacturer_payload, kept across decode failures
    std::optional<ParsedIdentity> parsed_identity;

    bool operator==(const DeviceRecord&) const = default;
};

} // namespace probelink
