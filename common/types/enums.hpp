#pragma once

#include <cstdint>
#include <string_view>
#include <unordered_map>

namespace probelink {

enum class ConnectionState : uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Subscribed,
};

inline std::string_view to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Subscribed: return "subscribed";
    }
    return "unknown";
}

// Connected or Subscribed
inline bool is_link_up(ConnectionState state) {
    return state == ConnectionState::Connected || state == ConnectionState::Subscribed;
}

enum class ScanState : uint8_t {
    Idle,
    Active,
};

inline std::string_view to_string(ScanState state) {
    return state == ScanState::Active ? "active" : "idle";
}

enum class Severity : uint8_t {
    Strong,
    Good,
    Weak,
    Poor,
    Neutral,
};

inline std::string_view to_string(Severity severity) {
    switch (severity) {
        case Severity::Strong: return "green";
        case Severity::Good: return "lightgreen";
        case Severity::Weak: return "orange";
        case Severity::Poor: return "red";
        case Severity::Neutral: return "gray";
    }
    return "gray";
}

enum class BatteryBand : uint8_t {
    Empty,
    Half,
    Full,
};

inline std::string_view to_string(BatteryBand band) {
    switch (band) {
        case BatteryBand::Empty: return "empty";
        case BatteryBand::Half: return "half";
        case BatteryBand::Full: return "full";
    }
    return "unknown";
}

inline BatteryBand battery_band(uint8_t level) {
    if (level >= 75) return BatteryBand::Full;
    if (level >= 10) return BatteryBand::Half;
    return BatteryBand::Empty;
}

constexpr std::string_view UNKNOWN_PROBE_NAME = "Unknown Probe";

// Probe identifiers carried in bytes 4-7 of the manufacturer payload
inline std::string_view probe_name(uint32_t probe_id) {
    static const std::unordered_map<uint32_t, std::string_view> probe_names = {
        {0x11001401, "Temperature Probe"},
        {0x11001402, "Humidity Probe"},
        {0x11001403, "Vibration Probe"},
    };

    auto it = probe_names.find(probe_id);
    return it != probe_names.end() ? it->second : UNKNOWN_PROBE_NAME;
}

} // namespace probelink
