#pragma once

#include "../types/device.hpp"
#include "../types/error.hpp"
#include "../types/proximity.hpp"
#include "transport.hpp"
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace probelink {

// Devices seen during the current scan, in discovery order.
// Each call locks for its own duration only.
class DeviceRegistry {
public:
    // Insert or update the record for adv.id. The record is always updated;
    // a payload that fails to decode keeps the previous parsed identity and
    // the decode error is returned.
    Status apply_advertisement(const Advertisement& adv);

    Status apply_advertisement(const std::string& id,
                               const std::optional<std::string>& display_name,
                               int16_t signal_strength,
                               const std::optional<std::vector<uint8_t>>& raw_payload);

    // Snapshot in insertion order
    std::vector<DeviceRecord> list() const;

    std::optional<DeviceRecord> find(const std::string& id) const;

    size_t size() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<DeviceRecord> records_;
    std::unordered_map<std::string, size_t> index_;
};

// Proximity band of the record's latest reading
inline Proximity proximity(const DeviceRecord& record) {
    return classify(record.signal_strength);
}

// "Probe: <name> (ID: <id>)", falling back to "Unnamed"
std::string format_device(const DeviceRecord& record);

// Model name from the parsed identity, "Unknown Probe" before a payload decoded
std::string_view probe_label(const DeviceRecord& record);

} // namespace probelink
