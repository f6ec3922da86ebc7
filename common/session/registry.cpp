#include "registry.hpp"
#include "../protocol/parse.hpp"

namespace probelink {

Status DeviceRegistry::apply_advertisement(const Advertisement& adv) {
    return apply_advertisement(adv.id, adv.name, adv.rssi, adv.manufacturer_data);
}

Status DeviceRegistry::apply_advertisement(const std::string& id,
                                           const std::optional<std::string>& display_name,
                                           int16_t signal_strength,
                                           const std::optional<std::vector<uint8_t>>& raw_payload) {
    // Decode outside the lock
    std::optional<Result<ParsedIdentity>> decoded;
    if (raw_payload) {
        decoded = parse::parse_manufacturer_payload(*raw_payload);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    DeviceRecord* record;
    auto it = index_.find(id);
    if (it != index_.end()) {
        record = &records_[it->second];
    } else {
        index_.emplace(id, records_.size());
        records_.push_back(DeviceRecord{});
        record = &records_.back();
        record->id = id;
    }

    record->signal_strength = signal_strength;
    if (display_name) {
        record->display_name = display_name;
    }

    if (!decoded) {
        return {};
    }

    record->raw_manufacturer_payload = raw_payload;
    if (!decoded->ok()) {
        return decoded->status();
    }
    record->parsed_identity = decoded->value();
    return {};
}

std::vector<DeviceRecord> DeviceRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::optional<DeviceRecord> DeviceRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return records_[it->second];
}

size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void DeviceRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    index_.clear();
}

std::string format_device(const DeviceRecord& record) {
    std::string name = "Unnamed";
    if (record.display_name && !record.display_name->empty()) {
        name = *record.display_name;
    }
    return "Probe: " + name + " (ID: " + record.id + ")";
}

std::string_view probe_label(const DeviceRecord& record) {
    if (!record.parsed_identity) return UNKNOWN_PROBE_NAME;
    return record.parsed_identity->probe_name();
}

} // namespace probelink
