#pragma once

#include <dbus/dbus.h>
#include <protocol/packets.hpp>
#include <session/transport.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bluez {

// Get BlueZ device path from MAC address under the given adapter
std::string get_device_path(const std::string& adapter_path, const std::string& mac_address);

// Device object path of any path at or below it ("/org/bluez/hci0/dev_XX/service0010/char0011")
std::optional<std::string> device_path_of(const std::string& object_path);

// MAC address encoded in a device path, "dev_AA_BB_..." -> "AA:BB:..."
std::optional<std::string> address_from_path(const std::string& object_path);

// Map a D-Bus error name to the transport error kinds
probelink::ErrorKind classify_error(const char* error_name);

// Device1 properties relevant to discovery, as found in one a{sv} dict
struct DeviceProperties {
    std::optional<std::string> address;
    std::optional<std::string> name;
    std::optional<int16_t> rssi;
    std::optional<std::vector<uint8_t>> manufacturer_data;
    std::optional<bool> connected;
    bool exposes_filter_uuid = false;
};

// Parse a Device1 a{sv} dict (iterator positioned at the array).
// ManufacturerData is taken from the vendor_id key only.
DeviceProperties parse_device_properties(DBusMessageIter* props, const std::string& filter_uuid,
                                         uint16_t vendor_id);

// Transport over BlueZ GATT on the system bus
class GattTransport : public probelink::Transport {
public:
    explicit GattTransport(uint16_t vendor_id = probelink::packets::VENDOR_ID);
    ~GattTransport() override;

    GattTransport(const GattTransport&) = delete;
    GattTransport& operator=(const GattTransport&) = delete;

    // Connect to the system bus, find the adapter, install signal matches
    probelink::Status initialize() override;

    probelink::Status request_scan(const std::string& service_uuid,
                                   probelink::AdvertisementHandler on_event) override;
    probelink::Status stop_scan() override;

    probelink::Status connect(const std::string& id,
                              probelink::DisconnectHandler on_disconnect) override;
    probelink::Status disconnect(const std::string& id) override;

    probelink::Result<probelink::ServiceMap> list_services(const std::string& id) override;

    probelink::Result<std::vector<uint8_t>> read_characteristic(
        const std::string& id, const std::string& service,
        const std::string& characteristic) override;

    probelink::Status write_characteristic(const std::string& id, const std::string& service,
                                           const std::string& characteristic,
                                           std::span<const uint8_t> value) override;

    probelink::Status subscribe_notifications(const std::string& id, const std::string& service,
                                              const std::string& characteristic,
                                              probelink::NotificationHandler on_value) override;

    probelink::Status unsubscribe_notifications(const std::string& id,
                                                const std::string& service,
                                                const std::string& characteristic) override;

    // Get file descriptor for polling, -1 before initialize()
    int get_fd() const;

    // Read and dispatch queued D-Bus messages (call in event loop)
    void process_pending();

    // Process a D-Bus message that might be a BlueZ signal
    // Returns true if it was handled
    bool handle_signal(DBusMessage* msg);

private:
    struct GattCharacteristic {
        std::string path;
        std::string uuid;
        std::string service_uuid;
    };

    struct GattTree {
        std::vector<std::pair<std::string, std::string>> services;  // path, uuid
        std::vector<GattCharacteristic> characteristics;
    };

    std::string device_path(const std::string& id) const;
    probelink::Result<GattTree> collect_gatt(const std::string& device_path);
    probelink::Result<std::string> characteristic_path(const std::string& id,
                                                       const std::string& service,
                                                       const std::string& characteristic);
    bool device_matches_filter(const std::string& path);
    void forget_device(const std::string& device_path);

    void on_interfaces_added(DBusMessage* msg);
    void emit_advertisement(const std::string& path, const DeviceProperties& props);
    void on_device_properties_changed(const std::string& path, DBusMessageIter* props);
    void on_characteristic_properties_changed(const std::string& path, DBusMessageIter* props);

    DBusConnection* conn_ = nullptr;
    bool filter_installed_ = false;
    std::string adapter_path_;
    uint16_t vendor_id_;

    // Scan state
    std::string scan_filter_;
    probelink::AdvertisementHandler on_advertisement_;
    std::unordered_map<std::string, bool> filter_matches_;  // device path -> exposes scan_filter_
    std::unordered_map<std::string, int16_t> last_rssi_;    // device path -> latest RSSI

    // Connection state, keyed by object path
    std::unordered_map<std::string, probelink::DisconnectHandler> disconnect_handlers_;
    std::unordered_map<std::string, probelink::NotificationHandler> notify_handlers_;
    std::unordered_map<std::string, std::string> characteristic_cache_;  // id|service|char -> path
};

} // namespace bluez
