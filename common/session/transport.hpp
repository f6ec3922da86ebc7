#pragma once

#include "../types/error.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace probelink {

// One advertisement as reported by the wireless stack
struct Advertisement {
    std::string id;
    std::optional<std::string> name;
    int16_t rssi = 0;
    std::optional<std::vector<uint8_t>> manufacturer_data;
};

// Service UUID -> characteristic UUIDs in the order the stack reports them
using ServiceMap = std::map<std::string, std::vector<std::string>>;

using AdvertisementHandler = std::function<void(const Advertisement&)>;
using NotificationHandler = std::function<void(std::span<const uint8_t>)>;
using DisconnectHandler = std::function<void(const std::string& id)>;

// Wireless stack provider. Calls complete before returning; events are
// delivered later from the owner's event loop.
class Transport {
public:
    virtual ~Transport() = default;

    virtual Status initialize() = 0;

    // Deliver advertisements from devices exposing service_uuid until stop_scan()
    virtual Status request_scan(const std::string& service_uuid, AdvertisementHandler on_event) = 0;
    virtual Status stop_scan() = 0;

    // on_disconnect fires when the link drops without a disconnect() call
    virtual Status connect(const std::string& id, DisconnectHandler on_disconnect) = 0;
    virtual Status disconnect(const std::string& id) = 0;

    virtual Result<ServiceMap> list_services(const std::string& id) = 0;

    virtual Result<std::vector<uint8_t>> read_characteristic(const std::string& id,
                                                             const std::string& service,
                                                             const std::string& characteristic) = 0;

    virtual Status write_characteristic(const std::string& id,
                                        const std::string& service,
                                        const std::string& characteristic,
                                        std::span<const uint8_t> value) = 0;

    virtual Status subscribe_notifications(const std::string& id,
                                           const std::string& service,
                                           const std::string& characteristic,
                                           NotificationHandler on_value) = 0;

    virtual Status unsubscribe_notifications(const std::string& id,
                                             const std::string& service,
                                             const std::string& characteristic) = 0;
};

} // namespace probelink
