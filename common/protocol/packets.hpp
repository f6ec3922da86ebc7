#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace probelink::packets {

// GATT identifiers, lowercase as BlueZ reports them
namespace uuids {
    constexpr const char* PRIMARY_SERVICE = "71c47cd7-d486-4ca3-a350-8379edfaed8c";

    // Standard Battery Level characteristic (0x2A19)
    constexpr const char* STATUS_BATTERY = "00002a19-0000-1000-8000-00805f9b34fb";

    constexpr const char* COMMAND_WRITE = "8c64619e-006e-4303-a8b9-9c4a9ade5334";
    constexpr const char* COMMAND_ACK = "dcd0c4e2-bc02-40a7-b6d7-d994b421283b";
}

// Vendor id the manufacturer payload is keyed by in advertisements
constexpr uint16_t VENDOR_ID = 0x0B5E;

// Manufacturer payload: 20 bytes minimum
namespace manufacturer {
    constexpr size_t MIN_SIZE = 20;
    constexpr size_t MODEL_ID = 0;
    constexpr size_t PROBE_ID = 4;
    constexpr size_t SERIAL_NUMBER = 8;
    constexpr size_t BATTERY = 19;
}

// Acknowledgment frame: 16-byte header, bytes 0-1 reserved
namespace acknowledgment {
    constexpr size_t HEADER_SIZE = 16;
    constexpr size_t COMMAND_TYPE = 2;
    constexpr size_t COMMAND_CODE = 3;
    constexpr size_t SEQUENCE = 4;
    constexpr size_t DATA_BYTE_COUNT = 8;
    constexpr size_t DATA_CHECKSUM = 10;
    constexpr size_t HEADER_CHECKSUM = 12;
    constexpr size_t COMMAND_STATUS = 14;
}

// Little-endian field readers. Caller checks bounds.
inline uint16_t read_u16_le(std::span<const uint8_t> data, size_t offset) {
    return static_cast<uint16_t>(data[offset]) |
           (static_cast<uint16_t>(data[offset + 1]) << 8);
}

inline uint32_t read_u32_le(std::span<const uint8_t> data, size_t offset) {
    return static_cast<uint32_t>(data[offset]) |
           (static_cast<uint32_t>(data[offset + 1]) << 8) |
           (static_cast<uint32_t>(data[offset + 2]) << 16) |
           (static_cast<uint32_t>(data[offset + 3]) << 24);
}

} // namespace probelink::packets
