#pragma once

#include <cstdint>
#include <vector>

namespace probelink {

// Frame pushed by the device on the command-acknowledgment characteristic.
// Checksums are decoded but not verified.
struct AcknowledgmentFrame {
    char command_type = 0;
    uint8_t command_code = 0;
    uint32_t sequential_command_number = 0;
    uint16_t data_byte_count = 0;
    uint16_t data_checksum = 0;
    uint16_t header_checksum = 0;
    uint16_t command_status = 0;

    // Bytes following the 16-byte header, verbatim
    std::vector<uint8_t> payload;

    bool operator==(const AcknowledgmentFrame&) const = default;
};

} // namespace probelink
