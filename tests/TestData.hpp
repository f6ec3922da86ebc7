#pragma once

#include <cstdint>
#include <vector>

namespace probelink::testdata {

// Temperature probe, model 0x11002300, serial 11001650, battery 90%
inline std::vector<uint8_t> temperature_probe_payload() {
    return {
        0x00, 0x23, 0x00, 0x11,  // model id
        0x01, 0x14, 0x00, 0x11,  // probe id
        0x50, 0x16, 0x00, 0x11,  // serial number
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x5A,                    // battery
    };
}

// Humidity probe, serial 2a, battery 15%
inline std::vector<uint8_t> humidity_probe_payload() {
    return {
        0x00, 0x23, 0x00, 0x11,
        0x02, 0x14, 0x00, 0x11,
        0x2A, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x0F,
    };
}

// Response to the serial number request: 'R' 0x21, seq 7, 4 data bytes
inline std::vector<uint8_t> serial_number_ack() {
    return {
        0x00, 0x00,              // reserved
        'R', 0x21,               // type, code
        0x07, 0x00, 0x00, 0x00,  // sequence
        0x04, 0x00,              // data byte count
        0x34, 0x12,              // data checksum
        0x78, 0x56,              // header checksum
        0x00, 0x00,              // status
        0x50, 0x16, 0x00, 0x11,  // data
    };
}

} // namespace probelink::testdata
