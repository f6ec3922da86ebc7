#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace probelink::commands {

// Command opcodes written to the command characteristic
enum class Opcode : uint8_t {
    Beep = 0x06,
    RequestSerialNumber = 0x21,
};

inline std::string_view to_string(Opcode opcode) {
    switch (opcode) {
        case Opcode::Beep: return "beep";
        case Opcode::RequestSerialNumber: return "request_serial_number";
    }
    return "unknown";
}

// Every known command is a single opcode byte
inline std::vector<uint8_t> encode(Opcode opcode) {
    return {static_cast<uint8_t>(opcode)};
}

inline std::vector<uint8_t> beep() {
    return encode(Opcode::Beep);
}

inline std::vector<uint8_t> request_serial_number() {
    return encode(Opcode::RequestSerialNumber);
}

} // namespace probelink::commands
