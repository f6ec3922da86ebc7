#pragma once

#include "../types/acknowledgment.hpp"
#include "../types/device.hpp"
#include "../types/error.hpp"
#include "packets.hpp"
#include <cstdint>
#include <span>
#include <string>

namespace probelink::parse {

// Decode the manufacturer payload of an advertisement.
// Fails with TooShort below 20 bytes, never reads past the end.
Result<ParsedIdentity> parse_manufacturer_payload(std::span<const uint8_t> data);

// Decode a command acknowledgment notification.
// Fails with TooShort below 16 bytes. Checksums are not verified.
Result<AcknowledgmentFrame> parse_acknowledgment(std::span<const uint8_t> data);

// Serial number as lowercase hex without prefix or padding
std::string format_serial_number(uint32_t serial);

} // namespace probelink::parse
