#include "parse.hpp"
#include <charconv>

namespace probelink::parse {

std::string format_serial_number(uint32_t serial) {
    char buffer[8];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), serial, 16);
    (void)ec;  // 8 hex digits always fit
    return std::string(buffer, ptr);
}

Result<ParsedIdentity> parse_manufacturer_payload(std::span<const uint8_t> data) {
    // [model u32][probe u32][serial u32][7 unused][battery u8]
    using namespace packets;

    if (data.size() < manufacturer::MIN_SIZE) {
        return Result<ParsedIdentity>::failure(ErrorKind::TooShort,
            "manufacturer payload is " + std::to_string(data.size()) + " bytes, need " +
            std::to_string(manufacturer::MIN_SIZE));
    }

    ParsedIdentity identity;
    identity.model_id = read_u32_le(data, manufacturer::MODEL_ID);
    identity.probe_id = read_u32_le(data, manufacturer::PROBE_ID);
    identity.serial_number = format_serial_number(read_u32_le(data, manufacturer::SERIAL_NUMBER));
    identity.battery_state_of_charge = data[manufacturer::BATTERY];
    return identity;
}

Result<AcknowledgmentFrame> parse_acknowledgment(std::span<const uint8_t> data) {
    // [2 reserved][type][code][seq u32][count u16][data csum u16][hdr csum u16][status u16][data...]
    using namespace packets;

    if (data.size() < acknowledgment::HEADER_SIZE) {
        return Result<AcknowledgmentFrame>::failure(ErrorKind::TooShort,
            "acknowledgment frame is " + std::to_string(data.size()) + " bytes, need " +
            std::to_string(acknowledgment::HEADER_SIZE));
    }

    AcknowledgmentFrame frame;
    frame.command_type = static_cast<char>(data[acknowledgment::COMMAND_TYPE]);
    frame.command_code = data[acknowledgment::COMMAND_CODE];
    frame.sequential_command_number = read_u32_le(data, acknowledgment::SEQUENCE);
    frame.data_byte_count = read_u16_le(data, acknowledgment::DATA_BYTE_COUNT);
    frame.data_checksum = read_u16_le(data, acknowledgment::DATA_CHECKSUM);
    frame.header_checksum = read_u16_le(data, acknowledgment::HEADER_CHECKSUM);
    frame.command_status = read_u16_le(data, acknowledgment::COMMAND_STATUS);
    frame.payload.assign(data.begin() + acknowledgment::HEADER_SIZE, data.end());
    return frame;
}

} // namespace probelink::parse
