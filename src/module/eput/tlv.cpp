#include <eput/tlv.hpp>

using namespace eput;

std::optional<PayloadSpan> eput::find_first_tlv(std::span<const std::byte> buffer, uint8_t type) {
    static constexpr uint8_t null_tag = std::to_underlying(TLVTag::null);
    static constexpr uint8_t terminator_tag = std::to_underlying(TLVTag::terminator);

    for (PayloadPos pos = 0; pos < buffer.size();) {
        const uint8_t tlv_type = std::to_integer<uint8_t>(buffer[pos]);

        if (tlv_type == null_tag) {
            // NULL TLV has no length field
            pos += 1;
            continue;
        }

        if (tlv_type == terminator_tag) {
            // Nothing is after the terminator
            return std::nullopt;
        }

        pos += 1;
        if (pos >= buffer.size()) {
            return std::nullopt;
        }

        // Decode TLV length & skip the length field
        PayloadPos value_length;
        if (buffer[pos] == tlv_extended_length_marker) {
            if (buffer.size() - pos < 3) {
                return std::nullopt;
            }

            const uint16_t length = static_cast<uint16_t>((std::to_integer<uint16_t>(buffer[pos + 1]) << 8) | std::to_integer<uint16_t>(buffer[pos + 2]));
            if (length == tlv_reserved_length) {
                return std::nullopt;
            }

            value_length = length;
            pos += 3;

        } else {
            value_length = std::to_integer<PayloadPos>(buffer[pos]);
            pos += 1;
        }

        if (tlv_type == type) {
            return PayloadSpan { .offset = pos, .size = value_length };
        }

        // This is not what we're looking for, skip the value
        pos += value_length;
    }

    return std::nullopt;
}
