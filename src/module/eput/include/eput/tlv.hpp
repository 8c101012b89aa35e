#pragma once

#include "util_defines.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>

namespace eput {

enum class TLVTag : uint8_t {
    null = 0x00,
    ndef = 0x03,
    proprietary = 0xfd,
    terminator = 0xfe,
};

/// Value of the 1-byte length field announcing the 3-byte length format
constexpr std::byte tlv_extended_length_marker { 0xff };

/// 3-byte length format value that is reserved and never valid
constexpr uint16_t tlv_reserved_length = 0xffff;

/**
 * Finds the value of the first TLV of type @p type in @p buffer.
 *
 * NULL TLVs are skipped as single-byte padding, all other TLVs are skipped by their length.
 * Scanning stops with no result on a terminator TLV, on the reserved length
 * and when the buffer ends in the middle of a TLV header.
 *
 * @attention The value itself is not checked against the buffer end.
 *
 * @return position of the TLV value (just after the length field) and its length
 */
std::optional<PayloadSpan> find_first_tlv(std::span<const std::byte> buffer, uint8_t type);

inline std::optional<PayloadSpan> find_first_tlv(std::span<const std::byte> buffer, TLVTag tag) {
    return find_first_tlv(buffer, std::to_underlying(tag));
}

} // namespace eput
