#include <eput/bitmap.hpp>

#include <bsod/bsod.h>

#include <cstdint>

bool eput::is_bit_set(std::span<const std::byte> bitmap, size_t bit) {
    static constexpr size_t BITS_IN_BYTE = 8;

    const size_t byte_index = bit / BITS_IN_BYTE;
    if (byte_index >= bitmap.size()) {
        bsod("bitmap bit %zu out of %zu bytes", bit, bitmap.size());
    }

    const std::byte mask { static_cast<uint8_t>(1 << (bit % BITS_IN_BYTE)) };
    return (bitmap[byte_index] & mask) != std::byte { 0 };
}
