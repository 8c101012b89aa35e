#pragma once

#include <cstddef>
#include <span>

namespace eput {

/// Determines whether bit \p bit is set in \p bitmap.
/// Bit i lives in byte i / 8, at position i % 8 counted from the LSB.
/// ! BSODs if \p bit is outside of the bitmap
[[nodiscard]] bool is_bit_set(std::span<const std::byte> bitmap, size_t bit);

} // namespace eput
