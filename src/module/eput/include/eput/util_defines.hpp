#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace eput {

/// Offset or size within a caller-owned buffer
using PayloadPos = size_t;

/// std::span analog that doesn't hold a pointer.
/// Refers to a part of a buffer the caller owns; the buffer must outlive any use of the span.
struct PayloadSpan {

public:
    PayloadPos offset = 0;
    PayloadPos size = 0;

    constexpr PayloadPos end() const {
        return offset + size;
    }

public:
    constexpr bool is_empty() const {
        return size == 0;
    }

    constexpr bool contains(const PayloadSpan &subspan) const {
        return (subspan.offset >= offset) && (subspan.end() <= end());
    }

    constexpr PayloadSpan added_offset(PayloadPos added_offset) const {
        return PayloadSpan {
            .offset = offset + added_offset,
            .size = size
        };
    }

    /// \returns the bytes of \p buffer the span refers to
    /// ! The span must be contained in the buffer
    constexpr std::span<const std::byte> in(std::span<const std::byte> buffer) const {
        return buffer.subspan(offset, size);
    }

    constexpr bool operator==(const PayloadSpan &) const = default;
};

} // namespace eput
