#pragma once

#include <bit>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>

namespace eput {

/// Wire representation of a type.
/// Specializations provide:
///   static constexpr size_t wire_size;
///   static void encode(const T &val, std::span<std::byte> out);
///   static T decode(std::span<const std::byte> in, ...);
/// All encodings are big endian, independent of the host byte order.
template <typename T>
struct Codec;

/// Number of bytes \p T takes on the wire
template <typename T>
inline constexpr size_t wire_size = Codec<T>::wire_size;

/// Writes \p val to the beginning of \p out.
/// \p out must hold at least wire_size<T> bytes, this is not checked in release builds.
template <typename T>
constexpr void encode(const T &val, std::span<std::byte> out) {
    Codec<T>::encode(val, out);
}

/// Reads a \p T from the beginning of \p in.
/// \p in must hold at least wire_size<T> bytes, this is not checked in release builds.
/// Additional arguments (fixed point scale) are forwarded to the codec.
template <typename T, typename... Args>
constexpr T decode(std::span<const std::byte> in, Args... args) {
    return Codec<T>::decode(in, args...);
}

namespace detail {
    template <size_t size>
    struct WireUIntFor;

    template <>
    struct WireUIntFor<1> {
        using type = uint8_t;
    };

    template <>
    struct WireUIntFor<2> {
        using type = uint16_t;
    };

    template <>
    struct WireUIntFor<4> {
        using type = uint32_t;
    };

    template <>
    struct WireUIntFor<8> {
        using type = uint64_t;
    };

    /// Unsigned integer with the same width as \p T
    template <typename T>
    using WireUInt = typename WireUIntFor<sizeof(T)>::type;

    /// Types that are sent as their bit pattern
    template <typename T>
    concept BitPattern = (std::integral<T> && !std::same_as<T, bool>) || std::same_as<T, float> || std::same_as<T, double>;

    static_assert(std::numeric_limits<float>::is_iec559 && sizeof(float) == 4);
    static_assert(std::numeric_limits<double>::is_iec559 && sizeof(double) == 8);

    template <std::unsigned_integral U>
    constexpr void store_be(U val, std::span<std::byte> out) {
        for (size_t i = sizeof(U); i > 0; i--) {
            out[i - 1] = static_cast<std::byte>(val & 0xff);
            val = static_cast<U>(val >> 8);
        }
    }

    template <std::unsigned_integral U>
    constexpr U load_be(std::span<const std::byte> in) {
        U result = 0;
        for (size_t i = 0; i < sizeof(U); i++) {
            result = static_cast<U>((result << 8) | std::to_integer<U>(in[i]));
        }
        return result;
    }
} // namespace detail

/// Integers and IEEE-754 floats.
/// The value is reinterpreted as an unsigned integer of the same width and sent MSB first,
/// so float round trips are bit-exact (NaN payloads included).
template <detail::BitPattern T>
struct Codec<T> {
    static constexpr size_t wire_size = sizeof(T);

    static constexpr void encode(T val, std::span<std::byte> out) {
        assert(out.size() >= wire_size);
        detail::store_be(std::bit_cast<detail::WireUInt<T>>(val), out);
    }

    static constexpr T decode(std::span<const std::byte> in) {
        assert(in.size() >= wire_size);
        return std::bit_cast<T>(detail::load_be<detail::WireUInt<T>>(in));
    }
};

/// Any nonzero byte reads as true, true is always written as 1
template <>
struct Codec<bool> {
    static constexpr size_t wire_size = 1;

    static constexpr void encode(bool val, std::span<std::byte> out) {
        assert(out.size() >= wire_size);
        out[0] = val ? std::byte { 1 } : std::byte { 0 };
    }

    static constexpr bool decode(std::span<const std::byte> in) {
        assert(in.size() >= wire_size);
        return in[0] != std::byte { 0 };
    }
};

} // namespace eput
