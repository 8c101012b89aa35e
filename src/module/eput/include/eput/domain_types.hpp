#pragma once

#include "scalar.hpp"

#include <cmath>
#include <concepts>
#include <cstdint>

namespace eput {

/// Opaque timestamp, the unit is defined by the device schema
using TimePoint = int64_t;

/// Time zone offset, the unit is defined by the device schema
using ZoneOffset = int16_t;

/// Time of day. The fields are not range checked - 24:60:60 and similar are valid wire values
struct TimeOfDay {
    uint8_t hours = 0;
    uint8_t minutes = 0;
    uint8_t seconds = 0;

    bool operator==(const TimeOfDay &) const = default;
};

struct ZonedTime {
    TimePoint time = 0;
    ZoneOffset offset = 0;

    bool operator==(const ZonedTime &) const = default;
};

struct DateRange {
    TimePoint from = 0;
    TimePoint to = 0;

    bool operator==(const DateRange &) const = default;
};

struct TimeRange {
    TimeOfDay from;
    TimeOfDay to;

    bool operator==(const TimeRange &) const = default;
};

/// val = unscaled * 10 ^ -scale
template <std::signed_integral Unscaled>
struct FixedPoint {
    Unscaled unscaled = 0;

    /// Not transmitted - the scale is a property of the schema field, not of the value
    int32_t scale = 0;

    double as_double() const {
        return static_cast<double>(unscaled) * std::pow(10.0, -static_cast<double>(scale));
    }

    bool operator==(const FixedPoint &) const = default;
};

using FixedPoint32 = FixedPoint<int32_t>;
using FixedPoint64 = FixedPoint<int64_t>;

template <>
struct Codec<TimeOfDay> {
    static constexpr size_t wire_size = 3 * eput::wire_size<uint8_t>;

    static constexpr void encode(const TimeOfDay &val, std::span<std::byte> out) {
        eput::encode(val.hours, out);
        eput::encode(val.minutes, out.subspan(1));
        eput::encode(val.seconds, out.subspan(2));
    }

    static constexpr TimeOfDay decode(std::span<const std::byte> in) {
        return TimeOfDay {
            .hours = eput::decode<uint8_t>(in),
            .minutes = eput::decode<uint8_t>(in.subspan(1)),
            .seconds = eput::decode<uint8_t>(in.subspan(2)),
        };
    }
};

template <>
struct Codec<ZonedTime> {
    static constexpr size_t wire_size = eput::wire_size<TimePoint> + eput::wire_size<ZoneOffset>;

    static constexpr void encode(const ZonedTime &val, std::span<std::byte> out) {
        eput::encode(val.time, out);
        eput::encode(val.offset, out.subspan(eput::wire_size<TimePoint>));
    }

    static constexpr ZonedTime decode(std::span<const std::byte> in) {
        return ZonedTime {
            .time = eput::decode<TimePoint>(in),
            .offset = eput::decode<ZoneOffset>(in.subspan(eput::wire_size<TimePoint>)),
        };
    }
};

template <>
struct Codec<DateRange> {
    static constexpr size_t wire_size = 2 * eput::wire_size<TimePoint>;

    static constexpr void encode(const DateRange &val, std::span<std::byte> out) {
        eput::encode(val.from, out);
        eput::encode(val.to, out.subspan(eput::wire_size<TimePoint>));
    }

    static constexpr DateRange decode(std::span<const std::byte> in) {
        return DateRange {
            .from = eput::decode<TimePoint>(in),
            .to = eput::decode<TimePoint>(in.subspan(eput::wire_size<TimePoint>)),
        };
    }
};

template <>
struct Codec<TimeRange> {
    static constexpr size_t wire_size = 2 * eput::wire_size<TimeOfDay>;

    static constexpr void encode(const TimeRange &val, std::span<std::byte> out) {
        eput::encode(val.from, out);
        eput::encode(val.to, out.subspan(eput::wire_size<TimeOfDay>));
    }

    static constexpr TimeRange decode(std::span<const std::byte> in) {
        return TimeRange {
            .from = eput::decode<TimeOfDay>(in),
            .to = eput::decode<TimeOfDay>(in.subspan(eput::wire_size<TimeOfDay>)),
        };
    }
};

/// Only the unscaled value goes on the wire, the scale has to be provided when decoding
template <std::signed_integral Unscaled>
struct Codec<FixedPoint<Unscaled>> {
    static constexpr size_t wire_size = eput::wire_size<Unscaled>;

    static constexpr void encode(const FixedPoint<Unscaled> &val, std::span<std::byte> out) {
        eput::encode(val.unscaled, out);
    }

    static constexpr FixedPoint<Unscaled> decode(std::span<const std::byte> in, int32_t scale) {
        return FixedPoint<Unscaled> {
            .unscaled = eput::decode<Unscaled>(in),
            .scale = scale,
        };
    }
};

static_assert(wire_size<TimeOfDay> == 3);
static_assert(wire_size<ZonedTime> == 10);
static_assert(wire_size<DateRange> == 16);
static_assert(wire_size<TimeRange> == 6);
static_assert(wire_size<FixedPoint32> == 4);
static_assert(wire_size<FixedPoint64> == 8);

} // namespace eput
