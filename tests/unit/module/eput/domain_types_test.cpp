#include <catch2/catch.hpp>
#include <test_utils/bytes.hpp>
#include <test_utils/formatters.hpp>

#include <eput/domain_types.hpp>

#include <algorithm>
#include <array>
#include <limits>

using namespace eput;

namespace {

template <typename T>
std::array<std::byte, wire_size<T>> encoded(const T &val) {
    std::array<std::byte, wire_size<T>> buffer {};
    encode(val, buffer);
    return buffer;
}

template <typename T>
T round_trip(const T &val) {
    return decode<T>(encoded(val));
}

constexpr auto time_min = std::numeric_limits<TimePoint>::min();
constexpr auto time_max = std::numeric_limits<TimePoint>::max();

} // namespace

TEST_CASE("TimePoint", "[eput][domain]") {
    const TimePoint val = GENERATE(time_min, time_max, time_max / 2, TimePoint { -1 }, TimePoint { 0 }, TimePoint { 1 }, TimePoint { 1'700'000'000'000 });
    CAPTURE(val);
    CHECK(round_trip(val) == val);
}

TEST_CASE("TimeOfDay is not range checked", "[eput][domain]") {
    const auto val = GENERATE(
        TimeOfDay { 0, 0, 0 },
        TimeOfDay { 12, 34, 56 },
        TimeOfDay { 23, 59, 59 },
        TimeOfDay { 24, 60, 60 },
        TimeOfDay { 255, 255, 255 },
        TimeOfDay { 1, 128, 254 });

    CAPTURE(val.hours, val.minutes, val.seconds);
    CHECK(round_trip(val) == val);
}

TEST_CASE("TimeOfDay layout", "[eput][domain]") {
    CHECK(std::ranges::equal(encoded(TimeOfDay { .hours = 24, .minutes = 60, .seconds = 1 }), bytes(24, 60, 1)));
    CHECK(decode<TimeOfDay>(bytes(7, 8, 9)) == TimeOfDay { .hours = 7, .minutes = 8, .seconds = 9 });
}

TEST_CASE("TimeRange", "[eput][domain]") {
    const auto val = GENERATE(
        TimeRange { .from = { 0, 0, 0 }, .to = { 0, 0, 0 } },
        TimeRange { .from = { 8, 30, 0 }, .to = { 17, 45, 30 } },
        TimeRange { .from = { 24, 60, 60 }, .to = { 255, 255, 255 } },
        TimeRange { .from = { 23, 0, 0 }, .to = { 1, 0, 0 } });

    CHECK(round_trip(val) == val);
    CHECK(std::ranges::equal(encoded(val), bytes(val.from.hours, val.from.minutes, val.from.seconds, val.to.hours, val.to.minutes, val.to.seconds)));
}

TEST_CASE("DateRange", "[eput][domain]") {
    const auto val = GENERATE(
        DateRange { .from = time_min, .to = time_max },
        DateRange { .from = time_max, .to = time_min },
        DateRange { .from = -1, .to = 1 },
        DateRange { .from = 0, .to = 0 },
        DateRange { .from = 1'600'000'000, .to = 1'700'000'000 });

    CHECK(round_trip(val) == val);
}

TEST_CASE("DateRange layout", "[eput][domain]") {
    const auto expected = bytes(
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01,
        0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE);
    CHECK(std::ranges::equal(encoded(DateRange { .from = 1, .to = -2 }), expected));
}

TEST_CASE("ZoneOffset", "[eput][domain]") {
    using L = std::numeric_limits<ZoneOffset>;
    const ZoneOffset val = GENERATE(L::min(), L::max(), ZoneOffset { L::max() / 2 }, ZoneOffset { -1 }, ZoneOffset { 0 }, ZoneOffset { 1 }, ZoneOffset { -120 });
    CAPTURE(val);
    CHECK(round_trip(val) == val);
}

TEST_CASE("ZonedTime", "[eput][domain]") {
    using L = std::numeric_limits<ZoneOffset>;

    SECTION("round trip") {
        const auto val = GENERATE(
            ZonedTime { .time = time_min, .offset = L::min() },
            ZonedTime { .time = time_max, .offset = L::max() },
            ZonedTime { .time = -1, .offset = -1 },
            ZonedTime { .time = 0, .offset = 0 },
            ZonedTime { .time = 1'700'000'000, .offset = 60 });

        CHECK(round_trip(val) == val);
    }

    SECTION("layout") {
        const auto expected = bytes(0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0xFF, 0x88);
        CHECK(std::ranges::equal(encoded(ZonedTime { .time = 256, .offset = -120 }), expected));
    }
}

TEMPLATE_TEST_CASE("FixedPoint", "[eput][domain]", FixedPoint32, FixedPoint64) {
    using Unscaled = decltype(TestType::unscaled);
    using L = std::numeric_limits<Unscaled>;

    SECTION("round trip with the scale passed out of band") {
        const Unscaled unscaled = GENERATE(L::min(), L::max(), static_cast<Unscaled>(L::max() / 2), Unscaled { -1 }, Unscaled { 0 }, Unscaled { 1 }, Unscaled { 123456 });
        const int32_t scale = GENERATE(0, 2, -3);

        const TestType val { .unscaled = unscaled, .scale = scale };
        const auto decoded = decode<TestType>(encoded(val), val.scale);
        CHECK(decoded.unscaled == val.unscaled);
        CHECK(decoded.scale == val.scale);
    }

    SECTION("scale is not on the wire") {
        STATIC_REQUIRE(wire_size<TestType> == sizeof(Unscaled));

        const TestType a { .unscaled = 42, .scale = 1 };
        const TestType b { .unscaled = 42, .scale = 5 };
        CHECK(std::ranges::equal(encoded(a), encoded(b)));
        CHECK(std::ranges::equal(encoded(a), encoded(Unscaled { 42 })));
    }

    SECTION("decode takes the scale from the caller") {
        const auto buffer = encoded(TestType { .unscaled = -1234, .scale = 2 });
        const auto decoded = decode<TestType>(buffer, 3);
        CHECK(decoded == TestType { .unscaled = -1234, .scale = 3 });
    }

    SECTION("as_double") {
        CHECK(TestType { .unscaled = 12345, .scale = 2 }.as_double() == Approx(123.45));
        CHECK(TestType { .unscaled = -5, .scale = 0 }.as_double() == Approx(-5.0));
        CHECK(TestType { .unscaled = 7, .scale = -3 }.as_double() == Approx(7000.0));
    }
}
