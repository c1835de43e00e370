/// @file test_time_system.cpp
/// @brief Unit tests for transitscan::astro::TimeSystem.
///
/// Verifies Julian Date conversion (Meeus algorithm), round-trip consistency
/// and the timestamp formats used for discovery records.

#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <string>

using namespace transitscan;
using namespace transitscan::astro;

static constexpr f64 kJdTolerance     = 1e-6;   // ~0.086 seconds
static constexpr f64 kSecondTolerance = 1.0;

// =================================================================
// Julian Date conversion tests
// =================================================================

TEST_CASE("J2000.0 epoch gives JD 2451545.0")
{
    const DateTime j2000 = {
        .year   = 2000,
        .month  = 1,
        .day    = 1,
        .hour   = 12,
        .minute = 0,
        .second = 0.0,
    };

    const f64 jd = TimeSystem::to_julian_date(j2000);
    CHECK(jd == doctest::Approx(2451545.0).epsilon(kJdTolerance));
}

TEST_CASE("Known date: 1999-01-01 00:00 UTC -> JD 2451179.5")
{
    const DateTime dt = {
        .year   = 1999,
        .month  = 1,
        .day    = 1,
        .hour   = 0,
        .minute = 0,
        .second = 0.0,
    };

    const f64 jd = TimeSystem::to_julian_date(dt);
    CHECK(jd == doctest::Approx(2451179.5).epsilon(kJdTolerance));
}

TEST_CASE("Known date: 2024-06-15 22:30:00 UTC")
{
    // Reference value from USNO Julian Date converter
    const DateTime dt = {
        .year   = 2024,
        .month  = 6,
        .day    = 15,
        .hour   = 22,
        .minute = 30,
        .second = 0.0,
    };

    const f64 jd = TimeSystem::to_julian_date(dt);
    // Expected: JD 2460476.4375
    CHECK(jd == doctest::Approx(2460476.4375).epsilon(kJdTolerance));
}

// =================================================================
// Round-trip: DateTime -> JD -> DateTime
// =================================================================

TEST_CASE("Round-trip: DateTime -> JD -> DateTime preserves values")
{
    const DateTime original = {
        .year   = 2024,
        .month  = 3,
        .day    = 15,
        .hour   = 14,
        .minute = 30,
        .second = 45.0,
    };

    const f64 jd = TimeSystem::to_julian_date(original);
    const DateTime result = TimeSystem::from_julian_date(jd);

    CHECK(result.year   == original.year);
    CHECK(result.month  == original.month);
    CHECK(result.day    == original.day);
    CHECK(result.hour   == original.hour);
    CHECK(result.minute == original.minute);
    CHECK(result.second == doctest::Approx(original.second).epsilon(kSecondTolerance));
}

TEST_CASE("Round-trip: J2000.0 epoch")
{
    const DateTime original = {
        .year   = 2000,
        .month  = 1,
        .day    = 1,
        .hour   = 12,
        .minute = 0,
        .second = 0.0,
    };

    const f64 jd = TimeSystem::to_julian_date(original);
    const DateTime result = TimeSystem::from_julian_date(jd);

    CHECK(result.year   == 2000);
    CHECK(result.month  == 1);
    CHECK(result.day    == 1);
    CHECK(result.hour   == 12);
    CHECK(result.minute == 0);
    CHECK(result.second == doctest::Approx(0.0).epsilon(kSecondTolerance));
}

TEST_CASE("Round-trip: February date (month <= 2 branch)")
{
    const DateTime original = {
        .year   = 2025,
        .month  = 2,
        .day    = 14,
        .hour   = 8,
        .minute = 15,
        .second = 30.0,
    };

    const f64 jd = TimeSystem::to_julian_date(original);
    const DateTime result = TimeSystem::from_julian_date(jd);

    CHECK(result.year   == original.year);
    CHECK(result.month  == original.month);
    CHECK(result.day    == original.day);
    CHECK(result.hour   == original.hour);
    CHECK(result.minute == original.minute);
    CHECK(result.second == doctest::Approx(original.second).epsilon(kSecondTolerance));
}

// =================================================================
// Timestamp formatting
// =================================================================

TEST_CASE("ISO-8601 and compact stamps")
{
    const DateTime dt = {
        .year   = 2024,
        .month  = 3,
        .day    = 15,
        .hour   = 14,
        .minute = 30,
        .second = 45.0,
    };

    CHECK(TimeSystem::to_iso8601(dt) == "2024-03-15T14:30:45Z");
    CHECK(TimeSystem::compact_stamp(dt) == "20240315T143045");
}

TEST_CASE("Fractional seconds round and never roll past the end of the day")
{
    DateTime dt = {
        .year   = 2024,
        .month  = 1,
        .day    = 9,
        .hour   = 8,
        .minute = 5,
        .second = 59.6,
    };
    CHECK(TimeSystem::to_iso8601(dt) == "2024-01-09T08:06:00Z");

    dt.hour   = 23;
    dt.minute = 59;
    CHECK(TimeSystem::to_iso8601(dt) == "2024-01-09T23:59:59Z");
    CHECK(TimeSystem::compact_stamp(dt) == "20240109T235959");
}

TEST_CASE("Formatted JD round-trip")
{
    const DateTime dt = TimeSystem::from_julian_date(2460476.4375);
    CHECK(TimeSystem::to_iso8601(dt) == "2024-06-15T22:30:00Z");
}

// =================================================================
// now_as_jd sanity check
// =================================================================

TEST_CASE("now_as_jd returns a reasonable Julian Date")
{
    const f64 jd = TimeSystem::now_as_jd();

    // Should be after 2020-01-01 (JD ~2458849.5) and before 2100
    CHECK(jd > 2458849.5);
    CHECK(jd < 2488070.0);
}
TEST_CASE("now_utc produces a well-formed timestamp")
{
    const std::string stamp = TimeSystem::to_iso8601(TimeSystem::now_utc());
    REQUIRE(stamp.size() == 20);
    CHECK(stamp[4] == '-');
    CHECK(stamp[10] == 'T');
    CHECK(stamp.back() == 'Z');
}
