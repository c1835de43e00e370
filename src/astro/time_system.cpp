/// @file time_system.cpp
/// @brief Julian Date conversion and timestamp formatting.

#include "astro/time_system.hpp"

#include "core/types.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

#include <spdlog/fmt/fmt.h>

namespace transitscan::astro
{

// -----------------------------------------------------------------
// Julian Date: Meeus algorithm (Astronomical Algorithms, Ch. 7)
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    i32 y = dt.year;
    i32 m = dt.month;

    // Jan and Feb are treated as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    // Gregorian calendar correction
    const i32 a = y / 100;
    const i32 b = 2 - a + (a / 4);

    // Day fraction from hours, minutes, seconds
    const f64 day_fraction = (static_cast<f64>(dt.hour)
                            + static_cast<f64>(dt.minute) / 60.0
                            + dt.second / 3600.0) / 24.0;

    const f64 jd = std::floor(365.25 * static_cast<f64>(y + 4716))
                 + std::floor(30.6001 * static_cast<f64>(m + 1))
                 + static_cast<f64>(dt.day)
                 + day_fraction
                 + static_cast<f64>(b)
                 - 1524.5;

    return jd;
}

// -----------------------------------------------------------------
// Julian Date -> civil date/time (Meeus, Ch. 7)
// -----------------------------------------------------------------

DateTime TimeSystem::from_julian_date(f64 jd)
{
    // Add 0.5 to shift from noon-based to midnight-based
    const f64 jd_plus = jd + 0.5;
    const i32 z = static_cast<i32>(std::floor(jd_plus));
    const f64 f = jd_plus - static_cast<f64>(z);

    i32 a = z;
    if (z >= 2299161)
    {
        const i32 alpha = static_cast<i32>(std::floor(
            (static_cast<f64>(z) - 1867216.25) / 36524.25));
        a = z + 1 + alpha - (alpha / 4);
    }

    const i32 b = a + 1524;
    const i32 c = static_cast<i32>(std::floor(
        (static_cast<f64>(b) - 122.1) / 365.25));
    const i32 d = static_cast<i32>(std::floor(
        365.25 * static_cast<f64>(c)));
    const i32 e = static_cast<i32>(std::floor(
        static_cast<f64>(b - d) / 30.6001));

    // Day (with fractional part)
    const f64 day_with_fraction = static_cast<f64>(b - d)
                                - std::floor(30.6001 * static_cast<f64>(e))
                                + f;

    const i32 day = static_cast<i32>(std::floor(day_with_fraction));
    const f64 day_frac = day_with_fraction - static_cast<f64>(day);

    // Month
    i32 month = (e < 14) ? (e - 1) : (e - 13);

    // Year
    i32 year = (month > 2) ? (c - 4716) : (c - 4715);

    // Time from day fraction
    const f64 hours_total = day_frac * 24.0;
    const i32 hour = static_cast<i32>(std::floor(hours_total));

    const f64 minutes_total = (hours_total - static_cast<f64>(hour)) * 60.0;
    const i32 minute = static_cast<i32>(std::floor(minutes_total));

    const f64 second = (minutes_total - static_cast<f64>(minute)) * 60.0;

    return DateTime{
        .year   = year,
        .month  = month,
        .day    = day,
        .hour   = hour,
        .minute = minute,
        .second = second,
    };
}

// -----------------------------------------------------------------
// Current system time -> Julian Date
// -----------------------------------------------------------------

f64 TimeSystem::now_as_jd()
{
    using namespace std::chrono;

    const auto now = system_clock::now();
    const auto since_epoch = now.time_since_epoch();
    const auto total_seconds = duration_cast<duration<f64>>(since_epoch).count();

    return astro_constants::kUnixEpochJd + total_seconds / 86400.0;
}

// -----------------------------------------------------------------
// Current UTC civil time
// -----------------------------------------------------------------

DateTime TimeSystem::now_utc()
{
    return from_julian_date(now_as_jd());
}

// -----------------------------------------------------------------
// Timestamp formatting
// -----------------------------------------------------------------

i32 TimeSystem::seconds_of_day(const DateTime& dt)
{
    const f64 total = static_cast<f64>(dt.hour) * 3600.0
                    + static_cast<f64>(dt.minute) * 60.0
                    + dt.second;
    return std::clamp(static_cast<i32>(std::lround(total)), 0, 86399);
}

std::string TimeSystem::to_iso8601(const DateTime& dt)
{
    const i32 s = seconds_of_day(dt);
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                       dt.year, dt.month, dt.day, s / 3600, (s / 60) % 60, s % 60);
}

std::string TimeSystem::compact_stamp(const DateTime& dt)
{
    const i32 s = seconds_of_day(dt);
    return fmt::format("{:04d}{:02d}{:02d}T{:02d}{:02d}{:02d}",
                       dt.year, dt.month, dt.day, s / 3600, (s / 60) % 60, s % 60);
}

} // namespace transitscan::astro
