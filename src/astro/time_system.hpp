#pragma once

/// @file time_system.hpp
/// @brief Julian Date conversion and UTC timestamp formatting.

#include "core/types.hpp"

#include <string>

namespace transitscan::astro
{
    /// @brief Civil date/time representation (UTC).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class for time computations.
    ///
    /// Provides Julian Date conversion (Meeus algorithm, Astronomical Algorithms Ch. 7),
    /// system clock access and the timestamp formats used for discovery records.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UTC) to Julian Date.
        /// @param dt Civil date/time. Month in [1,12], day in [1,31].
        /// @return Julian Date as a double-precision floating-point number.
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert Julian Date back to civil date/time (UTC).
        /// @param jd Julian Date (must be positive).
        /// @return Corresponding civil date/time.
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Get current system time as a Julian Date.
        [[nodiscard]] static f64 now_as_jd();

        /// @brief Current UTC civil time.
        [[nodiscard]] static DateTime now_utc();

        /// @brief "YYYY-MM-DDTHH:MM:SSZ" (seconds rounded, never carried past 23:59:59).
        [[nodiscard]] static std::string to_iso8601(const DateTime& dt);

        /// @brief "YYYYMMDDTHHMMSS", used in generated object names.
        [[nodiscard]] static std::string compact_stamp(const DateTime& dt);

    private:
        /// @brief Whole seconds of the day, rounded and clamped to [0, 86399].
        [[nodiscard]] static i32 seconds_of_day(const DateTime& dt);
    };

} // namespace transitscan::astro
