#pragma once

#include <glm/glm.hpp>

#include <cstdint>

namespace transitscan
{
    // Precision aliases
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (double precision for photometry)
    using Vec2d = glm::dvec2;

    // Astronomical and photometric constants
    namespace astro_constants
    {
        constexpr f64 kHoursPerDay  = 24.0;
        constexpr f64 kPpm          = 1.0e6;
        constexpr f64 kUnixEpochJd  = 2440587.5;  // Julian Date of 1970-01-01 00:00 UTC
        constexpr f64 kKeplerCadenceDays = 0.0204;  // 29.4 min long cadence
    }
}
