/// @file discovery_store.cpp
/// @brief Shared record-store helpers.

#include "storage/discovery_store.hpp"

#include <cmath>
#include <limits>

namespace transitscan::storage
{

f64 relative_period_difference(f64 candidate, f64 stored)
{
    if (stored == 0.0)
    {
        return candidate == 0.0 ? 0.0 : std::numeric_limits<f64>::infinity();
    }
    return std::abs(candidate - stored) / std::abs(stored);
}

bool periods_match(f64 candidate, f64 stored, f64 rel_tol)
{
    constexpr f64 kBoundaryEpsilon = 1.0e-9;
    return relative_period_difference(candidate, stored) < rel_tol - kBoundaryEpsilon;
}

} // namespace transitscan::storage
