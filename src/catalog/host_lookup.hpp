#pragma once

/// @file host_lookup.hpp
/// @brief Host-star metadata and the best-effort lookup interface.

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace transitscan::catalog
{
    /// @brief Auxiliary metadata for a host star. Numeric fields are optional.
    struct HostMetadata
    {
        u64                identifier = 0;   ///< TIC number
        std::string        name;
        std::optional<f64> ra_deg;
        std::optional<f64> dec_deg;
        std::optional<f64> magnitude;        ///< TESS magnitude
        std::optional<f64> radius;           ///< Solar radii
        std::optional<f64> mass;             ///< Solar masses
        std::optional<f64> temperature;      ///< Effective temperature (K)
    };

    /// @brief Best-effort metadata lookup by identifier ("50365310", "TIC 50365310")
    /// or star name. A miss or failure returns std::nullopt.
    class HostLookup
    {
    public:
        virtual ~HostLookup() = default;

        [[nodiscard]] virtual std::optional<HostMetadata> lookup(std::string_view identifier) const = 0;
    };

} // namespace transitscan::catalog
