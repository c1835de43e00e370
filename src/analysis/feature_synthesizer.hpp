#pragma once

/// @file feature_synthesizer.hpp
/// @brief Physically named features derived from a detected signal.

#include "detection/light_curve.hpp"
#include "detection/transit_search.hpp"

#include <string_view>

namespace transitscan::analysis
{
    /// @brief Feature vector handed to classification. Immutable once built.
    struct FeatureVector
    {
        f64         orbital_period_days    = 0.0;
        f64         transit_duration_hours = 0.0;
        f64         planetary_radius_earth = 0.0;
        f64         transit_depth_ppm      = 0.0;
        f64         snr                    = 0.0;
        f64         odd_even_depth_diff    = 0.0;  ///< Scatter proxy, not a true odd/even comparison
        std::size_t sample_count           = 0;
        f64         mean_flux              = 0.0;
        f64         flux_std_dev           = 0.0;
    };

    /// @brief Coarse size class of a candidate.
    enum class PlanetType : u8
    {
        Unknown,
        HotJupiter,
        GasGiant,
        NeptuneLike,
        SuperEarth,
        Terrestrial,
    };

    /// @brief Static utility class mapping signals to features.
    ///
    /// Duration assumes a 10% duty cycle; radius is sqrt(depth) scaled so a unit
    /// depth fraction on a Sun-like star maps to 11 Earth radii.
    class FeatureSynthesizer
    {
    public:
        FeatureSynthesizer() = delete;

        static constexpr f64 kDutyCycle          = 0.1;
        static constexpr f64 kSolarRadiusInEarth = 11.0;
        static constexpr f64 kOddEvenScale       = 0.1;

        /// @brief Build the feature vector for @p signal.
        /// @param signal Detected signal.
        /// @param curve  The full (pre-masking) light curve.
        [[nodiscard]] static FeatureVector synthesize(const detection::DetectedSignal& signal,
                                                      const detection::LightCurve& curve);

        [[nodiscard]] static PlanetType planet_type(f64 radius_earth, f64 period_days);
    };

    /// @brief Snake-case name (e.g. "hot_jupiter").
    [[nodiscard]] std::string_view planet_type_name(PlanetType type);

} // namespace transitscan::analysis
