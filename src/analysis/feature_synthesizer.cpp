/// @file feature_synthesizer.cpp
/// @brief FeatureSynthesizer implementation.

#include "analysis/feature_synthesizer.hpp"

#include <algorithm>
#include <cmath>

namespace transitscan::analysis
{

FeatureVector FeatureSynthesizer::synthesize(const detection::DetectedSignal& signal,
                                             const detection::LightCurve& curve)
{
    const detection::FluxStats stats = detection::compute_stats(curve.flux);
    const f64 depth_fraction = std::max(signal.depth_ppm, 0.0) / astro_constants::kPpm;

    return FeatureVector{
        .orbital_period_days    = signal.period_days,
        .transit_duration_hours = signal.period_days * kDutyCycle * astro_constants::kHoursPerDay,
        .planetary_radius_earth = std::sqrt(depth_fraction) * kSolarRadiusInEarth,
        .transit_depth_ppm      = signal.depth_ppm,
        .snr                    = signal.snr,
        .odd_even_depth_diff    = std::abs(stats.std_dev * kOddEvenScale),
        .sample_count           = curve.size(),
        .mean_flux              = stats.mean,
        .flux_std_dev           = stats.std_dev,
    };
}

PlanetType FeatureSynthesizer::planet_type(f64 radius_earth, f64 period_days)
{
    if (radius_earth <= 0.0)
    {
        return PlanetType::Unknown;
    }
    if (radius_earth > 8.0)
    {
        return period_days < 10.0 ? PlanetType::HotJupiter : PlanetType::GasGiant;
    }
    if (radius_earth > 4.0)
    {
        return PlanetType::NeptuneLike;
    }
    if (radius_earth > 1.5)
    {
        return PlanetType::SuperEarth;
    }
    return PlanetType::Terrestrial;
}

std::string_view planet_type_name(PlanetType type)
{
    switch (type)
    {
        case PlanetType::HotJupiter:  return "hot_jupiter";
        case PlanetType::GasGiant:    return "gas_giant";
        case PlanetType::NeptuneLike: return "neptune_like";
        case PlanetType::SuperEarth:  return "super_earth";
        case PlanetType::Terrestrial: return "terrestrial";
        default:                      return "unknown";
    }
}

} // namespace transitscan::analysis
