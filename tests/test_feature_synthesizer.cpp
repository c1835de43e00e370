/// @file test_feature_synthesizer.cpp
/// @brief Unit tests for transitscan::analysis::FeatureSynthesizer.

#include <doctest/doctest.h>

#include "analysis/feature_synthesizer.hpp"
#include "test_helpers.hpp"

#include <cmath>

using namespace transitscan;
using namespace transitscan::analysis;

TEST_CASE("Features derived from a detected signal")
{
    const detection::LightCurve curve = transitscan::test::make_light_curve(500, 20.0, {}, 0.001);

    detection::DetectedSignal signal;
    signal.period_days = 3.5;
    signal.depth_ppm   = 10000.0;
    signal.snr         = 12.5;

    const FeatureVector f = FeatureSynthesizer::synthesize(signal, curve);
    const detection::FluxStats stats = detection::compute_stats(curve.flux);

    CHECK(f.orbital_period_days == doctest::Approx(3.5));
    CHECK(f.transit_duration_hours == doctest::Approx(3.5 * 0.1 * 24.0));
    CHECK(f.planetary_radius_earth == doctest::Approx(std::sqrt(0.01) * 11.0));
    CHECK(f.transit_depth_ppm == doctest::Approx(10000.0));
    CHECK(f.snr == doctest::Approx(12.5));
    CHECK(f.sample_count == 500);
    CHECK(f.mean_flux == doctest::Approx(stats.mean));
    CHECK(f.flux_std_dev == doctest::Approx(stats.std_dev));
    CHECK(f.odd_even_depth_diff == doctest::Approx(0.1 * stats.std_dev));
}

TEST_CASE("Negative depth maps to zero radius")
{
    const detection::LightCurve curve = transitscan::test::make_light_curve(200, 10.0, {}, 0.001);
    detection::DetectedSignal signal;
    signal.period_days = 2.0;
    signal.depth_ppm   = -50.0;

    const FeatureVector f = FeatureSynthesizer::synthesize(signal, curve);
    CHECK(f.planetary_radius_earth == 0.0);
}

TEST_CASE("Planet type by radius and period")
{
    CHECK(FeatureSynthesizer::planet_type(0.0, 3.0) == PlanetType::Unknown);
    CHECK(FeatureSynthesizer::planet_type(1.0, 3.0) == PlanetType::Terrestrial);
    CHECK(FeatureSynthesizer::planet_type(2.5, 3.0) == PlanetType::SuperEarth);
    CHECK(FeatureSynthesizer::planet_type(6.0, 3.0) == PlanetType::NeptuneLike);
    CHECK(FeatureSynthesizer::planet_type(11.0, 3.0) == PlanetType::HotJupiter);
    CHECK(FeatureSynthesizer::planet_type(11.0, 40.0) == PlanetType::GasGiant);

    CHECK(planet_type_name(PlanetType::HotJupiter) == "hot_jupiter");
    CHECK(planet_type_name(PlanetType::Unknown) == "unknown");
}
