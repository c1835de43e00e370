/// @file test_phase_fold.cpp
/// @brief Unit tests for transitscan::plot::PhaseFold.

#include <doctest/doctest.h>

#include "plot/phase_fold.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using namespace transitscan;
using namespace transitscan::plot;

namespace
{

bool sorted_by_phase(const std::vector<Vec2d>& points)
{
    return std::is_sorted(points.begin(), points.end(),
                          [](const Vec2d& a, const Vec2d& b) { return a.x < b.x; });
}

} // anonymous namespace

TEST_CASE("Small curves keep every sample")
{
    detection::LightCurve curve;
    curve.time = {0.0, 0.3, 0.6, 0.9, 1.2, 1.5, 1.8, 2.1, 2.4, 2.7};
    curve.flux = {2.0, 2.0, 2.0, 1.9, 2.0, 2.1, 2.0, 2.0, 2.0, 2.0};

    const auto points = PhaseFold::build(curve, 1.0);
    REQUIRE(points.size() == 10);
    CHECK(sorted_by_phase(points));

    for (const Vec2d& p : points)
    {
        CHECK(p.x >= 0.0);
        CHECK(p.x < 1.0);
    }

    // Flux is normalised by the series mean (2.0)
    const auto dip = std::min_element(points.begin(), points.end(),
                                      [](const Vec2d& a, const Vec2d& b) { return a.y < b.y; });
    CHECK(dip->y == doctest::Approx(0.95));
    CHECK(dip->x == doctest::Approx(0.9));
}

TEST_CASE("Large curves are decimated to at most 2000 points")
{
    const detection::LightCurve curve = transitscan::test::make_light_curve(200000, 90.0, {{3.5, 0.005, 0.2, 1.0}}, 0.0003);

    const auto points = PhaseFold::build(curve, 3.5);
    CHECK(points.size() <= PhaseFold::kMaxPoints);
    CHECK(points.size() >= PhaseFold::kMaxPoints - 1);
    CHECK(sorted_by_phase(points));
}

TEST_CASE("Custom point budget and degenerate input")
{
    const detection::LightCurve curve = transitscan::test::make_light_curve(1000, 10.0, {}, 0.001);
    CHECK(PhaseFold::build(curve, 2.0, 100).size() == 100);
    CHECK(PhaseFold::build(curve, 0.0).empty());
    CHECK(PhaseFold::build(detection::LightCurve{}, 2.0).empty());
}
