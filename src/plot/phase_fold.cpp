/// @file phase_fold.cpp
/// @brief PhaseFold implementation.

#include "plot/phase_fold.hpp"

#include "detection/transit_search.hpp"

#include <algorithm>

namespace transitscan::plot
{

std::vector<Vec2d> PhaseFold::build(const detection::LightCurve& curve, f64 period_days, std::size_t max_points)
{
    std::vector<Vec2d> points;
    const std::size_t n = curve.size();
    if (n == 0 || period_days <= 0.0 || max_points == 0)
    {
        return points;
    }

    const f64 mean  = detection::compute_stats(curve.flux).mean;
    const f64 scale = mean != 0.0 ? 1.0 / mean : 1.0;

    const std::size_t stride = (n + max_points - 1) / max_points;
    points.reserve(n / stride + 1);
    for (std::size_t i = 0; i < n; i += stride)
    {
        points.emplace_back(detection::TransitSearch::phase(curve.time[i], period_days), curve.flux[i] * scale);
    }

    std::stable_sort(points.begin(), points.end(), [](const Vec2d& a, const Vec2d& b) { return a.x < b.x; });
    return points;
}

} // namespace transitscan::plot
