/// @file light_curve.cpp
/// @brief Light-curve construction, statistics and sigma clipping.

#include "detection/light_curve.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace transitscan::detection
{

f64 FluxStats::noise_ppm() const
{
    if (mean == 0.0)
    {
        return 0.0;
    }
    return std_dev / std::abs(mean) * astro_constants::kPpm;
}

FluxStats compute_stats(const std::vector<f64>& flux)
{
    FluxStats stats;
    if (flux.empty())
    {
        return stats;
    }

    const auto n = static_cast<f64>(flux.size());
    stats.mean = std::accumulate(flux.begin(), flux.end(), 0.0) / n;

    f64 sum_sq = 0.0;
    for (const f64 f : flux)
    {
        const f64 d = f - stats.mean;
        sum_sq += d * d;
    }
    stats.std_dev = std::sqrt(sum_sq / n);
    return stats;
}

LightCurve LightCurve::from_columns(const std::vector<f64>& time, const std::vector<f64>& flux)
{
    const std::size_t n = std::min(time.size(), flux.size());

    std::vector<LightCurveSample> samples;
    samples.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        if (std::isfinite(time[i]) && std::isfinite(flux[i]))
        {
            samples.push_back({time[i], flux[i]});
        }
    }

    std::stable_sort(samples.begin(), samples.end(),
                     [](const LightCurveSample& a, const LightCurveSample& b) { return a.time < b.time; });

    LightCurve lc;
    lc.time.reserve(samples.size());
    lc.flux.reserve(samples.size());
    for (const auto& s : samples)
    {
        lc.time.push_back(s.time);
        lc.flux.push_back(s.flux);
    }
    return lc;
}

f64 LightCurve::span() const
{
    if (time.size() < 2)
    {
        return 0.0;
    }
    return time.back() - time.front();
}

std::size_t LightCurve::remove_outliers(f64 sigma)
{
    if (sigma <= 0.0 || flux.size() < 3)
    {
        return 0;
    }

    const FluxStats stats = compute_stats(flux);
    if (stats.std_dev <= 0.0)
    {
        return 0;
    }

    const f64 limit = sigma * stats.std_dev;
    std::size_t kept = 0;
    for (std::size_t i = 0; i < flux.size(); ++i)
    {
        if (std::abs(flux[i] - stats.mean) <= limit)
        {
            time[kept] = time[i];
            flux[kept] = flux[i];
            ++kept;
        }
    }

    const std::size_t removed = flux.size() - kept;
    time.resize(kept);
    flux.resize(kept);
    return removed;
}

} // namespace transitscan::detection
