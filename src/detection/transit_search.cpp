/// @file transit_search.cpp
/// @brief Period-grid box search implementation.

#include "detection/transit_search.hpp"

#include "core/logger.hpp"
#include "detection/light_curve.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace transitscan::detection
{

namespace
{

// Relative margin a later candidate must beat; equal scores keep the shorter period
constexpr f64 kTieTolerance = 1.0e-9;

} // anonymous namespace

SearchParams SearchParams::from_config(const core::SearchConfig& config, f64 span_days, u32 iteration)
{
    return SearchParams{
        .min_period_days = config.min_period_days,
        .max_period_days = TransitSearch::max_period_for_span(span_days, config.max_period_cap_days),
        .snr_threshold   = config.base_snr_threshold + config.snr_threshold_step * static_cast<f64>(iteration),
        .min_depth_ppm   = config.min_depth_ppm,
        .grid_size       = config.period_grid_size,
        .phase_bins      = config.phase_bins,
        .min_samples     = config.min_samples,
        .min_bin_samples = config.min_bin_samples,
    };
}

// -----------------------------------------------------------------
// Search
// -----------------------------------------------------------------

std::optional<DetectedSignal> TransitSearch::search(const std::vector<f64>& time,
                                                    const std::vector<f64>& flux,
                                                    const SearchParams& params,
                                                    const std::vector<f64>& accepted)
{
    const std::size_t n = std::min(time.size(), flux.size());
    if (n < params.min_samples || n == 0)
    {
        TSC_CORE_DEBUG("TransitSearch: {} samples, need {}", n, params.min_samples);
        return std::nullopt;
    }
    if (params.max_period_days <= params.min_period_days || params.grid_size < 2 || params.phase_bins == 0)
    {
        TSC_CORE_DEBUG("TransitSearch: Empty period range [{:.3f}, {:.3f}]",
                       params.min_period_days, params.max_period_days);
        return std::nullopt;
    }

    const FluxStats stats = compute_stats(std::vector<f64>(flux.begin(), flux.begin() + static_cast<std::ptrdiff_t>(n)));
    const f64 noise_ppm = stats.noise_ppm();
    if (stats.mean == 0.0 || noise_ppm <= 0.0)
    {
        TSC_CORE_DEBUG("TransitSearch: Degenerate flux (mean {:.6f}, std {:.6f})", stats.mean, stats.std_dev);
        return std::nullopt;
    }

    const u32 bins = params.phase_bins;
    const f64 step = (params.max_period_days - params.min_period_days) / static_cast<f64>(params.grid_size - 1);

    std::vector<f64> bin_sum(bins);
    std::vector<u32> bin_count(bins);

    std::optional<DetectedSignal> best;
    u32 evaluated = 0;

    for (u32 k = 0; k < params.grid_size; ++k)
    {
        const f64 period = std::min(params.min_period_days + static_cast<f64>(k) * step, params.max_period_days);
        if (is_harmonic(period, accepted))
        {
            continue;
        }
        ++evaluated;

        std::fill(bin_sum.begin(), bin_sum.end(), 0.0);
        std::fill(bin_count.begin(), bin_count.end(), 0u);
        for (std::size_t i = 0; i < n; ++i)
        {
            const u32 b = phase_bin(time[i], period, bins);
            bin_sum[b] += flux[i];
            ++bin_count[b];
        }

        u32 transit_bin = 0;
        f64 min_mean    = std::numeric_limits<f64>::infinity();
        for (u32 b = 0; b < bins; ++b)
        {
            // A bin of two or three noisy samples dips by chance at some trial period
            if (bin_count[b] == 0 || bin_count[b] < params.min_bin_samples)
            {
                continue;
            }
            const f64 mean = bin_sum[b] / static_cast<f64>(bin_count[b]);
            if (mean < min_mean)
            {
                min_mean    = mean;
                transit_bin = b;
            }
        }
        if (!std::isfinite(min_mean))
        {
            continue;
        }

        const f64 depth_ppm = (stats.mean - min_mean) / stats.mean * astro_constants::kPpm;
        const f64 snr       = depth_ppm / noise_ppm;

        if (snr <= params.snr_threshold || depth_ppm < params.min_depth_ppm)
        {
            continue;
        }
        if (best && snr <= best->snr * (1.0 + kTieTolerance))
        {
            continue;
        }

        best = DetectedSignal{
            .period_days = period,
            .depth_ppm   = depth_ppm,
            .snr         = snr,
            .transit_bin = transit_bin,
        };
    }

    if (!best)
    {
        TSC_CORE_DEBUG("TransitSearch: No candidate above SNR {:.2f} among {} periods",
                       params.snr_threshold, evaluated);
        return std::nullopt;
    }

    // In-transit samples and epoch for the winning period
    bool epoch_set = false;
    for (std::size_t i = 0; i < n; ++i)
    {
        const u32 b = phase_bin(time[i], best->period_days, bins);
        if (circular_bin_distance(b, best->transit_bin, bins) <= 1)
        {
            best->in_transit_indices.push_back(i);
        }
        if (!epoch_set && b == best->transit_bin)
        {
            best->epoch = time[i];
            epoch_set   = true;
        }
    }

    TSC_CORE_DEBUG("TransitSearch: Best P = {:.4f} d, depth = {:.0f} ppm, SNR = {:.2f} ({} in transit)",
                   best->period_days, best->depth_ppm, best->snr, best->in_transit_indices.size());
    return best;
}

// -----------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------

bool TransitSearch::is_harmonic(f64 period, const std::vector<f64>& accepted)
{
    for (const f64 known : accepted)
    {
        if (known <= 0.0)
        {
            continue;
        }
        const f64 ratio = period / known;
        for (const f64 h : kHarmonicRatios)
        {
            if (std::abs(ratio - h) < kHarmonicTolerance * h)
            {
                return true;
            }
        }
    }
    return false;
}

f64 TransitSearch::phase(f64 time, f64 period)
{
    f64 p = std::fmod(time, period) / period;
    if (p < 0.0)
    {
        p += 1.0;
    }
    return p >= 1.0 ? 0.0 : p;
}

u32 TransitSearch::phase_bin(f64 time, f64 period, u32 bins)
{
    const auto b = static_cast<i64>(phase(time, period) * static_cast<f64>(bins));
    return static_cast<u32>(std::clamp<i64>(b, 0, static_cast<i64>(bins) - 1));
}

u32 TransitSearch::circular_bin_distance(u32 a, u32 b, u32 bins)
{
    const u32 d = a > b ? a - b : b - a;
    return std::min(d, bins - d);
}

f64 TransitSearch::max_period_for_span(f64 span_days, f64 cap_days)
{
    return std::min(span_days / 3.0, cap_days);
}

} // namespace transitscan::detection
