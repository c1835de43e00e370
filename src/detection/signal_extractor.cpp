/// @file signal_extractor.cpp
/// @brief SignalExtractor implementation.

#include "detection/signal_extractor.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <utility>

namespace transitscan::detection
{

SignalExtractor::SignalExtractor(const core::SearchConfig& config)
    : m_config(config)
{
}

Extraction SignalExtractor::extract(const LightCurve& curve) const
{
    Extraction result;
    result.residual = curve.flux;

    const f64 span = curve.span();
    std::vector<f64> accepted;

    for (u32 iteration = 0; iteration < m_config.max_signals; ++iteration)
    {
        const SearchParams params = SearchParams::from_config(m_config, span, iteration);
        auto signal = TransitSearch::search(curve.time, result.residual, params, accepted);
        if (!signal)
        {
            TSC_CORE_DEBUG("SignalExtractor: Iteration {} found nothing above SNR {:.2f}",
                           iteration, params.snr_threshold);
            break;
        }

        signal->iteration = iteration;
        accepted.push_back(signal->period_days);

        const f64 fill = compute_stats(result.residual).mean;
        const std::size_t masked = mask(result.residual, curve.time, *signal, params.phase_bins, fill);

        TSC_CORE_INFO("SignalExtractor: Signal {} at P = {:.4f} d (depth {:.0f} ppm, SNR {:.2f}), masked {} samples",
                      iteration + 1, signal->period_days, signal->depth_ppm, signal->snr, masked);
        result.signals.push_back(std::move(*signal));
    }

    return result;
}

std::size_t SignalExtractor::mask(std::vector<f64>& residual, const std::vector<f64>& time,
                                  const DetectedSignal& signal, u32 phase_bins, f64 fill)
{
    std::size_t masked = 0;
    const std::size_t n = std::min(residual.size(), time.size());
    for (std::size_t i = 0; i < n; ++i)
    {
        const u32 b = TransitSearch::phase_bin(time[i], signal.period_days, phase_bins);
        if (TransitSearch::circular_bin_distance(b, signal.transit_bin, phase_bins) <= kMaskRadiusBins)
        {
            residual[i] = fill;
            ++masked;
        }
    }
    return masked;
}

} // namespace transitscan::detection
