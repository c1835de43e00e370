#pragma once

/// @file signal_extractor.hpp
/// @brief Iterative multi-signal extraction with per-signal masking.

#include "core/config.hpp"
#include "detection/light_curve.hpp"
#include "detection/transit_search.hpp"

#include <vector>

namespace transitscan::detection
{
    /// @brief Signals in discovery order plus the residual flux after masking.
    struct Extraction
    {
        std::vector<DetectedSignal> signals;
        std::vector<f64>            residual;
    };

    /// @brief Drives TransitSearch repeatedly, masking each accepted signal
    /// so weaker independent periods can surface.
    ///
    /// Iteration i searches with SNR threshold base + step * i and stops at the
    /// first empty pass or after max_signals signals.
    class SignalExtractor
    {
    public:
        /// Bins on each side of the transit bin replaced by the residual mean.
        static constexpr u32 kMaskRadiusBins = 2;

        explicit SignalExtractor(const core::SearchConfig& config);

        [[nodiscard]] Extraction extract(const LightCurve& curve) const;

        /// @brief Replace the flux of samples near the signal's transit phase with @p fill.
        /// @return Number of samples masked.
        static std::size_t mask(std::vector<f64>& residual, const std::vector<f64>& time,
                                const DetectedSignal& signal, u32 phase_bins, f64 fill);

    private:
        core::SearchConfig m_config;
    };

} // namespace transitscan::detection
