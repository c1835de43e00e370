#pragma once

/// @file transit_search.hpp
/// @brief Phase-folding box search for the best periodic dip in a light curve.

#include "core/config.hpp"
#include "core/types.hpp"

#include <array>
#include <optional>
#include <vector>

namespace transitscan::detection
{
    /// @brief Parameters of one search pass.
    struct SearchParams
    {
        f64 min_period_days = 0.5;
        f64 max_period_days = 0.0;
        f64 snr_threshold   = 2.0;
        f64 min_depth_ppm   = 100.0;
        u32 grid_size       = 200;
        u32 phase_bins      = 50;
        u32 min_samples     = 100;
        u32 min_bin_samples = 8;    ///< Sparser phase bins are never the transit bin

        /// @brief Derive pass parameters from configuration.
        /// @param config    Search configuration.
        /// @param span_days Time span of the light curve.
        /// @param iteration Zero-based extraction iteration (raises the SNR threshold).
        [[nodiscard]] static SearchParams from_config(const core::SearchConfig& config, f64 span_days,
                                                      u32 iteration);
    };

    /// @brief Best-supported periodic dip found by one search pass.
    struct DetectedSignal
    {
        f64 period_days = 0.0;
        f64 depth_ppm   = 0.0;
        f64 snr         = 0.0;
        std::vector<std::size_t> in_transit_indices; ///< Samples within one bin of the transit bin
        u32 transit_bin = 0;
        f64 epoch       = 0.0;  ///< Time of the first sample falling in the transit bin
        u32 iteration   = 0;    ///< Extraction iteration that found the signal
    };

    /// @brief Static utility class implementing the period-grid search.
    ///
    /// For every trial period on a linear grid the series is folded into
    /// equal-width phase bins. The bin with the lowest mean flux is the transit
    /// bin; depth is its deficit relative to the global mean (ppm) and SNR is
    /// depth over the relative scatter of the whole series (ppm).
    class TransitSearch
    {
    public:
        TransitSearch() = delete;

        /// Period ratios treated as duplicates or harmonics of an accepted period.
        static constexpr std::array<f64, 5> kHarmonicRatios = {1.0, 2.0, 3.0, 0.5, 0.33};
        /// Relative half-width of the rejection band around each ratio.
        static constexpr f64 kHarmonicTolerance = 0.1;

        /// @brief Search for the best period.
        /// @param time     Sample times in days.
        /// @param flux     Flux (or residual flux), same length as @p time.
        /// @param params   Grid, threshold and binning parameters.
        /// @param accepted Periods already accepted in this analysis.
        /// @return The best candidate clearing both thresholds, or std::nullopt.
        [[nodiscard]] static std::optional<DetectedSignal> search(const std::vector<f64>& time,
                                                                  const std::vector<f64>& flux,
                                                                  const SearchParams& params,
                                                                  const std::vector<f64>& accepted = {});

        /// @brief True if @p period lies within the rejection band of any accepted period.
        [[nodiscard]] static bool is_harmonic(f64 period, const std::vector<f64>& accepted);

        /// @brief Orbital phase in [0, 1).
        [[nodiscard]] static f64 phase(f64 time, f64 period);

        /// @brief Phase bin index in [0, bins).
        [[nodiscard]] static u32 phase_bin(f64 time, f64 period, u32 bins);

        /// @brief Distance between two bins on the phase circle.
        [[nodiscard]] static u32 circular_bin_distance(u32 a, u32 b, u32 bins);

        /// @brief Upper end of the period grid: min(span / 3, cap).
        [[nodiscard]] static f64 max_period_for_span(f64 span_days, f64 cap_days);
    };

} // namespace transitscan::detection
