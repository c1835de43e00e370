#pragma once

/// @file light_curve.hpp
/// @brief Light-curve samples, flux statistics and cleaning.

#include "core/types.hpp"

#include <vector>

namespace transitscan::detection
{
    /// @brief One (time, flux) measurement. Time in days, flux normalized (~1.0 baseline).
    struct LightCurveSample
    {
        f64 time;
        f64 flux;
    };

    /// @brief Mean and population standard deviation of a flux series.
    struct FluxStats
    {
        f64 mean    = 0.0;
        f64 std_dev = 0.0;

        /// Relative scatter in ppm (std / |mean| x 1e6); 0 for a zero mean.
        [[nodiscard]] f64 noise_ppm() const;
    };

    /// @brief Compute FluxStats over a flux array (zeros for an empty array).
    [[nodiscard]] FluxStats compute_stats(const std::vector<f64>& flux);

    /// @brief A light curve as parallel time/flux arrays (structure-of-arrays for the search loops).
    ///
    /// Owned by one analysis call; never shared across requests.
    struct LightCurve
    {
        std::vector<f64> time;
        std::vector<f64> flux;

        /// @brief Build from raw columns: keeps rows where both values are finite,
        /// sorted by time ascending. Extra trailing values in the longer input are ignored.
        [[nodiscard]] static LightCurve from_columns(const std::vector<f64>& time,
                                                     const std::vector<f64>& flux);

        [[nodiscard]] std::size_t size() const { return time.size(); }
        [[nodiscard]] bool empty() const { return time.empty(); }

        /// @brief Total time span (last - first), 0 for fewer than two samples.
        [[nodiscard]] f64 span() const;

        [[nodiscard]] LightCurveSample sample(std::size_t i) const { return {time[i], flux[i]}; }

        /// @brief Drop samples whose flux deviates from the mean by more than
        /// @p sigma standard deviations.
        /// @return Number of samples removed.
        std::size_t remove_outliers(f64 sigma);
    };

} // namespace transitscan::detection
