#pragma once

/// @file phase_fold.hpp
/// @brief Decimated, phase-sorted point series for plotting a folded light curve.

#include "detection/light_curve.hpp"

#include <vector>

namespace transitscan::plot
{
    /// @brief Static utility class building phase-fold plot data.
    class PhaseFold
    {
    public:
        PhaseFold() = delete;

        static constexpr std::size_t kMaxPoints = 2000;

        /// @brief Fold @p curve at @p period_days.
        ///
        /// Flux is divided by the series mean; samples are decimated by a uniform
        /// stride to at most @p max_points and sorted by phase ascending.
        ///
        /// @return Points with x = phase in [0, 1), y = normalized flux.
        [[nodiscard]] static std::vector<Vec2d> build(const detection::LightCurve& curve, f64 period_days,
                                                      std::size_t max_points = kMaxPoints);
    };

} // namespace transitscan::plot
