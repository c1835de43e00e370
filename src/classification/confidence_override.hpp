#pragma once

/// @file confidence_override.hpp
/// @brief Upgrades FalsePositive verdicts backed by a significant raw detection.

#include "classification/classification.hpp"

namespace transitscan::classification
{
    /// @brief Static utility class for the raw-SNR override.
    ///
    /// A FalsePositive with raw search SNR above kSnrFloor becomes a Candidate
    /// with probability max(p, min(0.95, 0.5 + (snr - 3) * 0.08)).
    class ConfidenceOverride
    {
    public:
        ConfidenceOverride() = delete;

        static constexpr f64 kSnrFloor       = 3.0;
        static constexpr f64 kSlope          = 0.08;
        static constexpr f64 kMaxProbability = 0.95;

        [[nodiscard]] static ClassificationResult apply(ClassificationResult result, f64 raw_snr);
    };

} // namespace transitscan::classification
