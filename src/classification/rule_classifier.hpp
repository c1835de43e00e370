#pragma once

/// @file rule_classifier.hpp
/// @brief Deterministic fallback classification and its confidence model.

#include "analysis/feature_synthesizer.hpp"
#include "classification/classification.hpp"

namespace transitscan::classification
{
    /// @brief Static utility class for the rule table used when no service answers.
    ///
    /// - Confirmed: snr > 10, 0.5 < period < 500, 0.5 < radius < 20 (base 0.90)
    /// - Candidate: snr > 5, period > 0.5 (base 0.70)
    /// - otherwise FalsePositive with probability 0.30
    class RuleClassifier
    {
    public:
        RuleClassifier() = delete;

        static constexpr f64 kConfirmedBase       = 0.90;
        static constexpr f64 kCandidateBase       = 0.70;
        static constexpr f64 kFalsePositiveProb   = 0.30;
        static constexpr f64 kMinConfidence       = 0.50;
        static constexpr f64 kMaxConfidence       = 0.99;

        [[nodiscard]] static ClassificationResult classify(const analysis::FeatureVector& features);

        /// @brief Adjust @p base by SNR tier and physical plausibility.
        /// @return Confidence clamped to [0.50, 0.99], rounded to two decimals.
        [[nodiscard]] static f64 confidence(f64 base, const analysis::FeatureVector& features);
    };

} // namespace transitscan::classification
