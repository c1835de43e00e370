/// @file rule_classifier.cpp
/// @brief RuleClassifier implementation.

#include "classification/rule_classifier.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/fmt/fmt.h>

namespace transitscan::classification
{

ClassificationResult RuleClassifier::classify(const analysis::FeatureVector& features)
{
    const f64 snr    = features.snr;
    const f64 period = features.orbital_period_days;
    const f64 radius = features.planetary_radius_earth;

    ClassificationResult result;
    result.source = VerdictSource::Fallback;

    if (snr > 10.0 && period > 0.5 && period < 500.0 && radius > 0.5 && radius < 20.0)
    {
        result.label       = Label::Confirmed;
        result.probability = confidence(kConfirmedBase, features);
        result.reasoning   = fmt::format("Rule-based: strong signal (SNR {:.1f}) with a plausible "
                                         "period ({:.2f} d) and radius ({:.2f} R_earth)",
                                         snr, period, radius);
    }
    else if (snr > 5.0 && period > 0.5)
    {
        result.label       = Label::Candidate;
        result.probability = confidence(kCandidateBase, features);
        result.reasoning   = fmt::format("Rule-based: moderate signal (SNR {:.1f}) at {:.2f} d", snr, period);
    }
    else
    {
        result.label       = Label::FalsePositive;
        result.probability = kFalsePositiveProb;
        result.reasoning   = fmt::format("Rule-based: signal too weak (SNR {:.1f})", snr);
    }
    return result;
}

f64 RuleClassifier::confidence(f64 base, const analysis::FeatureVector& features)
{
    const f64 snr    = features.snr;
    const f64 period = features.orbital_period_days;
    const f64 radius = features.planetary_radius_earth;
    const f64 depth  = features.transit_depth_ppm;

    f64 c = base;

    // SNR tier
    if (snr > 50.0)      c += 0.08;
    else if (snr > 20.0) c += 0.05;
    else if (snr > 10.0) c += 0.02;
    else if (snr < 7.0)  c -= 0.10;

    // Physical plausibility
    if (period > 0.0 && period < 500.0)
    {
        c += 0.02;
    }
    if (radius > 0.5 && radius < 20.0)
    {
        c += 0.02;
    }
    else if (radius > 20.0 || radius < 0.3)
    {
        c -= 0.05;
    }
    if (depth > 0.0 && depth < 50000.0)
    {
        c += 0.01;
    }

    c = std::clamp(c, kMinConfidence, kMaxConfidence);
    return std::round(c * 100.0) / 100.0;
}

} // namespace transitscan::classification
