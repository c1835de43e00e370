/// @file confidence_override.cpp
/// @brief ConfidenceOverride implementation.

#include "classification/confidence_override.hpp"

#include <algorithm>

#include <spdlog/fmt/fmt.h>

namespace transitscan::classification
{

ClassificationResult ConfidenceOverride::apply(ClassificationResult result, f64 raw_snr)
{
    if (result.label != Label::FalsePositive || raw_snr <= kSnrFloor)
    {
        return result;
    }

    const f64 floor = std::min(kMaxProbability, 0.5 + (raw_snr - kSnrFloor) * kSlope);
    result.label       = Label::Candidate;
    result.probability = std::max(result.probability, floor);
    result.overridden  = true;
    result.reasoning += fmt::format("; upgraded to candidate on raw detection SNR {:.2f}", raw_snr);
    return result;
}

} // namespace transitscan::classification
