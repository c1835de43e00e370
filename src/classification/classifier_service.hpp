#pragma once

/// @file classifier_service.hpp
/// @brief Interface of an external feature-vector classifier.

#include "analysis/feature_synthesizer.hpp"
#include "classification/classification.hpp"

#include <optional>
#include <string_view>

namespace transitscan::classification
{
    /// @brief Remote or local model mapping features to a label and confidence.
    ///
    /// Implementations must bound every call with a timeout and return
    /// std::nullopt on any failure instead of throwing.
    class ClassifierService
    {
    public:
        virtual ~ClassifierService() = default;

        [[nodiscard]] virtual std::optional<ServiceVerdict> classify(const analysis::FeatureVector& features,
                                                                     std::string_view dataset_tag) = 0;
    };

} // namespace transitscan::classification
