/// @file classifier_adapter.cpp
/// @brief ClassifierAdapter implementation.

#include "classification/classifier_adapter.hpp"

#include "classification/rule_classifier.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace transitscan::classification
{

ClassifierAdapter::ClassifierAdapter(ClassifierService* service, std::string dataset_tag)
    : m_service(service)
    , m_dataset_tag(std::move(dataset_tag))
{
}

ClassificationResult ClassifierAdapter::classify(const analysis::FeatureVector& features) const
{
    if (m_service)
    {
        if (const auto verdict = m_service->classify(features, m_dataset_tag))
        {
            ClassificationResult result;
            result.label       = verdict->label;
            result.probability = std::clamp(verdict->confidence, 0.0, 1.0);
            result.source      = VerdictSource::Service;
            result.reasoning   = fmt::format("Classifier service: {} with {:.0f}% confidence",
                                             label_name(result.label), result.probability * 100.0);
            return result;
        }
        TSC_WARN("Classifier service unavailable, using rule-based fallback");
    }

    return RuleClassifier::classify(features);
}

} // namespace transitscan::classification
