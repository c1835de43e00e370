#pragma once

/// @file classifier_adapter.hpp
/// @brief Routes features to the classification service with rule-based fallback.

#include "classification/classifier_service.hpp"

#include <string>

namespace transitscan::classification
{
    /// @brief Asks the service first; any unavailability falls back to RuleClassifier.
    ///
    /// The service pointer is non-owning and may be null (always fallback).
    class ClassifierAdapter
    {
    public:
        ClassifierAdapter(ClassifierService* service, std::string dataset_tag);

        [[nodiscard]] ClassificationResult classify(const analysis::FeatureVector& features) const;

        [[nodiscard]] bool has_service() const { return m_service != nullptr; }

    private:
        ClassifierService* m_service;
        std::string        m_dataset_tag;
    };

} // namespace transitscan::classification
