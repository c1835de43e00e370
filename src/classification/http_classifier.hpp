#pragma once

/// @file http_classifier.hpp
/// @brief ClassifierService backed by the HTTP prediction endpoint.

#include "classification/classifier_service.hpp"
#include "core/config.hpp"

#include <optional>
#include <string>

namespace transitscan::classification
{
    /// @brief POSTs {period, radius, depth, snr, duration, dataset} and reads
    /// {classification, confidence}. One attempt per call, bounded by the
    /// configured timeout.
    class HttpClassifier final : public ClassifierService
    {
    public:
        explicit HttpClassifier(core::ClassifierConfig config);

        [[nodiscard]] std::optional<ServiceVerdict> classify(const analysis::FeatureVector& features,
                                                             std::string_view dataset_tag) override;

        /// @brief Request body for @p features.
        [[nodiscard]] static std::string build_request(const analysis::FeatureVector& features,
                                                       std::string_view dataset_tag);

        /// @brief Parse a response body. @return std::nullopt on malformed JSON or unknown label.
        [[nodiscard]] static std::optional<ServiceVerdict> parse_response(const std::string& body);

    private:
        core::ClassifierConfig m_config;
    };

} // namespace transitscan::classification
