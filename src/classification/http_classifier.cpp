/// @file http_classifier.cpp
/// @brief HttpClassifier implementation (nlohmann::json over net::HttpClient).

#include "classification/http_classifier.hpp"

#include "core/logger.hpp"
#include "net/http_client.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <utility>

namespace transitscan::classification
{

using json = nlohmann::json;

HttpClassifier::HttpClassifier(core::ClassifierConfig config)
    : m_config(std::move(config))
{
}

std::optional<ServiceVerdict> HttpClassifier::classify(const analysis::FeatureVector& features,
                                                       std::string_view dataset_tag)
{
    if (!m_config.enabled)
    {
        return std::nullopt;
    }

    const net::HttpEndpoint endpoint{
        .host   = m_config.host,
        .port   = m_config.port,
        .target = m_config.target,
    };
    const auto timeout = std::chrono::milliseconds(static_cast<i64>(m_config.timeout_s * 1000.0));

    const auto response = net::HttpClient::post_json(endpoint, build_request(features, dataset_tag), timeout);
    if (!response)
    {
        return std::nullopt;
    }
    if (!response->ok())
    {
        TSC_CORE_WARN("HttpClassifier: Service returned HTTP {}", response->status);
        return std::nullopt;
    }

    auto verdict = parse_response(response->body);
    if (verdict)
    {
        TSC_CORE_DEBUG("HttpClassifier: {} ({:.2f})", label_name(verdict->label), verdict->confidence);
    }
    return verdict;
}

std::string HttpClassifier::build_request(const analysis::FeatureVector& features, std::string_view dataset_tag)
{
    const json body = {
        {"period",   features.orbital_period_days},
        {"radius",   features.planetary_radius_earth},
        {"depth",    features.transit_depth_ppm},
        {"snr",      features.snr},
        {"duration", features.transit_duration_hours},
        {"dataset",  std::string(dataset_tag)},
    };
    return body.dump();
}

std::optional<ServiceVerdict> HttpClassifier::parse_response(const std::string& body)
{
    const json parsed = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object())
    {
        TSC_CORE_WARN("HttpClassifier: Response is not a JSON object");
        return std::nullopt;
    }

    const auto label_it      = parsed.find("classification");
    const auto confidence_it = parsed.find("confidence");
    if (label_it == parsed.end() || !label_it->is_string() ||
        confidence_it == parsed.end() || !confidence_it->is_number())
    {
        TSC_CORE_WARN("HttpClassifier: Response lacks classification/confidence");
        return std::nullopt;
    }

    const auto label = parse_label(label_it->get<std::string>());
    if (!label)
    {
        TSC_CORE_WARN("HttpClassifier: Unknown label '{}'", label_it->get<std::string>());
        return std::nullopt;
    }

    return ServiceVerdict{.label = *label, .confidence = confidence_it->get<f64>()};
}

} // namespace transitscan::classification
