/// @file test_http_classifier.cpp
/// @brief Unit tests for the HTTP classification service client.
///
/// Request and response handling are tested directly; network calls only
/// target endpoints that must fail fast.

#include <doctest/doctest.h>

#include "classification/http_classifier.hpp"
#include "net/http_client.hpp"

#include <nlohmann/json.hpp>

#include <chrono>

using namespace transitscan;
using namespace transitscan::classification;

// =================================================================
// Request body
// =================================================================

TEST_CASE("Request carries the feature subset and dataset tag")
{
    analysis::FeatureVector f;
    f.orbital_period_days    = 3.49;
    f.planetary_radius_earth = 0.76;
    f.transit_depth_ppm      = 4734.0;
    f.snr                    = 3.85;
    f.transit_duration_hours = 8.38;

    const auto body = nlohmann::json::parse(HttpClassifier::build_request(f, "tess"));
    CHECK(body.at("period").get<f64>() == doctest::Approx(3.49));
    CHECK(body.at("radius").get<f64>() == doctest::Approx(0.76));
    CHECK(body.at("depth").get<f64>() == doctest::Approx(4734.0));
    CHECK(body.at("snr").get<f64>() == doctest::Approx(3.85));
    CHECK(body.at("duration").get<f64>() == doctest::Approx(8.38));
    CHECK(body.at("dataset").get<std::string>() == "tess");
}

// =================================================================
// Response parsing
// =================================================================

TEST_CASE("Well-formed responses")
{
    const auto confirmed = HttpClassifier::parse_response(R"({"classification":"Confirmed Planet","confidence":0.91})");
    REQUIRE(confirmed.has_value());
    CHECK(confirmed->label == Label::Confirmed);
    CHECK(confirmed->confidence == doctest::Approx(0.91));

    const auto fp = HttpClassifier::parse_response(R"({"classification":"false_positive","confidence":1,"extra":[1,2]})");
    REQUIRE(fp.has_value());
    CHECK(fp->label == Label::FalsePositive);
    CHECK(fp->confidence == doctest::Approx(1.0));
}

TEST_CASE("Malformed responses are rejected")
{
    CHECK_FALSE(HttpClassifier::parse_response("").has_value());
    CHECK_FALSE(HttpClassifier::parse_response("<html>502 Bad Gateway</html>").has_value());
    CHECK_FALSE(HttpClassifier::parse_response("[1, 2, 3]").has_value());
    CHECK_FALSE(HttpClassifier::parse_response(R"({"classification":"Candidate Planet"})").has_value());
    CHECK_FALSE(HttpClassifier::parse_response(R"({"classification":7,"confidence":0.5})").has_value());
    CHECK_FALSE(HttpClassifier::parse_response(R"({"classification":"Brown Dwarf","confidence":0.5})").has_value());
    CHECK_FALSE(HttpClassifier::parse_response(R"({"classification":"Candidate Planet","confidence":"high"})").has_value());
}

// =================================================================
// Unavailable service
// =================================================================

TEST_CASE("Disabled classifier never answers")
{
    core::ClassifierConfig cfg;
    cfg.enabled = false;
    HttpClassifier classifier(cfg);
    CHECK_FALSE(classifier.classify(analysis::FeatureVector{}, "uploaded").has_value());
}

TEST_CASE("Refused connection yields no verdict")
{
    core::ClassifierConfig cfg;
    cfg.host      = "127.0.0.1";
    cfg.port      = 1;
    cfg.timeout_s = 1.0;
    HttpClassifier classifier(cfg);
    CHECK_FALSE(classifier.classify(analysis::FeatureVector{}, "uploaded").has_value());

    const auto response = net::HttpClient::post_json({"127.0.0.1", 1, "/predict"}, "{}",
                                                     std::chrono::milliseconds(500));
    CHECK_FALSE(response.has_value());
}

TEST_CASE("HTTP status classes")
{
    CHECK(net::HttpResponse{200, ""}.ok());
    CHECK(net::HttpResponse{204, ""}.ok());
    CHECK_FALSE(net::HttpResponse{404, ""}.ok());
    CHECK_FALSE(net::HttpResponse{500, ""}.ok());
}
