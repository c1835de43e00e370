/// @file test_classification.cpp
/// @brief Unit tests for label names, RuleClassifier and ConfidenceOverride.

#include <doctest/doctest.h>

#include "classification/classification.hpp"
#include "classification/confidence_override.hpp"
#include "classification/rule_classifier.hpp"

#include <cmath>
#include <string>

using namespace transitscan;
using namespace transitscan::classification;

namespace
{

analysis::FeatureVector features(f64 snr, f64 period, f64 radius, f64 depth = 1000.0)
{
    analysis::FeatureVector f;
    f.snr                    = snr;
    f.orbital_period_days    = period;
    f.planetary_radius_earth = radius;
    f.transit_depth_ppm      = depth;
    return f;
}

} // anonymous namespace

// =================================================================
// Labels
// =================================================================

TEST_CASE("Label names and parsing")
{
    CHECK(label_name(Label::Confirmed) == "Confirmed Planet");
    CHECK(label_name(Label::Candidate) == "Candidate Planet");
    CHECK(label_name(Label::FalsePositive) == "False Positive");

    CHECK(parse_label("Confirmed Planet") == Label::Confirmed);
    CHECK(parse_label("  CANDIDATE ") == Label::Candidate);
    CHECK(parse_label("false_positive") == Label::FalsePositive);
    CHECK(parse_label("False Positive") == Label::FalsePositive);
    CHECK_FALSE(parse_label("maybe a planet").has_value());

    CHECK(verdict_source_name(VerdictSource::Service) == "service");
    CHECK(verdict_source_name(VerdictSource::Fallback) == "fallback");
}

// =================================================================
// Rule-based fallback
// =================================================================

TEST_CASE("Strong plausible signal is Confirmed")
{
    const ClassificationResult r = RuleClassifier::classify(features(15.0, 3.5, 2.0));
    CHECK(r.label == Label::Confirmed);
    CHECK(r.source == VerdictSource::Fallback);
    // 0.90 + 0.02 (SNR > 10) + 0.02 (period) + 0.02 (radius) + 0.01 (depth)
    CHECK(r.probability == doctest::Approx(0.97));
    CHECK_FALSE(r.reasoning.empty());
}

TEST_CASE("Moderate signal is Candidate")
{
    const ClassificationResult r = RuleClassifier::classify(features(6.0, 3.5, 2.0));
    CHECK(r.label == Label::Candidate);
    // 0.70 - 0.10 (SNR < 7) + 0.02 + 0.02 + 0.01
    CHECK(r.probability == doctest::Approx(0.65));
}

TEST_CASE("Implausible radius demotes a strong signal to Candidate")
{
    const ClassificationResult r = RuleClassifier::classify(features(15.0, 3.5, 25.0));
    CHECK(r.label == Label::Candidate);
}

TEST_CASE("Weak signal is a FalsePositive at 0.30")
{
    const ClassificationResult r = RuleClassifier::classify(features(3.2, 3.5, 1.0));
    CHECK(r.label == Label::FalsePositive);
    CHECK(r.probability == doctest::Approx(0.30));
}

TEST_CASE("Confidence is clamped to [0.50, 0.99] and rounded to two decimals")
{
    CHECK(RuleClassifier::confidence(0.90, features(10000.0, 3.5, 2.0)) == doctest::Approx(0.99));
    CHECK(RuleClassifier::confidence(0.50, features(1.0, 1000.0, 50.0, 60000.0)) == doctest::Approx(0.50));
    CHECK(RuleClassifier::confidence(0.70, features(6.0, 3.5, -5.0)) == doctest::Approx(0.58));

    const f64 c = RuleClassifier::confidence(0.7, features(25.0, 3.5, 1.0));
    CHECK(c == doctest::Approx(std::round(c * 100.0) / 100.0));
}

// =================================================================
// Raw-SNR override
// =================================================================

TEST_CASE("FalsePositive above SNR 3 is upgraded to Candidate")
{
    ClassificationResult fp;
    fp.label       = Label::FalsePositive;
    fp.probability = 0.30;
    fp.reasoning   = "Rule-based: signal too weak";

    const ClassificationResult r = ConfidenceOverride::apply(fp, 3.85);
    CHECK(r.label == Label::Candidate);
    CHECK(r.probability == doctest::Approx(0.5 + 0.85 * 0.08));
    CHECK(r.overridden);
    CHECK(r.reasoning.find("upgraded") != std::string::npos);
}

TEST_CASE("Override probability is capped and never lowered")
{
    ClassificationResult fp;
    fp.label       = Label::FalsePositive;
    fp.probability = 0.30;
    CHECK(ConfidenceOverride::apply(fp, 40.0).probability == doctest::Approx(0.95));

    fp.probability = 0.90;
    CHECK(ConfidenceOverride::apply(fp, 4.0).probability == doctest::Approx(0.90));
}

TEST_CASE("Override leaves other verdicts alone")
{
    ClassificationResult fp;
    fp.label       = Label::FalsePositive;
    fp.probability = 0.30;
    const ClassificationResult at_floor = ConfidenceOverride::apply(fp, 3.0);
    CHECK(at_floor.label == Label::FalsePositive);
    CHECK_FALSE(at_floor.overridden);

    ClassificationResult candidate;
    candidate.label       = Label::Candidate;
    candidate.probability = 0.55;
    const ClassificationResult r = ConfidenceOverride::apply(candidate, 20.0);
    CHECK(r.label == Label::Candidate);
    CHECK(r.probability == doctest::Approx(0.55));
    CHECK_FALSE(r.overridden);
}
