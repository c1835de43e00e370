/// @file test_classifier_adapter.cpp
/// @brief Unit tests for transitscan::classification::ClassifierAdapter.

#include <doctest/doctest.h>

#include "classification/classifier_adapter.hpp"

#include <optional>
#include <string>

using namespace transitscan;
using namespace transitscan::classification;

namespace
{

/// Returns a canned verdict (or nothing) and records the dataset tag.
class FakeService final : public ClassifierService
{
public:
    explicit FakeService(std::optional<ServiceVerdict> verdict)
        : m_verdict(verdict)
    {
    }

    std::optional<ServiceVerdict> classify(const analysis::FeatureVector&, std::string_view dataset_tag) override
    {
        ++calls;
        last_tag = std::string(dataset_tag);
        return m_verdict;
    }

    int         calls = 0;
    std::string last_tag;

private:
    std::optional<ServiceVerdict> m_verdict;
};

analysis::FeatureVector strong_signal()
{
    analysis::FeatureVector f;
    f.snr                    = 15.0;
    f.orbital_period_days    = 3.5;
    f.planetary_radius_earth = 2.0;
    f.transit_depth_ppm      = 1000.0;
    return f;
}

} // anonymous namespace

TEST_CASE("Service verdict is used when available")
{
    FakeService service(ServiceVerdict{.label = Label::Confirmed, .confidence = 0.93});
    const ClassifierAdapter adapter(&service, "kepler");

    const ClassificationResult r = adapter.classify(strong_signal());
    CHECK(r.label == Label::Confirmed);
    CHECK(r.probability == doctest::Approx(0.93));
    CHECK(r.source == VerdictSource::Service);
    CHECK(service.calls == 1);
    CHECK(service.last_tag == "kepler");
    CHECK(adapter.has_service());
}

TEST_CASE("Service confidence is clamped to [0, 1]")
{
    FakeService service(ServiceVerdict{.label = Label::Candidate, .confidence = 1.4});
    const ClassifierAdapter adapter(&service, "uploaded");
    CHECK(adapter.classify(strong_signal()).probability == doctest::Approx(1.0));
}

TEST_CASE("Unavailable service falls back to the rule table")
{
    FakeService service(std::nullopt);
    const ClassifierAdapter adapter(&service, "uploaded");

    const ClassificationResult r = adapter.classify(strong_signal());
    CHECK(service.calls == 1);
    CHECK(r.source == VerdictSource::Fallback);
    CHECK(r.label == Label::Confirmed);
    CHECK(r.probability == doctest::Approx(0.97));
}

TEST_CASE("No service configured always uses the rule table")
{
    const ClassifierAdapter adapter(nullptr, "uploaded");
    CHECK_FALSE(adapter.has_service());

    const ClassificationResult r = adapter.classify(strong_signal());
    CHECK(r.source == VerdictSource::Fallback);
    CHECK(r.label == Label::Confirmed);
}
