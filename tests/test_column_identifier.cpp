/// @file test_column_identifier.cpp
/// @brief Unit tests for transitscan::detection::ColumnIdentifier and LightCurve cleaning.

#include <doctest/doctest.h>

#include "detection/column_identifier.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <limits>

using namespace transitscan;
using namespace transitscan::detection;
using transitscan::test::make_table;
using transitscan::test::ramp;
using transitscan::test::scatter;

// =================================================================
// Name-based identification
// =================================================================

TEST_CASE("TESS-style columns: PDCSAP_FLUX beats SAP_FLUX, errors are ignored")
{
    const auto table = make_table({
        {"TIME",            ramp(200, 1325.3, 0.0014)},
        {"SAP_FLUX",        scatter(200, 15000.0, 30.0, 1)},
        {"SAP_FLUX_ERR",    scatter(200, 12.0, 5.0, 2)},
        {"PDCSAP_FLUX",     scatter(200, 15100.0, 25.0, 3)},
        {"PDCSAP_FLUX_ERR", scatter(200, 11.0, 5.0, 4)},
        {"QUALITY",         std::vector<f64>(200, 0.0)},
    });

    const auto selection = ColumnIdentifier::identify(table);
    REQUIRE(selection.has_value());
    CHECK(selection->time_column == "TIME");
    CHECK(selection->flux_column == "PDCSAP_FLUX");
    CHECK(selection->time_source == TimeSource::TimeColumn);
}

TEST_CASE("SAP_FLUX is used when PDCSAP_FLUX is absent")
{
    const auto table = make_table({
        {"SAP_BKG",  scatter(150, 300.0, 10.0, 1)},
        {"SAP_FLUX", scatter(150, 9000.0, 20.0, 2)},
        {"BTJD",     ramp(150, 2000.0, 0.02)},
    });

    const auto selection = ColumnIdentifier::identify(table);
    REQUIRE(selection.has_value());
    CHECK(selection->time_column == "BTJD");
    CHECK(selection->flux_column == "SAP_FLUX");
}

TEST_CASE("TIMECORR is not mistaken for the time axis")
{
    const auto table = make_table({
        {"TIMECORR", scatter(120, 0.001, 0.0001, 1)},
        {"MJD",      ramp(120, 58000.0, 0.02)},
        {"flux",     scatter(120, 1.0, 0.001, 2)},
    });

    const auto selection = ColumnIdentifier::identify(table);
    REQUIRE(selection.has_value());
    CHECK(selection->time_column == "MJD");
    CHECK(selection->flux_column == "flux");
}

TEST_CASE("Catalog metadata columns are never flux")
{
    const auto table = make_table({
        {"time",   ramp(120, 0.0, 0.02)},
        {"ra",     scatter(120, 150.0, 0.001, 1)},
        {"teff",   scatter(120, 5700.0, 1.0, 2)},
        {"counts", scatter(120, 500.0, 3.0, 3)},
    });

    const auto selection = ColumnIdentifier::identify(table);
    REQUIRE(selection.has_value());
    CHECK(selection->flux_column == "counts");
}

// =================================================================
// Cadence and statistical fallbacks
// =================================================================

TEST_CASE("Cadence counter is scaled to days")
{
    const auto table = make_table({
        {"CADENCENO", ramp(150, 1000.0, 1.0)},
        {"flux",      scatter(150, 1.0, 0.001, 1)},
    });

    const auto selection = ColumnIdentifier::identify(table);
    REQUIRE(selection.has_value());
    CHECK(selection->time_column == "CADENCENO");
    CHECK(selection->time_source == TimeSource::CadenceColumn);

    const LightCurve curve = ColumnIdentifier::extract(table, *selection);
    REQUIRE(curve.size() == 150);
    CHECK(curve.time.front() == doctest::Approx(0.0));
    CHECK(curve.time[10] == doctest::Approx(10.0 * astro_constants::kKeplerCadenceDays));
    CHECK(curve.span() == doctest::Approx(149.0 * astro_constants::kKeplerCadenceDays));
}

TEST_CASE("Unnamed columns: monotonic column is time, bounded variation is flux")
{
    const auto table = make_table({
        {"a", ramp(150, 0.0, 0.05)},
        {"b", scatter(150, 1000.0, 2.0, 1)},
        {"c", scatter(150, 0.0, 50.0, 2)},  // mean near zero: unbounded variation
    });

    const auto selection = ColumnIdentifier::identify(table);
    REQUIRE(selection.has_value());
    CHECK(selection->time_column == "a");
    CHECK(selection->flux_column == "b");
}

TEST_CASE("Identification fails without a usable axis")
{
    SUBCASE("no time axis")
    {
        const auto table = make_table({
            {"ra",  scatter(120, 150.0, 1.0, 1)},
            {"dec", scatter(120, -30.0, 1.0, 2)},
        });
        CHECK_FALSE(ColumnIdentifier::identify(table).has_value());
    }
    SUBCASE("no flux axis")
    {
        const auto table = make_table({
            {"time",       ramp(120, 0.0, 0.02)},
            {"flux_err",   scatter(120, 0.001, 0.0001, 1)},
            {"background", scatter(120, 50.0, 1.0, 2)},
        });
        CHECK(ColumnIdentifier::identify_time(table).has_value());
        CHECK_FALSE(ColumnIdentifier::identify(table).has_value());
    }
}

TEST_CASE("Monotonic detection tolerates a few decreasing steps")
{
    std::vector<f64> values = ramp(100);
    values[20] = 5.0;
    values[60] = 10.0;
    CHECK(ColumnIdentifier::is_mostly_increasing(values));

    CHECK_FALSE(ColumnIdentifier::is_mostly_increasing(scatter(100, 1.0, 0.1, 3)));
    CHECK_FALSE(ColumnIdentifier::is_mostly_increasing({1.0, 2.0}));
}

// =================================================================
// Light-curve construction and cleaning
// =================================================================

TEST_CASE("Rows with a missing value are dropped and the curve is time-sorted")
{
    io::Table table = make_table({
        {"time", {3.0, 1.0, 2.0, 4.0, 5.0}},
        {"flux", {1.03, 1.01, 1.02, 1.04, 1.05}},
    });
    table.columns[1].values[3] = std::nullopt;
    table.columns[0].values[4] = std::numeric_limits<f64>::quiet_NaN();

    const LightCurve curve = ColumnIdentifier::extract(table, ColumnSelection{"time", "flux"});
    REQUIRE(curve.size() == 3);
    CHECK(curve.time[0] == doctest::Approx(1.0));
    CHECK(curve.flux[0] == doctest::Approx(1.01));
    CHECK(curve.time[2] == doctest::Approx(3.0));
    CHECK(curve.flux[2] == doctest::Approx(1.03));
}

TEST_CASE("Outlier removal drops only extreme samples")
{
    LightCurve curve = transitscan::test::make_light_curve(500, 10.0, {}, 0.001);
    curve.flux[100] = 1.5;
    curve.flux[300] = 0.4;

    const std::size_t removed = curve.remove_outliers(10.0);
    CHECK(removed == 2);
    CHECK(curve.size() == 498);
    CHECK(curve.time.size() == curve.flux.size());

    LightCurve untouched = transitscan::test::make_light_curve(500, 10.0, {}, 0.001);
    CHECK(untouched.remove_outliers(0.0) == 0);
}

TEST_CASE("Flux statistics")
{
    const FluxStats stats = compute_stats({1.0, 1.0, 1.0, 1.0, 0.9, 1.1});
    CHECK(stats.mean == doctest::Approx(1.0));
    CHECK(stats.std_dev == doctest::Approx(std::sqrt(0.02 / 6.0)));
    CHECK(stats.noise_ppm() == doctest::Approx(std::sqrt(0.02 / 6.0) * 1e6));

    CHECK(compute_stats({}).mean == 0.0);
    CHECK(FluxStats{}.noise_ppm() == 0.0);
}
