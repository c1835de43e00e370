/// @file test_console_report.cpp
/// @brief Unit tests for transitscan::report::ConsoleReport.

#include <doctest/doctest.h>

#include "report/console_report.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace transitscan;
using namespace transitscan::report;

TEST_CASE("Analysis rendering names the host and each signal")
{
    discovery::AnalysisReport report;
    report.host_name      = "TIC 50365310";
    report.time_column    = "time";
    report.flux_column    = "flux";
    report.total_detected = 1;
    report.message        = "Detected 1 transit signal, stored 0";

    discovery::SignalReport s;
    s.name                         = "TIC-50365310 b";
    s.features.orbital_period_days = 3.49;
    s.classification.label         = classification::Label::Candidate;
    s.classification.probability   = 0.57;
    s.classification.overridden    = true;
    s.duplicate                    = true;
    s.plot_points                  = {Vec2d(0.1, 1.0), Vec2d(0.5, 0.995), Vec2d(0.9, 1.0)};
    report.signals.push_back(s);

    std::ostringstream out;
    ConsoleReport{}.render(out, report);
    const std::string text = out.str();

    CHECK(text.find("TIC 50365310") != std::string::npos);
    CHECK(text.find("TIC-50365310 b") != std::string::npos);
    CHECK(text.find("Candidate Planet") != std::string::npos);
    CHECK(text.find("(override)") != std::string::npos);
    CHECK(text.find("duplicate") != std::string::npos);
    CHECK(text.find("Phase fold at 3.4900 d") != std::string::npos);
}

TEST_CASE("Empty phase plot prints nothing")
{
    std::ostringstream out;
    ConsoleReport{}.renderPhasePlot(out, {});
    CHECK(out.str().empty());
}

TEST_CASE("Record table")
{
    std::vector<storage::DiscoveredObject> records(1);
    records[0].name        = "TIC-100 b";
    records[0].host        = "TIC 100";
    records[0].period_days = 7.9;
    records[0].label       = classification::Label::Confirmed;
    records[0].probability = 0.93;

    std::ostringstream out;
    ConsoleReport{}.renderRecords(out, records);
    CHECK(out.str().find("7.9000") != std::string::npos);
    CHECK(out.str().find("Confirmed Planet") != std::string::npos);

    std::ostringstream empty;
    ConsoleReport{}.renderRecords(empty, {});
    CHECK(empty.str().find("(no discoveries stored)") != std::string::npos);
}
