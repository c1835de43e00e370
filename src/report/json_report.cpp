/// @file json_report.cpp
/// @brief JSON report builders.

#include "report/json_report.hpp"

namespace transitscan::report
{

using json = nlohmann::json;

namespace
{

json optional_number(const std::optional<f64>& value)
{
    return value ? json(*value) : json(nullptr);
}

} // anonymous namespace

json to_json(const discovery::SignalReport& signal)
{
    const auto& f = signal.features;

    json plot = json::array();
    for (const Vec2d& p : signal.plot_points)
    {
        plot.push_back({{"x", p.x}, {"y", p.y}});
    }

    json entry = {
        {"orbital_period",   f.orbital_period_days},
        {"transit_duration", f.transit_duration_hours},
        {"planetary_radius", f.planetary_radius_earth},
        {"transit_depth",    f.transit_depth_ppm},
        {"snr",              f.snr},
        {"odd_even_diff",    f.odd_even_depth_diff},
        {"data_points",      f.sample_count},
        {"mean_flux",        f.mean_flux},
        {"std_flux",         f.flux_std_dev},
        {"transit_time",     signal.detection.epoch},
        {"classification",   std::string(classification::label_name(signal.classification.label))},
        {"probability",      signal.classification.probability},
        {"reasoning",        signal.classification.reasoning},
        {"plotData",         std::move(plot)},
        {"stored",           signal.stored},
        {"planetName",       signal.name},
        {"planetType",       std::string(analysis::planet_type_name(signal.planet_type))},
    };
    if (!signal.storage_error.empty())
    {
        entry["storageError"] = signal.storage_error;
    }
    return entry;
}

json to_json(const catalog::HostMetadata& host)
{
    return {
        {"tic",         host.identifier},
        {"name",        host.name},
        {"ra",          optional_number(host.ra_deg)},
        {"dec",         optional_number(host.dec_deg)},
        {"magnitude",   optional_number(host.magnitude)},
        {"radius",      optional_number(host.radius)},
        {"mass",        optional_number(host.mass)},
        {"temperature", optional_number(host.temperature)},
    };
}

json to_json(const discovery::AnalysisReport& report)
{
    json planets = json::array();
    for (const auto& s : report.signals)
    {
        planets.push_back(to_json(s));
    }

    return {
        {"planets",       std::move(planets)},
        {"totalDetected", report.total_detected},
        {"storedCount",   report.stored_count},
        {"hostStar",      report.host_name},
        {"hostStarInfo",  report.host_info ? to_json(*report.host_info) : json(nullptr)},
        {"timeColumn",    report.time_column},
        {"fluxColumn",    report.flux_column},
        {"message",       report.message},
    };
}

json to_json(const std::vector<storage::DiscoveredObject>& records)
{
    json out = json::array();
    for (const auto& r : records)
    {
        out.push_back({
            {"planet_name",    r.name},
            {"host_star",      r.host},
            {"period",         r.period_days},
            {"radius",         r.radius_earth},
            {"depth",          r.depth_ppm},
            {"classification", std::string(classification::label_name(r.label))},
            {"probability",    r.probability},
            {"discovered_at",  r.discovered_at},
            {"dataset",        r.dataset},
        });
    }
    return out;
}

} // namespace transitscan::report
