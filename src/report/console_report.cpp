// report/console_report.cpp
#include "report/console_report.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace transitscan::report {

namespace {

std::string fmtd(double v, int prec = 2) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(prec) << v;
    return ss.str();
}

std::string fmtOpt(const std::optional<double>& v, int prec, const std::string& unit = "") {
    return v ? fmtd(*v, prec) + unit : "-";
}

} // namespace

// -----------------------------------------------------------------------
// Glyph table (index 0 = emptiest)
// -----------------------------------------------------------------------
char ConsoleReport::densityGlyph(std::size_t count) {
    if (count == 0) return ' ';
    if (count < 2)  return '.';
    if (count < 5)  return '+';
    if (count < 15) return '*';
    if (count < 40) return 'o';
    return '@';
}

void ConsoleReport::hline(std::ostream& out, int w, char c) {
    out << '+';
    for (int i = 0; i < w - 2; ++i) out << c;
    out << '+' << '\n';
}

void ConsoleReport::row(std::ostream& out, const std::string& lbl, const std::string& val) const {
    out << "| " << std::left << std::setw(22) << lbl
        << " : " << std::left << std::setw(viewport_w - 29) << val
        << "|\n";
}

// -----------------------------------------------------------------------
// render
// -----------------------------------------------------------------------
void ConsoleReport::render(std::ostream& out, const discovery::AnalysisReport& report) const {
    renderSummary(out, report);
    for (const auto& s : report.signals) {
        out << '\n';
        renderSignal(out, s);
    }
}

// -----------------------------------------------------------------------
// renderSummary
// -----------------------------------------------------------------------
void ConsoleReport::renderSummary(std::ostream& out, const discovery::AnalysisReport& report) const {
    hline(out, viewport_w, '=');
    out << "| TRANSIT SEARCH SUMMARY"
        << std::setw(viewport_w - 25) << "" << "|\n";
    hline(out, viewport_w, '-');

    row(out, "Host", report.host_name);
    if (report.host_info) {
        const auto& h = *report.host_info;
        row(out, "Host name",   h.name.empty() ? "(unnamed)" : h.name);
        row(out, "RA / Dec",    fmtOpt(h.ra_deg, 4) + " / " + fmtOpt(h.dec_deg, 4) + " deg");
        row(out, "Tmag",        fmtOpt(h.magnitude, 2));
        row(out, "Radius",      fmtOpt(h.radius, 2, " R_sun"));
        row(out, "Teff",        fmtOpt(h.temperature, 0, " K"));
    }
    row(out, "Time column", report.time_column);
    row(out, "Flux column", report.flux_column);
    row(out, "Samples",     std::to_string(report.samples_used) + " ("
                            + std::to_string(report.outliers_removed) + " outliers removed)");
    hline(out, viewport_w, '-');
    row(out, "Signals detected", std::to_string(report.total_detected));
    row(out, "Signals stored",   std::to_string(report.stored_count));
    row(out, "Result",           report.message);
    hline(out, viewport_w, '=');
}

// -----------------------------------------------------------------------
// renderSignal
// -----------------------------------------------------------------------
void ConsoleReport::renderSignal(std::ostream& out, const discovery::SignalReport& signal) const {
    const auto& f = signal.features;

    hline(out, viewport_w, '=');
    out << "| " << std::left << std::setw(viewport_w - 4) << signal.name << " |\n";
    hline(out, viewport_w, '-');
    row(out, "Period",       fmtd(f.orbital_period_days, 4) + " d");
    row(out, "Depth",        fmtd(f.transit_depth_ppm, 0) + " ppm");
    row(out, "SNR",          fmtd(f.snr, 2));
    row(out, "Duration",     fmtd(f.transit_duration_hours, 2) + " h");
    row(out, "Radius",       fmtd(f.planetary_radius_earth, 2) + " R_earth");
    row(out, "Type",         std::string(analysis::planet_type_name(signal.planet_type)));
    row(out, "Epoch",        fmtd(signal.detection.epoch, 4));
    hline(out, viewport_w, '-');
    row(out, "Classification", std::string(classification::label_name(signal.classification.label)));
    row(out, "Probability",  fmtd(signal.classification.probability, 2)
                             + (signal.classification.overridden ? " (override)" : ""));
    row(out, "Source",       std::string(classification::verdict_source_name(signal.classification.source)));
    std::string storage = signal.stored ? "stored"
                        : signal.duplicate ? "duplicate"
                        : !signal.storage_error.empty() ? "failed: " + signal.storage_error
                        : signal.eligible ? "not stored" : "below threshold";
    row(out, "Storage",      storage);
    hline(out, viewport_w, '=');

    renderPhasePlot(out, signal.plot_points, "Phase fold at " + fmtd(f.orbital_period_days, 4) + " d");
}

// -----------------------------------------------------------------------
// renderPhasePlot
// -----------------------------------------------------------------------
void ConsoleReport::renderPhasePlot(std::ostream& out, const std::vector<Vec2d>& points,
                                    const std::string& title) const {
    const int w = viewport_w - 2;
    const int h = plot_h;
    if (points.empty() || w <= 0 || h <= 0) return;

    auto [lo_it, hi_it] = std::minmax_element(points.begin(), points.end(),
        [](const Vec2d& a, const Vec2d& b) { return a.y < b.y; });
    double lo = lo_it->y;
    double hi = hi_it->y;
    if (hi - lo < 1e-12) { lo -= 0.5e-3; hi += 0.5e-3; }

    // Cell counts, row 0 = highest flux
    std::vector<std::vector<std::size_t>> grid(
        static_cast<std::size_t>(h), std::vector<std::size_t>(static_cast<std::size_t>(w), 0));
    for (const auto& p : points) {
        int px = static_cast<int>(p.x * w);
        int py = static_cast<int>((hi - p.y) / (hi - lo) * (h - 1) + 0.5);
        px = std::clamp(px, 0, w - 1);
        py = std::clamp(py, 0, h - 1);
        ++grid[static_cast<std::size_t>(py)][static_cast<std::size_t>(px)];
    }

    hline(out, viewport_w, '=');
    if (!title.empty()) {
        out << "| " << std::left << std::setw(viewport_w - 4)
            << title + "  [" + fmtd(lo, 5) + " .. " + fmtd(hi, 5) + "]" << " |" << '\n';
        hline(out, viewport_w, '-');
    }
    for (int r = 0; r < h; ++r) {
        out << '|';
        for (int c = 0; c < w; ++c) {
            out << densityGlyph(grid[static_cast<std::size_t>(r)][static_cast<std::size_t>(c)]);
        }
        out << '|' << '\n';
    }
    hline(out, viewport_w, '=');
}

// -----------------------------------------------------------------------
// renderRecords
// -----------------------------------------------------------------------
void ConsoleReport::renderRecords(std::ostream& out,
                                  const std::vector<storage::DiscoveredObject>& records) const {
    hline(out, viewport_w, '=');
    out << "| " << std::left << std::setw(24) << "Name"
        << std::setw(16) << "Host"
        << std::setw(11) << "Period d"
        << std::setw(18) << "Label"
        << std::setw(viewport_w - 73) << "P" << " |\n";
    hline(out, viewport_w, '-');
    for (const auto& r : records) {
        out << "| " << std::left << std::setw(24) << r.name.substr(0, 23)
            << std::setw(16) << r.host.substr(0, 15)
            << std::setw(11) << fmtd(r.period_days, 4)
            << std::setw(18) << std::string(classification::label_name(r.label))
            << std::setw(viewport_w - 73) << fmtd(r.probability, 2) << " |\n";
    }
    if (records.empty()) {
        out << "| " << std::left << std::setw(viewport_w - 4) << "(no discoveries stored)" << " |\n";
    }
    hline(out, viewport_w, '=');
}

} // namespace transitscan::report
