#pragma once
// report/console_report.hpp - Terminal rendering of analysis results
//
// Boxed readout panels and an ASCII phase-fold plot, for any POSIX terminal.

#include "discovery/discovery_engine.hpp"
#include "storage/discovery_store.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace transitscan::report {

// -----------------------------------------------------------------------
// ConsoleReport
// -----------------------------------------------------------------------
class ConsoleReport {
public:
    /// Width of the panels (characters)
    int viewport_w{80};
    /// Height of the phase plot area (rows)
    int plot_h{16};

    /// Print the whole analysis: summary panel, then one block per signal.
    void render(std::ostream& out, const discovery::AnalysisReport& report) const;

    /// Print the request-level summary panel.
    void renderSummary(std::ostream& out, const discovery::AnalysisReport& report) const;

    /// Print one signal readout followed by its phase plot.
    void renderSignal(std::ostream& out, const discovery::SignalReport& signal) const;

    /// Plot (phase, flux) points; denser cells get heavier glyphs.
    void renderPhasePlot(std::ostream& out, const std::vector<Vec2d>& points,
                         const std::string& title = "") const;

    /// Print stored discoveries as a table.
    void renderRecords(std::ostream& out,
                       const std::vector<storage::DiscoveredObject>& records) const;

private:
    /// Map a cell count to a glyph character.
    static char densityGlyph(std::size_t count);

    /// Draw a horizontal separator line.
    static void hline(std::ostream& out, int w, char c = '-');

    void row(std::ostream& out, const std::string& lbl, const std::string& val) const;
};

} // namespace transitscan::report
