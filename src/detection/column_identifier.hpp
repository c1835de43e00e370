#pragma once

/// @file column_identifier.hpp
/// @brief Infers the time and flux columns of an uploaded table.

#include "detection/light_curve.hpp"
#include "io/table.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace transitscan::detection
{
    /// @brief Where the time axis comes from.
    enum class TimeSource : u8
    {
        TimeColumn,    ///< A time-like column (by name or monotonic values)
        CadenceColumn, ///< A cadence/frame counter scaled by the Kepler long cadence
    };

    /// @brief The identified axes of a light-curve table.
    struct ColumnSelection
    {
        std::string time_column;
        std::string flux_column;
        TimeSource  time_source = TimeSource::TimeColumn;
    };

    /// @brief Static utility class that picks the time and flux columns.
    ///
    /// Time: the first column whose name contains a time keyword (time, bjd,
    /// jd, mjd, hjd, date, epoch) and holds at least one number; then a
    /// cadence/frame counter; then the first column whose leading 100 numeric
    /// values increase in more than 90% of consecutive pairs.
    ///
    /// Flux: columns naming errors, quality flags, backgrounds, centroids or
    /// catalog metadata are excluded. PDCSAP_FLUX beats SAP_FLUX beats any
    /// other flux-like name. Without a name match the non-monotonic column with
    /// the largest coefficient of variation (at most kMaxCoefficientOfVariation,
    /// at least two distinct values) wins.
    class ColumnIdentifier
    {
    public:
        ColumnIdentifier() = delete;

        /// Values inspected by the monotonic-time test.
        static constexpr std::size_t kMonotonicProbe = 100;
        /// Fraction of increasing consecutive pairs required for a time axis.
        static constexpr f64 kMonotonicFraction = 0.9;
        /// Upper bound on std/|mean| for the statistical flux fallback.
        static constexpr f64 kMaxCoefficientOfVariation = 0.5;

        /// @brief Identify both axes.
        /// @return The selection, or std::nullopt when either axis is ambiguous.
        [[nodiscard]] static std::optional<ColumnSelection> identify(const io::Table& table);

        /// @brief Time axis only. @return Selection with the time fields set, or std::nullopt.
        [[nodiscard]] static std::optional<ColumnSelection> identify_time(const io::Table& table);

        /// @brief Flux axis only, never returning @p exclude.
        [[nodiscard]] static std::optional<std::string> identify_flux(const io::Table& table,
                                                                      std::string_view exclude);

        /// @brief Extract the cleaned light curve for a selection (cadence scaled to days).
        [[nodiscard]] static LightCurve extract(const io::Table& table, const ColumnSelection& selection);

        /// @brief True if more than 90% of consecutive pairs in the first 100 values increase.
        [[nodiscard]] static bool is_mostly_increasing(const std::vector<f64>& values);

    private:
        [[nodiscard]] static bool is_excluded_from_flux(std::string_view lower_name);
        [[nodiscard]] static bool is_time_name(std::string_view lower_name);
        [[nodiscard]] static bool is_cadence_name(std::string_view lower_name);
        [[nodiscard]] static bool is_flux_name(std::string_view lower_name);
    };

    [[nodiscard]] const char* time_source_name(TimeSource source);

} // namespace transitscan::detection
