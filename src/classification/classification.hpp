#pragma once

/// @file classification.hpp
/// @brief Classification labels and per-signal verdicts.

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace transitscan::classification
{
    enum class Label : u8
    {
        Confirmed,
        Candidate,
        FalsePositive,
    };

    /// @brief Where a verdict came from.
    enum class VerdictSource : u8
    {
        Service,  ///< External classification service
        Fallback, ///< Deterministic rule table
    };

    /// @brief Label and confidence reported by a classification service.
    struct ServiceVerdict
    {
        Label label      = Label::FalsePositive;
        f64   confidence = 0.0;
    };

    /// @brief Final verdict for one detected signal.
    struct ClassificationResult
    {
        Label         label       = Label::FalsePositive;
        f64           probability = 0.0;  ///< In [0, 1]
        std::string   reasoning;
        VerdictSource source      = VerdictSource::Fallback;
        bool          overridden  = false; ///< Upgraded from FalsePositive on raw SNR
    };

    /// @brief Display name ("Confirmed Planet", "Candidate Planet", "False Positive").
    [[nodiscard]] std::string_view label_name(Label label);

    /// @brief Parse a display name or a short form ("confirmed", "candidate",
    /// "false_positive"), case-insensitive.
    [[nodiscard]] std::optional<Label> parse_label(std::string_view text);

    [[nodiscard]] std::string_view verdict_source_name(VerdictSource source);

} // namespace transitscan::classification
