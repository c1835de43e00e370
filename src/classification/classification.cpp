/// @file classification.cpp
/// @brief Label name conversions.

#include "classification/classification.hpp"

#include "core/text.hpp"

namespace transitscan::classification
{

std::string_view label_name(Label label)
{
    switch (label)
    {
        case Label::Confirmed:     return "Confirmed Planet";
        case Label::Candidate:     return "Candidate Planet";
        case Label::FalsePositive: return "False Positive";
    }
    return "False Positive";
}

std::optional<Label> parse_label(std::string_view text)
{
    const std::string lower = core::text::to_lower(core::text::trim(text));

    if (lower == "confirmed planet" || lower == "confirmed")
    {
        return Label::Confirmed;
    }
    if (lower == "candidate planet" || lower == "candidate")
    {
        return Label::Candidate;
    }
    if (lower == "false positive" || lower == "false_positive" || lower == "falsepositive")
    {
        return Label::FalsePositive;
    }
    return std::nullopt;
}

std::string_view verdict_source_name(VerdictSource source)
{
    return source == VerdictSource::Service ? "service" : "fallback";
}

} // namespace transitscan::classification
