#pragma once

/// @file discovery_store.hpp
/// @brief Discovered-object records and the record store interface.

#include "classification/classification.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace transitscan::storage
{
    /// @brief Persisted record of one accepted signal. Never mutated after insert.
    struct DiscoveredObject
    {
        std::string           name;          ///< Unique within a store
        std::string           host;          ///< Host identifier, "Unknown" if none
        f64                   period_days  = 0.0;
        f64                   radius_earth = 0.0;
        f64                   depth_ppm    = 0.0;
        classification::Label label        = classification::Label::Candidate;
        f64                   probability  = 0.0;
        std::string           discovered_at; ///< ISO-8601 UTC
        std::string           dataset;       ///< Source dataset tag
    };

    /// @brief Query criteria; unset fields match everything.
    struct RecordFilter
    {
        std::optional<std::string>           host;
        std::optional<classification::Label> label;
        std::size_t                          limit = 0; ///< 0 = no limit
    };

    /// @brief Relative period difference |a - b| / b (b = stored period).
    [[nodiscard]] f64 relative_period_difference(f64 candidate, f64 stored);

    /// @brief True if the relative difference is strictly below @p rel_tol.
    ///
    /// Differences within 1e-9 of the tolerance count as reaching it, so a
    /// period exactly 1% away (10.1 against 10.0) is not a match even though
    /// the binary difference rounds just under 0.01.
    [[nodiscard]] bool periods_match(f64 candidate, f64 stored, f64 rel_tol);

    /// @brief Append-only store of discovered objects.
    ///
    /// insert() throws StorageError on a duplicate name or backend failure.
    /// Query results are newest first.
    class DiscoveryStore
    {
    public:
        virtual ~DiscoveryStore() = default;

        /// @return The stored record.
        virtual DiscoveredObject insert(const DiscoveredObject& record) = 0;

        [[nodiscard]] virtual std::vector<DiscoveredObject> query(const RecordFilter& filter) const = 0;

        [[nodiscard]] virtual bool exists(std::string_view name) const = 0;

        /// @brief True if a record of @p host has a period within @p rel_tol of @p period_days.
        [[nodiscard]] virtual bool exists(std::string_view host, f64 period_days, f64 rel_tol) const = 0;

        [[nodiscard]] std::vector<DiscoveredObject> all() const { return query(RecordFilter{}); }
    };

} // namespace transitscan::storage
