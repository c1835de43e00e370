#pragma once

/// @file memory_store.hpp
/// @brief Thread-safe in-process DiscoveryStore.

#include "storage/discovery_store.hpp"

#include <mutex>
#include <unordered_set>

namespace transitscan::storage
{
    class MemoryDiscoveryStore final : public DiscoveryStore
    {
    public:
        DiscoveredObject insert(const DiscoveredObject& record) override;

        [[nodiscard]] std::vector<DiscoveredObject> query(const RecordFilter& filter) const override;

        [[nodiscard]] bool exists(std::string_view name) const override;

        [[nodiscard]] bool exists(std::string_view host, f64 period_days, f64 rel_tol) const override;

        [[nodiscard]] std::size_t size() const;

    private:
        mutable std::mutex              m_mutex;
        std::vector<DiscoveredObject>   m_records;  ///< Insertion order
        std::unordered_set<std::string> m_names;
    };

} // namespace transitscan::storage
