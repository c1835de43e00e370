#pragma once

/// @file sqlite_store.hpp
/// @brief DiscoveryStore persisted in a SQLite database.

#include "storage/discovery_store.hpp"

#include <filesystem>
#include <memory>
#include <mutex>

struct sqlite3;
struct sqlite3_stmt;

namespace transitscan::storage
{
    /// @brief SQLite-backed store (WAL journal, UNIQUE(name)).
    ///
    /// The constructor opens the database and creates the schema, throwing
    /// StorageError on failure. A unique-name violation on insert is reported
    /// as StorageError.
    class SqliteDiscoveryStore final : public DiscoveryStore
    {
    public:
        explicit SqliteDiscoveryStore(const std::filesystem::path& path);
        ~SqliteDiscoveryStore() override;

        SqliteDiscoveryStore(const SqliteDiscoveryStore&) = delete;
        SqliteDiscoveryStore& operator=(const SqliteDiscoveryStore&) = delete;

        DiscoveredObject insert(const DiscoveredObject& record) override;

        [[nodiscard]] std::vector<DiscoveredObject> query(const RecordFilter& filter) const override;

        [[nodiscard]] bool exists(std::string_view name) const override;

        [[nodiscard]] bool exists(std::string_view host, f64 period_days, f64 rel_tol) const override;

    private:
        struct StatementDeleter
        {
            void operator()(sqlite3_stmt* stmt) const;
        };
        using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

        void initialize_schema();
        void exec(const char* sql);
        [[nodiscard]] Statement prepare(const std::string& sql) const;

        sqlite3*           m_db = nullptr;
        mutable std::mutex m_mutex;
    };

} // namespace transitscan::storage
