#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace cliped::storage {

struct Migration {
    int version;
    std::string name;
    std::string up_sql;
};

/**
 * Schema history. Append only; never edit a migration that has shipped.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "clipboard_entries",
        .up_sql = R"SQL(
            -- seq is the insertion order; history pages read it descending.
            CREATE TABLE IF NOT EXISTS clipboard_entries (
                seq INTEGER PRIMARY KEY AUTOINCREMENT,
                entry_id TEXT NOT NULL UNIQUE,
                content TEXT NOT NULL,
                content_type TEXT NOT NULL,
                created_at INTEGER NOT NULL,
                origin_device TEXT NOT NULL,
                file_name TEXT,
                file_size INTEGER,
                file_hash TEXT,
                file_path TEXT
            );
        )SQL"
    },
    {
        .version = 2,
        .name = "clipboard_entries_origin_index",
        .up_sql = R"SQL(
            CREATE INDEX IF NOT EXISTS idx_clipboard_entries_origin
                ON clipboard_entries(origin_device);
        )SQL"
    },
};

/**
 * MigrationRunner - Brings a database up to the latest schema version.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> migrate();
    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
};

[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace cliped::storage
