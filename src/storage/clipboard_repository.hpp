#pragma once

#include "storage/database.hpp"
#include "core/clipboard_entry.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cliped::storage {

/**
 * ClipboardRepository - Data access layer for clipboard history.
 *
 * Rows are ordered by an autoincrement sequence, so "most recent first" is
 * an index scan and random offsets never re-sort. Not thread-safe; the
 * store serializes access.
 */
class ClipboardRepository {
public:
    explicit ClipboardRepository(Database& db) : db_(db) {}

    /**
     * Insert at the head. Fails with DuplicateEntry when the id exists.
     */
    [[nodiscard]] Result<void, Error> insert(const ClipboardEntry& entry);

    /**
     * Delete one entry. Returns the removed row, or NotFound.
     */
    [[nodiscard]] Result<ClipboardEntry, Error> remove(const std::string& entry_id);

    /**
     * Delete every entry, returning them most recent first.
     */
    [[nodiscard]] Result<std::vector<ClipboardEntry>, Error> remove_all();

    /**
     * Delete the oldest rows until at most `keep` remain.
     * Returns what was deleted, oldest first.
     */
    [[nodiscard]] Result<std::vector<ClipboardEntry>, Error> evict_beyond(int keep);

    [[nodiscard]] Result<std::vector<ClipboardEntry>, Error> page(int offset, int limit);
    [[nodiscard]] Result<int, Error> count();
    [[nodiscard]] Result<std::optional<ClipboardEntry>, Error> get(const std::string& entry_id);

private:
    Database& db_;

    [[nodiscard]] static ClipboardEntry row_to_entry(Statement& stmt);
    [[nodiscard]] static Result<std::vector<ClipboardEntry>, Error> collect(Statement& stmt);
};

} // namespace cliped::storage
