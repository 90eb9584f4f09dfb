#include "storage/clipboard_repository.hpp"

#include <algorithm>

namespace cliped::storage {

namespace {

constexpr const char* kSelectColumns = R"SQL(
    SELECT entry_id, content, content_type, created_at, origin_device,
           file_name, file_size, file_hash, file_path
    FROM clipboard_entries )SQL";

using EntryList = std::vector<ClipboardEntry>;

} // namespace

ClipboardEntry ClipboardRepository::row_to_entry(Statement& stmt) {
    ClipboardEntry entry;
    entry.id = stmt.column_text(0);
    entry.content = stmt.column_text(1);
    entry.content_type = content_type_from_string(stmt.column_text(2)).value_or(ContentType::Text);
    entry.timestamp = Timestamp(stmt.column_int64(3));
    entry.origin_device = Uuid::parse(stmt.column_text(4)).value_or(Uuid{});

    if (!stmt.column_is_null(5)) {
        FileMetadata meta;
        meta.name = stmt.column_text(5);
        meta.size = static_cast<uint64_t>(stmt.column_int64(6));
        meta.hash = stmt.column_text(7);
        meta.local_path = stmt.column_text(8);
        entry.file = std::move(meta);
    }
    return entry;
}

Result<EntryList, Error> ClipboardRepository::collect(Statement& stmt) {
    EntryList entries;
    while (true) {
        auto row = stmt.step();
        if (row.is_err()) {
            return Result<EntryList, Error>::err(row.unwrap_err());
        }
        if (!row.unwrap()) break;
        entries.push_back(row_to_entry(stmt));
    }
    return Result<EntryList, Error>::ok(std::move(entries));
}

Result<void, Error> ClipboardRepository::insert(const ClipboardEntry& entry) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO clipboard_entries
            (entry_id, content, content_type, created_at, origin_device,
             file_name, file_size, file_hash, file_path)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();

    auto bound = stmt.bind_text(1, entry.id)
        .and_then([&] { return stmt.bind_text(2, entry.content); })
        .and_then([&] { return stmt.bind_text(3, content_type_to_string(entry.content_type)); })
        .and_then([&] { return stmt.bind_int64(4, entry.timestamp.millis()); })
        .and_then([&] { return stmt.bind_text(5, entry.origin_device.to_string()); });
    if (bound.is_err()) return bound;

    if (entry.file) {
        bound = stmt.bind_text(6, entry.file->name)
            .and_then([&] { return stmt.bind_int64(7, static_cast<int64_t>(entry.file->size)); })
            .and_then([&] { return stmt.bind_text(8, entry.file->hash); })
            .and_then([&] { return stmt.bind_text(9, entry.file->local_path); });
    } else {
        bound = stmt.bind_null(6)
            .and_then([&] { return stmt.bind_null(7); })
            .and_then([&] { return stmt.bind_null(8); })
            .and_then([&] { return stmt.bind_null(9); });
    }
    if (bound.is_err()) return bound;

    auto done = stmt.step();
    if (done.is_err()) {
        const auto& err = done.unwrap_err();
        if (err.code == Error::kSqliteCodeBase + SQLITE_CONSTRAINT) {
            return Result<void, Error>::err(
                Error{ErrorCode::DuplicateEntry, "entry already in history: " + entry.id});
        }
        return Result<void, Error>::err(err);
    }
    return Result<void, Error>::ok();
}

Result<ClipboardEntry, Error> ClipboardRepository::remove(const std::string& entry_id) {
    auto existing = get(entry_id);
    if (existing.is_err()) {
        return Result<ClipboardEntry, Error>::err(existing.unwrap_err());
    }
    auto found = std::move(existing).unwrap();
    if (!found) {
        return Result<ClipboardEntry, Error>::err(
            Error{ErrorCode::NotFound, "no entry with id " + entry_id});
    }

    auto stmt_result = db_.prepare("DELETE FROM clipboard_entries WHERE entry_id = ?;");
    if (stmt_result.is_err()) {
        return Result<ClipboardEntry, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, entry_id);
    if (bound.is_err()) {
        return Result<ClipboardEntry, Error>::err(bound.unwrap_err());
    }
    auto done = stmt.step();
    if (done.is_err()) {
        return Result<ClipboardEntry, Error>::err(done.unwrap_err());
    }
    return Result<ClipboardEntry, Error>::ok(std::move(*found));
}

Result<EntryList, Error> ClipboardRepository::remove_all() {
    auto all = page(0, -1);
    if (all.is_err()) return all;

    auto cleared = db_.execute("DELETE FROM clipboard_entries;");
    if (cleared.is_err()) {
        return Result<EntryList, Error>::err(cleared.unwrap_err());
    }
    return all;
}

Result<EntryList, Error> ClipboardRepository::evict_beyond(int keep) {
    auto stmt_result = db_.prepare(std::string(kSelectColumns) +
                                   "ORDER BY seq DESC LIMIT -1 OFFSET ?;");
    if (stmt_result.is_err()) {
        return Result<EntryList, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_int64(1, keep < 0 ? 0 : keep);
    if (bound.is_err()) {
        return Result<EntryList, Error>::err(bound.unwrap_err());
    }
    auto doomed = collect(stmt);
    if (doomed.is_err() || doomed.unwrap().empty()) return doomed;

    auto delete_result = db_.prepare(R"SQL(
        DELETE FROM clipboard_entries WHERE seq NOT IN (
            SELECT seq FROM clipboard_entries ORDER BY seq DESC LIMIT ?
        );
    )SQL");
    if (delete_result.is_err()) {
        return Result<EntryList, Error>::err(delete_result.unwrap_err());
    }
    auto del = std::move(delete_result).unwrap();
    bound = del.bind_int64(1, keep < 0 ? 0 : keep);
    if (bound.is_err()) {
        return Result<EntryList, Error>::err(bound.unwrap_err());
    }
    auto done = del.step();
    if (done.is_err()) {
        return Result<EntryList, Error>::err(done.unwrap_err());
    }

    auto evicted = std::move(doomed).unwrap();
    std::reverse(evicted.begin(), evicted.end());
    return Result<EntryList, Error>::ok(std::move(evicted));
}

Result<EntryList, Error> ClipboardRepository::page(int offset, int limit) {
    auto stmt_result = db_.prepare(std::string(kSelectColumns) +
                                   "ORDER BY seq DESC LIMIT ? OFFSET ?;");
    if (stmt_result.is_err()) {
        return Result<EntryList, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_int64(1, limit)
        .and_then([&] { return stmt.bind_int64(2, offset < 0 ? 0 : offset); });
    if (bound.is_err()) {
        return Result<EntryList, Error>::err(bound.unwrap_err());
    }
    return collect(stmt);
}

Result<int, Error> ClipboardRepository::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM clipboard_entries;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto row = stmt.step();
    if (row.is_err()) {
        return Result<int, Error>::err(row.unwrap_err());
    }
    return Result<int, Error>::ok(static_cast<int>(stmt.column_int64(0)));
}

Result<std::optional<ClipboardEntry>, Error> ClipboardRepository::get(const std::string& entry_id) {
    using Found = std::optional<ClipboardEntry>;

    auto stmt_result = db_.prepare(std::string(kSelectColumns) + "WHERE entry_id = ?;");
    if (stmt_result.is_err()) {
        return Result<Found, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, entry_id);
    if (bound.is_err()) {
        return Result<Found, Error>::err(bound.unwrap_err());
    }
    auto row = stmt.step();
    if (row.is_err()) {
        return Result<Found, Error>::err(row.unwrap_err());
    }
    if (!row.unwrap()) {
        return Result<Found, Error>::ok(std::nullopt);
    }
    return Result<Found, Error>::ok(row_to_entry(stmt));
}

} // namespace cliped::storage
