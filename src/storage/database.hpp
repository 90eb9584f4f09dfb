#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace cliped::storage {

/**
 * Build an Error from a SQLite result code. The code is offset by
 * Error::kSqliteCodeBase so it reads back as ErrorCode::Storage.
 */
[[nodiscard]] inline Error sqlite_error(std::string message, int rc) {
    return Error{std::move(message), Error::kSqliteCodeBase + rc};
}

/**
 * Statement - Prepared statement, finalized when the last copy goes away.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_int64(int index, int64_t value);
    Result<void, Error> bind_null(int index);

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    // true while there is a row to read
    Result<bool, Error> step();

private:
    Result<void, Error> check_bind(int rc, const char* what);

    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - Owning SQLite connection.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * Open (creating if needed) a database file. An empty path or
     * ":memory:" opens a private in-memory database.
     */
    [[nodiscard]] static Result<Database, Error> open(const std::string& path);
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    void close();

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Run `f` inside BEGIN/COMMIT. Rolls back when `f` returns an error.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = execute("BEGIN IMMEDIATE;");
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();
        if (result.is_err()) {
            // Report the statement failure, not the rollback.
            (void)execute("ROLLBACK;");
            return result;
        }

        auto commit_result = execute("COMMIT;");
        if (commit_result.is_err()) {
            (void)execute("ROLLBACK;");
            return ResultType::err(commit_result.unwrap_err());
        }
        return result;
    }

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    sqlite3* db_ = nullptr;
};

} // namespace cliped::storage
