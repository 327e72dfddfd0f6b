#pragma once

#include "util/result.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace fwfleet {

// Owns one prepared statement; finalized on destruction.
class SqliteStatement {
public:
    SqliteStatement() = default;
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;
    SqliteStatement(SqliteStatement&& other) noexcept;
    SqliteStatement& operator=(SqliteStatement&& other) noexcept;

    sqlite3_stmt* Get() const { return stmt_; }
    void Reset(sqlite3_stmt* stmt = nullptr);

    void BindText(int idx, const std::string& s);
    void BindInt64(int idx, std::int64_t v);

    // SQLITE_ROW, SQLITE_DONE or an error code.
    int Step();

    std::string ColumnText(int col) const;
    std::int64_t ColumnInt64(int col) const;

private:
    sqlite3_stmt* stmt_ = nullptr;
};

// Thin RAII wrapper around sqlite3*.
class SqliteDb {
public:
    ~SqliteDb();

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    // Opens (creating when missing) and applies the connection pragmas.
    static Result Open(const std::string& path, std::unique_ptr<SqliteDb>& out);

    sqlite3* Handle() const { return db_; }
    const std::string& Path() const { return path_; }

    // Execute a SQL string (pragmas, schema, transaction control).
    Result Exec(const std::string& sql);
    Result Prepare(const std::string& sql, SqliteStatement& out);

    // StoreUnavailable carrying sqlite's message, Ok for OK/ROW/DONE.
    Result Check(int rc, const char* what) const;

private:
    SqliteDb(sqlite3* db, std::string path);

    Result Configure();

    sqlite3* db_ = nullptr;
    std::string path_;
};

// BEGIN IMMEDIATE on Begin(): takes the write lock up front so two writers
// never deadlock upgrading from a read lock. Rolls back unless committed.
class SqliteTransaction {
public:
    explicit SqliteTransaction(SqliteDb& db) : db_(db) {}
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    Result Begin();
    Result Commit();

private:
    SqliteDb& db_;
    bool active_ = false;
};

} // namespace fwfleet
