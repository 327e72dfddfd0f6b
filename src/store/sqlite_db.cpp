#include "store/sqlite_db.hpp"

#include "util/logger.hpp"

#include <utility>

namespace fwfleet {

SqliteStatement::~SqliteStatement() { Reset(); }

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept : stmt_(std::exchange(other.stmt_, nullptr)) {}

SqliteStatement& SqliteStatement::operator=(SqliteStatement&& other) noexcept {
    if (this != &other) Reset(std::exchange(other.stmt_, nullptr));
    return *this;
}

void SqliteStatement::Reset(sqlite3_stmt* stmt) {
    if (stmt_) sqlite3_finalize(stmt_);
    stmt_ = stmt;
}

void SqliteStatement::BindText(int idx, const std::string& s) {
    sqlite3_bind_text(stmt_, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void SqliteStatement::BindInt64(int idx, std::int64_t v) {
    sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
}

int SqliteStatement::Step() { return sqlite3_step(stmt_); }

std::string SqliteStatement::ColumnText(int col) const {
    const unsigned char* t = sqlite3_column_text(stmt_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::int64_t SqliteStatement::ColumnInt64(int col) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col));
}

SqliteDb::SqliteDb(sqlite3* db, std::string path) : db_(db), path_(std::move(path)) {}

SqliteDb::~SqliteDb() {
    if (db_) sqlite3_close(db_);
}

Result SqliteDb::Open(const std::string& path, std::unique_ptr<SqliteDb>& out) {
    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(),
                                   &db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db) sqlite3_close(db);
        return Result::Fail(Errc::StoreUnavailable, "open " + path + ": " + msg);
    }

    std::unique_ptr<SqliteDb> handle(new SqliteDb(db, path));
    if (auto r = handle->Configure(); !r.ok) return r;

    out = std::move(handle);
    return Result::Ok();
}

Result SqliteDb::Exec(const std::string& sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        return Result::Fail(Errc::StoreUnavailable, msg);
    }
    return Result::Ok();
}

Result SqliteDb::Prepare(const std::string& sql, SqliteStatement& out) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Check(rc, "prepare");
    }
    out.Reset(stmt);
    return Result::Ok();
}

Result SqliteDb::Check(int rc, const char* what) const {
    if (rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE) return Result::Ok();
    return Result::Fail(Errc::StoreUnavailable, std::string(what) + ": " + sqlite3_errmsg(db_));
}

Result SqliteDb::Configure() {
    // WAL lets readers proceed while the writer holds its lock.
    if (auto r = Exec("PRAGMA journal_mode=WAL;"); !r.ok) return r;
    if (auto r = Exec("PRAGMA synchronous=NORMAL;"); !r.ok) return r;
    // wait for locks instead of failing immediately
    if (auto r = Check(sqlite3_busy_timeout(db_, 5000), "busy_timeout"); !r.ok) return r;
    return Exec("PRAGMA temp_store=MEMORY;");
}

SqliteTransaction::~SqliteTransaction() {
    if (!active_) return;
    if (auto r = db_.Exec("ROLLBACK;"); !r.ok) {
        LogError("rollback failed on %s: %s", db_.Path().c_str(), r.msg.c_str());
    }
}

Result SqliteTransaction::Begin() {
    auto r = db_.Exec("BEGIN IMMEDIATE;");
    active_ = r.ok;
    return r;
}

Result SqliteTransaction::Commit() {
    auto r = db_.Exec("COMMIT;");
    if (r.ok) active_ = false;
    return r;
}

} // namespace fwfleet
