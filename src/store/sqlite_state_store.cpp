#include "store/sqlite_state_store.hpp"

#include "util/logger.hpp"

#include <filesystem>

namespace fwfleet {

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS firmware_versions (
    device        TEXT NOT NULL,
    component     TEXT NOT NULL,
    version       TEXT NOT NULL,
    release_date  TEXT NOT NULL,
    checksum      TEXT NOT NULL,
    status        TEXT NOT NULL DEFAULT 'current',
    download_url  TEXT DEFAULT '',
    notes         TEXT DEFAULT '',
    created_at    TEXT NOT NULL,
    PRIMARY KEY (device, component)
);
CREATE TABLE IF NOT EXISTS update_log (
    id            INTEGER PRIMARY KEY AUTOINCREMENT,
    device        TEXT NOT NULL,
    component     TEXT NOT NULL,
    from_version  TEXT NOT NULL,
    to_version    TEXT NOT NULL,
    status        TEXT NOT NULL,
    applied_at    TEXT NOT NULL
);
)sql";

constexpr const char* kRecordColumns =
    "device, component, version, release_date, checksum, status, download_url, notes, created_at";

void BindRecord(SqliteStatement& st, const FirmwareRecord& r) {
    st.BindText(1, r.device);
    st.BindText(2, r.component);
    st.BindText(3, r.version);
    st.BindText(4, r.release_date);
    st.BindText(5, r.checksum);
    st.BindText(6, ToString(r.status));
    st.BindText(7, r.download_url);
    st.BindText(8, r.notes);
    st.BindText(9, r.created_at);
}

Result ReadRecord(const SqliteStatement& st, FirmwareRecord& r) {
    r.device = st.ColumnText(0);
    r.component = st.ColumnText(1);
    r.version = st.ColumnText(2);
    r.release_date = st.ColumnText(3);
    r.checksum = st.ColumnText(4);
    const std::string status = st.ColumnText(5);
    if (!ParseFirmwareStatus(status, r.status)) {
        return Result::Fail(Errc::StoreUnavailable,
                            "bad status '" + status + "' for " + r.device + "/" + r.component);
    }
    r.download_url = st.ColumnText(6);
    r.notes = st.ColumnText(7);
    r.created_at = st.ColumnText(8);
    return Result::Ok();
}

} // namespace

SqliteStateStore::SqliteStateStore(std::unique_ptr<SqliteDb> db) : db_(std::move(db)) {}

Result SqliteStateStore::Open(const std::string& path, std::unique_ptr<SqliteStateStore>& out) {
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Result::Fail(Errc::StoreUnavailable, "cannot create " + parent.string() + ": " + ec.message());
        }
    }

    std::unique_ptr<SqliteDb> db;
    if (auto r = SqliteDb::Open(path, db); !r.ok) return r;

    std::unique_ptr<SqliteStateStore> store(new SqliteStateStore(std::move(db)));
    if (auto r = store->Migrate(); !r.ok) return r;

    LogDebug("state store opened: %s", path.c_str());
    out = std::move(store);
    return Result::Ok();
}

Result SqliteStateStore::Migrate() {
    std::lock_guard<std::mutex> lk(mu_);
    auto r = db_->Exec(kSchema);
    if (!r.ok) r.msg = "schema: " + r.msg;
    return r;
}

Result SqliteStateStore::Get(const std::string& device,
                             const std::string& component,
                             std::optional<FirmwareRecord>& out) {
    out.reset();
    std::lock_guard<std::mutex> lk(mu_);

    SqliteStatement st;
    auto r = db_->Prepare(std::string("SELECT ") + kRecordColumns +
                              " FROM firmware_versions WHERE device=? AND component=?;",
                          st);
    if (!r.ok) return r;
    st.BindText(1, device);
    st.BindText(2, component);

    const int rc = st.Step();
    if (rc == SQLITE_DONE) return Result::Ok();
    if (rc != SQLITE_ROW) return db_->Check(rc, "get record");

    FirmwareRecord rec;
    if (r = ReadRecord(st, rec); !r.ok) return r;
    out = std::move(rec);
    return Result::Ok();
}

Result SqliteStateStore::List(const RecordFilter& filter, std::vector<FirmwareRecord>& out) {
    out.clear();
    std::lock_guard<std::mutex> lk(mu_);

    std::string sql = std::string("SELECT ") + kRecordColumns + " FROM firmware_versions WHERE 1=1";
    if (filter.device) sql += " AND device=?";
    if (filter.component) sql += " AND component=?";
    if (filter.status) sql += " AND status=?";
    sql += " ORDER BY device, component;";

    SqliteStatement st;
    auto r = db_->Prepare(sql, st);
    if (!r.ok) return r;

    int idx = 1;
    if (filter.device) st.BindText(idx++, *filter.device);
    if (filter.component) st.BindText(idx++, *filter.component);
    if (filter.status) st.BindText(idx++, ToString(*filter.status));

    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) {
        FirmwareRecord rec;
        if (r = ReadRecord(st, rec); !r.ok) return r;
        out.push_back(std::move(rec));
    }
    return db_->Check(rc, "list records");
}

Result SqliteStateStore::UpsertLocked(const FirmwareRecord& record) {
    SqliteStatement st;
    auto r = db_->Prepare(std::string("INSERT OR REPLACE INTO firmware_versions (") + kRecordColumns +
                              ") VALUES (?,?,?,?,?,?,?,?,?);",
                          st);
    if (!r.ok) return r;
    BindRecord(st, record);
    return db_->Check(st.Step(), "upsert record");
}

Result SqliteStateStore::AppendLogLocked(const UpdateLogEntry& entry, std::int64_t& assigned_id) {
    SqliteStatement st;
    auto r = db_->Prepare(
        "INSERT INTO update_log (device, component, from_version, to_version, status, applied_at) "
        "VALUES (?,?,?,?,?,?);",
        st);
    if (!r.ok) return r;
    st.BindText(1, entry.device);
    st.BindText(2, entry.component);
    st.BindText(3, entry.from_version);
    st.BindText(4, entry.to_version);
    st.BindText(5, ToString(entry.status));
    st.BindText(6, entry.applied_at);

    if (r = db_->Check(st.Step(), "append log"); !r.ok) return r;
    assigned_id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_->Handle()));
    return Result::Ok();
}

Result SqliteStateStore::Upsert(const FirmwareRecord& record) {
    std::lock_guard<std::mutex> lk(mu_);
    return UpsertLocked(record);
}

Result SqliteStateStore::AppendLog(const UpdateLogEntry& entry, std::int64_t& assigned_id) {
    std::lock_guard<std::mutex> lk(mu_);
    return AppendLogLocked(entry, assigned_id);
}

Result SqliteStateStore::RecentLog(std::size_t limit, std::vector<UpdateLogEntry>& out) {
    out.clear();
    std::lock_guard<std::mutex> lk(mu_);

    SqliteStatement st;
    auto r = db_->Prepare(
        "SELECT id, device, component, from_version, to_version, status, applied_at "
        "FROM update_log ORDER BY id DESC LIMIT ?;",
        st);
    if (!r.ok) return r;
    st.BindInt64(1, static_cast<std::int64_t>(limit));

    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) {
        UpdateLogEntry e;
        e.id = st.ColumnInt64(0);
        e.device = st.ColumnText(1);
        e.component = st.ColumnText(2);
        e.from_version = st.ColumnText(3);
        e.to_version = st.ColumnText(4);
        const std::string status = st.ColumnText(5);
        if (!ParseLogStatus(status, e.status)) {
            return Result::Fail(Errc::StoreUnavailable,
                                "bad log status '" + status + "' at id " + std::to_string(e.id));
        }
        e.applied_at = st.ColumnText(6);
        out.push_back(std::move(e));
    }
    return db_->Check(rc, "read log");
}

Result SqliteStateStore::RecordAttempt(const std::optional<FirmwareRecord>& record, const UpdateLogEntry& entry) {
    std::lock_guard<std::mutex> lk(mu_);

    SqliteTransaction tx(*db_);
    auto r = tx.Begin();
    if (!r.ok) return r;

    if (record) {
        if (r = UpsertLocked(*record); !r.ok) return r;
    }
    std::int64_t id = 0;
    if (r = AppendLogLocked(entry, id); !r.ok) return r;

    return tx.Commit();
}

Result SqliteStateStore::InsertIfAbsent(const FirmwareRecord& record, bool& inserted) {
    inserted = false;
    std::lock_guard<std::mutex> lk(mu_);

    SqliteStatement st;
    auto r = db_->Prepare(std::string("INSERT OR IGNORE INTO firmware_versions (") + kRecordColumns +
                              ") VALUES (?,?,?,?,?,?,?,?,?);",
                          st);
    if (!r.ok) return r;
    BindRecord(st, record);
    if (r = db_->Check(st.Step(), "seed record"); !r.ok) return r;

    inserted = sqlite3_changes(db_->Handle()) > 0;
    return Result::Ok();
}

} // namespace fwfleet
