#include "riftcrawl/sqlite_db.hpp"
#include "riftcrawl/logging.hpp"

namespace riftcrawl {

namespace {

bool is_unreachable(int rc) {
    switch (rc & 0xff) {
        case SQLITE_CANTOPEN:
        case SQLITE_NOTADB:
        case SQLITE_CORRUPT:
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_READONLY:
            return true;
        default:
            return false;
    }
}

} // namespace

SqliteDB::SqliteDB(const std::string& path) {
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("cannot open " + path + ": " + msg, true);
    }

    sqlite3_busy_timeout(db_, 5000);
    try {
        // WAL lets the feature builder read while the crawler writes.
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
        exec("PRAGMA foreign_keys=ON;");
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteDB::~SqliteDB() {
    if (db_) sqlite3_close(db_);
}

void SqliteDB::raise(int rc, const std::string& what) const {
    throw StorageError(what + ": " + sqlite3_errmsg(db_), is_unreachable(rc));
}

void SqliteDB::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        throw StorageError(msg, is_unreachable(rc));
    }
}

bool SqliteDB::try_exec(const std::string& sql) noexcept {
    return sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK;
}

Statement::Statement(SqliteDB& db, const char* sql) : db_(db) {
    int rc = sqlite3_prepare_v2(db_.handle(), sql, -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) db_.raise(rc, "sqlite prepare");
}

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement& Statement::bind(int idx, const std::string& v) {
    sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind(int idx, int64_t v) {
    sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
    return *this;
}

Statement& Statement::bind(int idx, std::optional<int> v) {
    if (v) sqlite3_bind_int64(stmt_, idx, *v);
    else sqlite3_bind_null(stmt_, idx);
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    db_.raise(rc, "sqlite step");
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

bool Statement::is_null(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

std::string Statement::col_text(int col) const {
    const unsigned char* t = sqlite3_column_text(stmt_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t Statement::col_int(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

std::optional<int> Statement::col_opt_int(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int(stmt_, col);
}

SqliteTransaction::SqliteTransaction(SqliteDB& db) : db_(db) {
    db_.exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
    if (!committed_ && !db_.try_exec("ROLLBACK;")) {
        RIFTCRAWL_LOG_ERROR("sqlite rollback failed: {}", sqlite3_errmsg(db_.handle()));
    }
}

void SqliteTransaction::commit() {
    db_.exec("COMMIT;");
    committed_ = true;
}

} // namespace riftcrawl
