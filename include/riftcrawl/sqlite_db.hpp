#pragma once

#include "riftcrawl/errors.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <optional>
#include <string>

namespace riftcrawl {

// Thin RAII wrapper around one sqlite3 connection.
class SqliteDB {
public:
    explicit SqliteDB(const std::string& path);
    ~SqliteDB();

    SqliteDB(const SqliteDB&) = delete;
    SqliteDB& operator=(const SqliteDB&) = delete;

    sqlite3* handle() const { return db_; }

    // Throws StorageError on failure.
    void exec(const std::string& sql);

    // Non-throwing variant for destructors; returns false on failure.
    bool try_exec(const std::string& sql) noexcept;

    int64_t changes() const { return sqlite3_changes64(db_); }

    [[noreturn]] void raise(int rc, const std::string& what) const;

private:
    sqlite3* db_ = nullptr;
};

// Prepared statement with 1-based binds and 0-based columns.
class Statement {
public:
    Statement(SqliteDB& db, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int idx, const std::string& v);
    Statement& bind(int idx, int64_t v);
    Statement& bind(int idx, std::optional<int> v);

    // true while a row is available; throws StorageError on failure.
    bool step();
    void reset();

    bool is_null(int col) const;
    std::string col_text(int col) const;
    int64_t col_int(int col) const;
    std::optional<int> col_opt_int(int col) const;

private:
    SqliteDB& db_;
    sqlite3_stmt* stmt_ = nullptr;
};

/*
  BEGIN IMMEDIATE transaction: takes the write lock up front so that
  read-then-update sequences (frontier claims) cannot interleave with
  another connection's writes. Rolls back unless committed.
*/
class SqliteTransaction {
public:
    explicit SqliteTransaction(SqliteDB& db);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit();

private:
    SqliteDB& db_;
    bool committed_ = false;
};

} // namespace riftcrawl
