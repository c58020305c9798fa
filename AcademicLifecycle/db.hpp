#pragma once
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "sqlite3.h"
#include "models.hpp"
#include "status.hpp"

/*
-------------------------------------------------------------------------------
 db.hpp — Public interface to the SQLite persistence layer
-------------------------------------------------------------------------------

This header declares the low-level pieces every engine module builds on:
opening connections, creating the schema, the connection pool, the RAII
transaction guard and a few statement helpers. Modules never call
sqlite3_open or BEGIN/COMMIT themselves.

Design:
  - Functions return `bool` (plain helpers) or `EngineStatus` (anything that
    can fail in a caller-visible way). SQLite error text is logged here and
    never handed back to callers.
  - Every connection enables foreign keys and a busy timeout.
  - Write paths run inside a Transaction; it rolls back on destruction unless
    commit() succeeded.

Usage convention:
  - Build one ConnectionPool per database file at startup.
  - Call `db_init_schema` once (and `db_seed_reference_data` for a fresh
    install), then hand the pool to the engine.
-------------------------------------------------------------------------------
*/

/// Opens (creates if not exists) the SQLite DB file at path, enables FK
/// constraints and sets the busy timeout. On failure `db` is nullptr.
bool db_open(sqlite3*& db, const std::string& path, int busy_timeout_ms);

/// Close DB (safe if db==nullptr).
void db_close(sqlite3* db);

/// Run one or more SQL statements without parameters. Logs on error.
bool db_exec(sqlite3* db, const char* sql);

/// Create tables, indexes and immutability triggers if missing.
/// Safe to call on every startup.
bool db_init_schema(sqlite3* db);

/// Insert the reference catalog, semester prerequisites and grading scale,
/// each only when its table is empty.
bool db_seed_reference_data(sqlite3* db);

/// Map a sqlite3 result code to an engine status (BUSY/LOCKED -> Busy).
EngineStatus status_from_sqlite(int rc);

// ==========================
// Statements
// ==========================

struct StmtFinalizer {
    void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

/// Prepare `sql`; logs and returns false on error.
bool db_prepare(sqlite3* db, const char* sql, StmtPtr& out);

/// Bind a std::string as TEXT (copied).
void db_bind_text(sqlite3_stmt* st, int index, const std::string& value);

/// Column as std::string; NULL becomes "".
std::string db_column_string(sqlite3_stmt* st, int col);

/// Log the connection's last error with some context.
void db_log_error(sqlite3* db, const std::string& context);

// ==========================
// Transactions
// ==========================

/// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed.
/// Check status() before doing any work: a Busy here means the write lock
/// could not be taken within the busy timeout.
class Transaction {
public:
    explicit Transaction(sqlite3* db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    EngineStatus status() const { return begin_status_; }
    EngineStatus commit();

private:
    sqlite3* db_;
    EngineStatus begin_status_;
    bool active_;
};

// ==========================
// Connection pool
// ==========================

/// Fixed set of open connections to one database file. acquire() blocks
/// until a connection is free. A ":memory:" database is private to its
/// connection, so the pool is clamped to a single connection in that case.
class ConnectionPool {
public:
    class Lease {
    public:
        Lease(ConnectionPool* pool, sqlite3* db) : pool_(pool), db_(db) {}
        Lease(Lease&& other) noexcept : pool_(other.pool_), db_(other.db_) {
            other.pool_ = nullptr;
            other.db_ = nullptr;
        }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;
        ~Lease() { if (pool_) pool_->release(db_); }

        sqlite3* get() const { return db_; }

    private:
        ConnectionPool* pool_;
        sqlite3* db_;
    };

    /// Throws std::runtime_error if any connection cannot be opened.
    ConnectionPool(const std::string& path, int size, int busy_timeout_ms);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Lease acquire();
    size_t size() const { return all_.size(); }
    const std::string& path() const { return path_; }

private:
    void release(sqlite3* db);

    std::string path_;
    std::vector<sqlite3*> all_;
    std::vector<sqlite3*> idle_;
    std::mutex mu_;
    std::condition_variable cv_;
};

// ==========================
// Counts (for dashboards/menus)
// ==========================

struct DbCounts {
    int courses = 0;
    int enrollments = 0;
    int certificates = 0;
    int dropouts = 0;
};

/// Populate `out` with live row counts. Returns true on success.
bool db_get_counts(sqlite3* db, DbCounts& out);
