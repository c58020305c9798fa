/*
-------------------------------------------------------------------------------
 db.cpp — SQLite persistence layer for the academic lifecycle engine
-------------------------------------------------------------------------------
Purpose
  - Opens connections, owns the schema, and provides the transaction guard
    and connection pool the engine modules run on.

Design notes
  - Foreign key cascades are enabled per-connection (PRAGMA foreign_keys=ON).
    Removing a course from the catalog cascades to its enrollments, progress,
    activity rows, certificates and semester policy.
  - course_dropouts has no foreign key: the refund audit trail outlives the
    catalog row. Triggers reject UPDATE and DELETE on it.
  - Derived columns (percentage, refund_percentage, refund_amount_cents) are
    written by the engine and range-checked again by CHECK constraints.
  - File databases use WAL so readers do not block the single writer.
  - Write ops use prepared statements with bound parameters.
-------------------------------------------------------------------------------
*/

#include "db.hpp"
#include "log.hpp"
#include <stdexcept>

bool db_exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        log_error(std::string("SQL error: ") + (err ? err : sqlite3_errstr(rc)));
        if (err) sqlite3_free(err);
        return false;
    }
    return true;
}

void db_log_error(sqlite3* db, const std::string& context) {
    log_error("SQL error (" + context + "): " + sqlite3_errmsg(db));
}

EngineStatus status_from_sqlite(int rc) {
    switch (rc & 0xFF) {
    case SQLITE_OK:
    case SQLITE_DONE:
    case SQLITE_ROW:
        return EngineStatus::Ok;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
        return EngineStatus::Busy;
    default:
        return EngineStatus::StorageError;
    }
}

bool db_open(sqlite3*& db, const std::string& path, int busy_timeout_ms) {
    db = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        log_error("Failed to open DB " + path + ": " + (db ? sqlite3_errmsg(db) : "out of memory"));
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    sqlite3_busy_timeout(db, busy_timeout_ms);

    if (!db_exec(db, "PRAGMA foreign_keys = ON;")) {
        db_close(db);
        db = nullptr;
        return false;
    }
    if (path != ":memory:" && !db_exec(db, "PRAGMA journal_mode = WAL;")) {
        db_close(db);
        db = nullptr;
        return false;
    }
    return true;
}

void db_close(sqlite3* db) {
    if (db) sqlite3_close(db);
}

bool db_init_schema(sqlite3* db) {
    const char* ddl =
        "CREATE TABLE IF NOT EXISTS courses ("
        "  code              TEXT PRIMARY KEY,"
        "  title             TEXT NOT NULL,"
        "  price_cents       INTEGER NOT NULL DEFAULT 0 CHECK (price_cents >= 0),"
        "  total_lessons     INTEGER NOT NULL DEFAULT 0 CHECK (total_lessons >= 0),"
        "  total_assignments INTEGER NOT NULL DEFAULT 0 CHECK (total_assignments >= 0),"
        "  duration_days     INTEGER NOT NULL DEFAULT 180 CHECK (duration_days > 0)"
        ");"

        "CREATE TABLE IF NOT EXISTS enrollments ("
        "  student_id  TEXT NOT NULL,"
        "  course_id   TEXT NOT NULL,"
        "  enrolled_at INTEGER NOT NULL,"
        "  PRIMARY KEY (student_id, course_id),"
        "  FOREIGN KEY (course_id) REFERENCES courses(code) ON DELETE CASCADE"
        ");"

        "CREATE TABLE IF NOT EXISTS lesson_completions ("
        "  student_id   TEXT NOT NULL,"
        "  course_id    TEXT NOT NULL,"
        "  lesson_id    TEXT NOT NULL,"
        "  completed_at INTEGER NOT NULL,"
        "  PRIMARY KEY (student_id, course_id, lesson_id),"
        "  FOREIGN KEY (course_id) REFERENCES courses(code) ON DELETE CASCADE"
        ");"

        "CREATE TABLE IF NOT EXISTS assignment_submissions ("
        "  student_id    TEXT NOT NULL,"
        "  course_id     TEXT NOT NULL,"
        "  assignment_id TEXT NOT NULL,"
        "  submitted_at  INTEGER NOT NULL,"
        "  PRIMARY KEY (student_id, course_id, assignment_id),"
        "  FOREIGN KEY (course_id) REFERENCES courses(code) ON DELETE CASCADE"
        ");"

        "CREATE TABLE IF NOT EXISTS course_progress ("
        "  student_id            TEXT NOT NULL,"
        "  course_id             TEXT NOT NULL,"
        "  total_lessons         INTEGER NOT NULL DEFAULT 0,"
        "  completed_lessons     INTEGER NOT NULL DEFAULT 0,"
        "  total_assignments     INTEGER NOT NULL DEFAULT 0,"
        "  submitted_assignments INTEGER NOT NULL DEFAULT 0,"
        "  percentage            REAL NOT NULL DEFAULT 0 CHECK (percentage BETWEEN 0 AND 100),"
        "  last_updated          INTEGER NOT NULL,"
        "  PRIMARY KEY (student_id, course_id),"
        "  FOREIGN KEY (course_id) REFERENCES courses(code) ON DELETE CASCADE"
        ");"

        "CREATE TABLE IF NOT EXISTS certificates ("
        "  certificate_id   INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  student_id       TEXT NOT NULL,"
        "  course_id        TEXT NOT NULL,"
        "  certificate_type TEXT NOT NULL CHECK (certificate_type IN ('Completion','Excellence','Proficiency')),"
        "  issued_at        INTEGER NOT NULL,"
        "  certificate_url  TEXT NOT NULL UNIQUE,"
        "  FOREIGN KEY (course_id) REFERENCES courses(code) ON DELETE CASCADE"
        ");"
        "CREATE UNIQUE INDEX IF NOT EXISTS ux_certificates_pair_type"
        "  ON certificates(student_id, course_id, certificate_type);"

        "CREATE TABLE IF NOT EXISTS course_dropouts ("
        "  dropout_id            INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  student_id            TEXT NOT NULL,"
        "  course_id             TEXT NOT NULL,"
        "  enrollment_date       INTEGER NOT NULL,"
        "  dropout_date          INTEGER NOT NULL,"
        "  total_course_duration INTEGER NOT NULL CHECK (total_course_duration > 0),"
        "  completed_duration    INTEGER NOT NULL CHECK (completed_duration BETWEEN 0 AND total_course_duration),"
        "  refund_percentage     INTEGER NOT NULL CHECK (refund_percentage IN (0, 25, 50, 90)),"
        "  refund_amount_cents   INTEGER NOT NULL CHECK (refund_amount_cents >= 0),"
        "  reason                TEXT"
        ");"
        "CREATE INDEX IF NOT EXISTS ix_course_dropouts_student ON course_dropouts(student_id);"
        "CREATE TRIGGER IF NOT EXISTS trg_course_dropouts_no_update BEFORE UPDATE ON course_dropouts "
        "BEGIN SELECT RAISE(ABORT, 'dropout records are immutable'); END;"
        "CREATE TRIGGER IF NOT EXISTS trg_course_dropouts_no_delete BEFORE DELETE ON course_dropouts "
        "BEGIN SELECT RAISE(ABORT, 'dropout records are immutable'); END;"

        "CREATE TABLE IF NOT EXISTS semester_prerequisites ("
        "  course_id            TEXT NOT NULL,"
        "  current_semester     INTEGER NOT NULL,"
        "  next_semester        INTEGER NOT NULL,"
        "  min_credits_required INTEGER NOT NULL CHECK (min_credits_required >= 0),"
        "  min_gpa_required     REAL NOT NULL CHECK (min_gpa_required >= 0),"
        "  PRIMARY KEY (course_id, current_semester),"
        "  FOREIGN KEY (course_id) REFERENCES courses(code) ON DELETE CASCADE"
        ");"

        "CREATE TABLE IF NOT EXISTS grading_scale ("
        "  grade          TEXT PRIMARY KEY,"
        "  min_percentage REAL NOT NULL,"
        "  max_percentage REAL NOT NULL,"
        "  grade_points   REAL NOT NULL,"
        "  remarks        TEXT NOT NULL,"
        "  CHECK (min_percentage <= max_percentage)"
        ");";
    return db_exec(db, ddl);
}

// Seed only when tables are empty. A fast existence check per table.
bool db_seed_reference_data(sqlite3* db) {
    auto table_empty = [&](const char* table)->bool {
        std::string q = std::string("SELECT 1 FROM ") + table + " LIMIT 1;";
        StmtPtr st;
        if (!db_prepare(db, q.c_str(), st)) return false;
        return sqlite3_step(st.get()) != SQLITE_ROW;
        };

    if (table_empty("courses")) {
        const char* seed_courses =
            "INSERT INTO courses(code,title,price_cents,total_lessons,total_assignments,duration_days) VALUES"
            "('CSE100','BTech Computer Science and Engineering',0,0,0,1440),"
            "('MNC100','BTech Mathematics and Computing',0,0,0,1440),"
            "('DSA101','Data Structures and Algorithms',100000,10,0,180),"
            "('LIN101','Linear Algebra',80000,12,4,180);";
        if (!db_exec(db, seed_courses)) return false;
    }

    if (table_empty("semester_prerequisites")) {
        const char* seed_policy =
            "INSERT INTO semester_prerequisites"
            "(course_id,current_semester,next_semester,min_credits_required,min_gpa_required) VALUES"
            "('CSE100',1,2,15,5.0),"
            "('CSE100',2,3,18,5.5),"
            "('CSE100',3,4,20,6.0),"
            "('CSE100',4,5,22,6.5),"
            "('CSE100',5,6,24,7.0),"
            "('CSE100',6,7,26,7.5),"
            "('CSE100',7,8,28,8.0);";
        if (!db_exec(db, seed_policy)) return false;
    }

    if (table_empty("grading_scale")) {
        const char* seed_grades =
            "INSERT INTO grading_scale(grade,min_percentage,max_percentage,grade_points,remarks) VALUES"
            "('A+',90.00,100.00,10.0,'Outstanding'),"
            "('A', 80.00, 89.99, 9.0,'Excellent'),"
            "('B+',70.00, 79.99, 8.0,'Very Good'),"
            "('B', 60.00, 69.99, 7.0,'Good'),"
            "('C+',50.00, 59.99, 6.0,'Average'),"
            "('C', 40.00, 49.99, 5.0,'Below Average'),"
            "('D', 35.00, 39.99, 4.0,'Pass'),"
            "('F',  0.00, 34.99, 0.0,'Fail');";
        if (!db_exec(db, seed_grades)) return false;
    }

    return true;
}

/* =========================
   Statement helpers
   ========================= */

bool db_prepare(sqlite3* db, const char* sql, StmtPtr& out) {
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr);
    out.reset(raw);
    if (rc != SQLITE_OK) {
        db_log_error(db, "prepare");
        out.reset();
        return false;
    }
    return true;
}

void db_bind_text(sqlite3_stmt* st, int index, const std::string& value) {
    sqlite3_bind_text(st, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

std::string db_column_string(sqlite3_stmt* st, int col) {
    const unsigned char* txt = sqlite3_column_text(st, col);
    return txt ? reinterpret_cast<const char*>(txt) : std::string();
}

/* =========================
   Transaction
   ========================= */

Transaction::Transaction(sqlite3* db)
    : db_(db), begin_status_(EngineStatus::Ok), active_(false) {
    int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr);
    if (rc == SQLITE_OK) {
        active_ = true;
    }
    else {
        begin_status_ = status_from_sqlite(rc);
        if (begin_status_ == EngineStatus::Busy)
            log_warn("transaction could not start: database is busy");
        else
            db_log_error(db_, "begin");
    }
}

Transaction::~Transaction() {
    if (active_) {
        // Nothing to report to: the caller already has the failure status.
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK)
            db_log_error(db_, "rollback");
        else
            log_debug("transaction rolled back");
    }
}

EngineStatus Transaction::commit() {
    if (!active_) return begin_status_ == EngineStatus::Ok ? EngineStatus::StorageError : begin_status_;
    int rc = sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        db_log_error(db_, "commit");
        // A failed COMMIT leaves the transaction open; the destructor rolls back.
        return status_from_sqlite(rc);
    }
    active_ = false;
    return EngineStatus::Ok;
}

/* =========================
   ConnectionPool
   ========================= */

ConnectionPool::ConnectionPool(const std::string& path, int size, int busy_timeout_ms)
    : path_(path) {
    if (size < 1) size = 1;
    if (path == ":memory:" && size > 1) {
        log_warn("in-memory database: connection pool clamped to 1");
        size = 1;
    }
    for (int i = 0; i < size; ++i) {
        sqlite3* db = nullptr;
        if (!db_open(db, path, busy_timeout_ms)) {
            for (sqlite3* open_db : all_) db_close(open_db);
            throw std::runtime_error("could not open database " + path);
        }
        all_.push_back(db);
    }
    idle_ = all_;
    log_debug("connection pool ready: " + path + " x" + std::to_string(all_.size()));
}

ConnectionPool::~ConnectionPool() {
    for (sqlite3* db : all_) db_close(db);
}

ConnectionPool::Lease ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this] { return !idle_.empty(); });
    sqlite3* db = idle_.back();
    idle_.pop_back();
    return Lease(this, db);
}

void ConnectionPool::release(sqlite3* db) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        idle_.push_back(db);
    }
    cv_.notify_one();
}

/* =========================
   Counts
   ========================= */

// One round-trip using scalar subqueries.
bool db_get_counts(sqlite3* db, DbCounts& out) {
    static const char* SQL =
        "SELECT "
        " (SELECT COUNT(*) FROM courses)         AS c, "
        " (SELECT COUNT(*) FROM enrollments)     AS e, "
        " (SELECT COUNT(*) FROM certificates)    AS k, "
        " (SELECT COUNT(*) FROM course_dropouts) AS d;";

    StmtPtr st;
    if (!db_prepare(db, SQL, st)) return false;

    if (sqlite3_step(st.get()) != SQLITE_ROW) return false;
    out.courses = sqlite3_column_int(st.get(), 0);
    out.enrollments = sqlite3_column_int(st.get(), 1);
    out.certificates = sqlite3_column_int(st.get(), 2);
    out.dropouts = sqlite3_column_int(st.get(), 3);
    return true;
}
