#include "progress.hpp"
#include "catalog.hpp"
#include "db.hpp"
#include "enrollment_ledger.hpp"
#include "log.hpp"
#include <algorithm>
#include <cmath>

namespace {

// Loads the stored row. Ok / NotEnrolled (no row) / storage failure.
EngineStatus load_progress_row(sqlite3* db, const std::string& student_id,
    const std::string& course_id, ProgressRecord& out) {
    const char* sql =
        "SELECT total_lessons,completed_lessons,total_assignments,submitted_assignments,"
        "percentage,last_updated FROM course_progress WHERE student_id=? AND course_id=?;";
    StmtPtr st;
    if (!db_prepare(db, sql, st)) return EngineStatus::StorageError;
    db_bind_text(st.get(), 1, student_id);
    db_bind_text(st.get(), 2, course_id);
    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return EngineStatus::NotEnrolled;
    if (rc != SQLITE_ROW) {
        db_log_error(db, "load progress");
        return status_from_sqlite(rc);
    }
    out.student_id = student_id;
    out.course_id = course_id;
    out.total_lessons = sqlite3_column_int(st.get(), 0);
    out.completed_lessons = sqlite3_column_int(st.get(), 1);
    out.total_assignments = sqlite3_column_int(st.get(), 2);
    out.submitted_assignments = sqlite3_column_int(st.get(), 3);
    out.percentage = sqlite3_column_double(st.get(), 4);
    out.last_updated = sqlite3_column_int64(st.get(), 5);
    return EngineStatus::Ok;
}

// Returns 1 if a new membership row was added, 0 if it already existed, -1 on error.
int insert_membership(sqlite3* db, ActivityKind kind, const std::string& student_id,
    const std::string& course_id, const std::string& item_id, TimePoint now) {
    const char* sql = kind == ActivityKind::Lesson
        ? "INSERT OR IGNORE INTO lesson_completions(student_id,course_id,lesson_id,completed_at)"
          " VALUES(?,?,?,?);"
        : "INSERT OR IGNORE INTO assignment_submissions(student_id,course_id,assignment_id,submitted_at)"
          " VALUES(?,?,?,?);";
    StmtPtr st;
    if (!db_prepare(db, sql, st)) return -1;
    db_bind_text(st.get(), 1, student_id);
    db_bind_text(st.get(), 2, course_id);
    db_bind_text(st.get(), 3, item_id);
    sqlite3_bind_int64(st.get(), 4, now);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        db_log_error(db, "record activity");
        return -1;
    }
    return sqlite3_changes(db) > 0 ? 1 : 0;
}

bool count_membership(sqlite3* db, const std::string& student_id,
    const std::string& course_id, int& lessons, int& assignments) {
    const char* sql =
        "SELECT "
        " (SELECT COUNT(*) FROM lesson_completions WHERE student_id=?1 AND course_id=?2),"
        " (SELECT COUNT(*) FROM assignment_submissions WHERE student_id=?1 AND course_id=?2);";
    StmtPtr st;
    if (!db_prepare(db, sql, st)) return false;
    db_bind_text(st.get(), 1, student_id);
    db_bind_text(st.get(), 2, course_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) {
        db_log_error(db, "count activity");
        return false;
    }
    lessons = sqlite3_column_int(st.get(), 0);
    assignments = sqlite3_column_int(st.get(), 1);
    return true;
}

bool upsert_progress(sqlite3* db, const ProgressRecord& rec) {
    const char* sql =
        "INSERT INTO course_progress(student_id,course_id,total_lessons,completed_lessons,"
        "total_assignments,submitted_assignments,percentage,last_updated) VALUES(?,?,?,?,?,?,?,?)"
        " ON CONFLICT(student_id,course_id) DO UPDATE SET"
        " total_lessons=excluded.total_lessons,"
        " completed_lessons=excluded.completed_lessons,"
        " total_assignments=excluded.total_assignments,"
        " submitted_assignments=excluded.submitted_assignments,"
        " percentage=excluded.percentage,"
        " last_updated=excluded.last_updated;";
    StmtPtr st;
    if (!db_prepare(db, sql, st)) return false;
    db_bind_text(st.get(), 1, rec.student_id);
    db_bind_text(st.get(), 2, rec.course_id);
    sqlite3_bind_int(st.get(), 3, rec.total_lessons);
    sqlite3_bind_int(st.get(), 4, rec.completed_lessons);
    sqlite3_bind_int(st.get(), 5, rec.total_assignments);
    sqlite3_bind_int(st.get(), 6, rec.submitted_assignments);
    sqlite3_bind_double(st.get(), 7, rec.percentage);
    sqlite3_bind_int64(st.get(), 8, rec.last_updated);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        db_log_error(db, "write progress");
        return false;
    }
    return true;
}

} // namespace

double compute_percentage(int total_lessons, int completed_lessons,
    int total_assignments, int submitted_assignments) {
    long long total = static_cast<long long>(total_lessons) + total_assignments;
    if (total == 0) return 0.0;
    // Surplus lessons never stand in for missing assignments, or vice versa.
    long long done = static_cast<long long>(std::min(completed_lessons, total_lessons))
        + std::min(submitted_assignments, total_assignments);
    double pct = static_cast<double>(done) * 100.0 / static_cast<double>(total);
    if (pct < 0.0) pct = 0.0;
    if (pct > 100.0) pct = 100.0;
    return std::round(pct * 100.0) / 100.0;
}

EngineStatus derive_percentage(ProgressRecord& rec) {
    if (rec.total_lessons < 0 || rec.completed_lessons < 0
        || rec.total_assignments < 0 || rec.submitted_assignments < 0) {
        log_error("negative progress counts for " + rec.student_id + "/" + rec.course_id);
        return EngineStatus::InvariantViolation;
    }
    double pct = compute_percentage(rec.total_lessons, rec.completed_lessons,
        rec.total_assignments, rec.submitted_assignments);
    if (!std::isfinite(pct) || pct < 0.0 || pct > 100.0) {
        log_error("percentage out of range for " + rec.student_id + "/" + rec.course_id);
        return EngineStatus::InvariantViolation;
    }
    rec.percentage = pct;
    return EngineStatus::Ok;
}

EngineStatus progress_record_activity(sqlite3* db, ActivityKind kind,
    const std::string& student_id, const std::string& course_id,
    const std::string& item_id, TimePoint now,
    ProgressObserver* observer, ProgressRecord& out) {
    Enrollment enrollment;
    EngineStatus s = ledger_lookup(db, student_id, course_id, enrollment);
    if (s != EngineStatus::Ok) return s;

    Course course;
    s = catalog_get_course(db, course_id, course);
    if (s != EngineStatus::Ok) return s;

    ProgressRecord previous;
    s = load_progress_row(db, student_id, course_id, previous);
    bool has_previous = (s == EngineStatus::Ok);
    if (!has_previous && s != EngineStatus::NotEnrolled) return s;

    int added = insert_membership(db, kind, student_id, course_id, item_id, now);
    if (added < 0) return EngineStatus::StorageError;

    // Same event again with unchanged totals: the stored record already
    // reflects it, leave it (and its timestamp) alone.
    if (added == 0 && has_previous
        && previous.total_lessons == course.total_lessons
        && previous.total_assignments == course.total_assignments) {
        out = previous;
        return EngineStatus::Ok;
    }

    ProgressRecord rec;
    rec.student_id = student_id;
    rec.course_id = course_id;
    rec.total_lessons = course.total_lessons;
    rec.total_assignments = course.total_assignments;
    if (!count_membership(db, student_id, course_id, rec.completed_lessons, rec.submitted_assignments))
        return EngineStatus::StorageError;
    rec.last_updated = now;

    s = derive_percentage(rec);
    if (s != EngineStatus::Ok) return s;

    if (!upsert_progress(db, rec)) return EngineStatus::StorageError;

    if (observer) {
        ProgressChanged ev;
        ev.student_id = student_id;
        ev.course_id = course_id;
        ev.old_percentage = has_previous ? previous.percentage : 0.0;
        ev.new_percentage = rec.percentage;
        ev.at = now;
        s = observer->on_progress_changed(db, ev);
        if (s != EngineStatus::Ok) return s;
    }

    out = rec;
    return EngineStatus::Ok;
}

EngineStatus progress_get(sqlite3* db, const std::string& student_id,
    const std::string& course_id, ProgressRecord& out) {
    EngineStatus s = load_progress_row(db, student_id, course_id, out);
    if (s != EngineStatus::NotEnrolled) return s;

    Enrollment enrollment;
    s = ledger_lookup(db, student_id, course_id, enrollment);
    if (s != EngineStatus::Ok) return s;

    Course course;
    s = catalog_get_course(db, course_id, course);
    if (s != EngineStatus::Ok) return s;

    ProgressRecord rec;
    rec.student_id = student_id;
    rec.course_id = course_id;
    rec.total_lessons = course.total_lessons;
    rec.total_assignments = course.total_assignments;
    rec.last_updated = enrollment.enrolled_at;
    out = rec;
    return EngineStatus::Ok;
}
