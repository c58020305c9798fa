#include "enrollment_ledger.hpp"
#include "catalog.hpp"
#include "db.hpp"

EngineStatus ledger_enroll(sqlite3* db, const std::string& student_id,
    const std::string& course_id, TimePoint now, Enrollment& out) {
    Course course;
    EngineStatus s = catalog_get_course(db, course_id, course);
    if (s != EngineStatus::Ok) return s;

    Enrollment existing;
    s = ledger_lookup(db, student_id, course_id, existing);
    if (s == EngineStatus::Ok) return EngineStatus::AlreadyEnrolled;
    if (s != EngineStatus::NotEnrolled) return s;

    StmtPtr st;
    if (!db_prepare(db, "INSERT INTO enrollments(student_id,course_id,enrolled_at) VALUES(?,?,?);", st))
        return EngineStatus::StorageError;
    db_bind_text(st.get(), 1, student_id);
    db_bind_text(st.get(), 2, course_id);
    sqlite3_bind_int64(st.get(), 3, now);
    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) {
        // Primary key still guards the pair if the lookup above was bypassed.
        if ((rc & 0xFF) == SQLITE_CONSTRAINT) return EngineStatus::AlreadyEnrolled;
        db_log_error(db, "enroll " + student_id + "/" + course_id);
        return status_from_sqlite(rc);
    }

    out.student_id = student_id;
    out.course_id = course_id;
    out.enrolled_at = now;
    return EngineStatus::Ok;
}

EngineStatus ledger_lookup(sqlite3* db, const std::string& student_id,
    const std::string& course_id, Enrollment& out) {
    StmtPtr st;
    if (!db_prepare(db,
        "SELECT enrolled_at FROM enrollments WHERE student_id=? AND course_id=?;", st))
        return EngineStatus::StorageError;
    db_bind_text(st.get(), 1, student_id);
    db_bind_text(st.get(), 2, course_id);
    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return EngineStatus::NotEnrolled;
    if (rc != SQLITE_ROW) {
        db_log_error(db, "lookup enrollment");
        return status_from_sqlite(rc);
    }
    out.student_id = student_id;
    out.course_id = course_id;
    out.enrolled_at = sqlite3_column_int64(st.get(), 0);
    return EngineStatus::Ok;
}

EngineStatus ledger_list_for_student(sqlite3* db, const std::string& student_id,
    std::vector<Enrollment>& out) {
    out.clear();
    StmtPtr st;
    if (!db_prepare(db,
        "SELECT course_id, enrolled_at FROM enrollments WHERE student_id=?"
        " ORDER BY enrolled_at, course_id;", st))
        return EngineStatus::StorageError;
    db_bind_text(st.get(), 1, student_id);
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        Enrollment e;
        e.student_id = student_id;
        e.course_id = db_column_string(st.get(), 0);
        e.enrolled_at = sqlite3_column_int64(st.get(), 1);
        out.push_back(e);
    }
    if (rc != SQLITE_DONE) {
        db_log_error(db, "list enrollments");
        return status_from_sqlite(rc);
    }
    return EngineStatus::Ok;
}
