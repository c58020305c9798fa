#include "refunds.hpp"
#include "catalog.hpp"
#include "db.hpp"
#include "enrollment_ledger.hpp"
#include "log.hpp"
#include <cstdio>

int completed_days(TimePoint enrolled_at, TimePoint dropout_at, int total_days) {
    if (dropout_at <= enrolled_at) return 0;
    std::int64_t days = (dropout_at - enrolled_at) / kSecondsPerDay;
    if (days > total_days) return total_days;
    return static_cast<int>(days);
}

int refund_percentage_for(int completed, int total_days) {
    std::int64_t c = completed;
    std::int64_t t = total_days;
    if (4 * c <= t) return 90;
    if (2 * c <= t) return 50;
    if (4 * c <= 3 * t) return 25;
    return 0;
}

Cents refund_amount_for(Cents price_cents, int refund_percentage) {
    return (price_cents * refund_percentage + 50) / 100;
}

EngineStatus build_dropout_record(const Enrollment& enrollment, const Course& course,
    TimePoint dropout_at, const std::string& reason, DropoutRecord& out) {
    if (course.duration_days <= 0 || course.price_cents < 0) {
        log_error("invalid catalog values for course " + course.code);
        return EngineStatus::InvariantViolation;
    }

    DropoutRecord rec;
    rec.student_id = enrollment.student_id;
    rec.course_id = enrollment.course_id;
    rec.enrollment_date = enrollment.enrolled_at;
    rec.dropout_date = dropout_at;
    rec.total_course_duration = course.duration_days;
    rec.completed_duration = completed_days(enrollment.enrolled_at, dropout_at, course.duration_days);
    rec.refund_percentage = refund_percentage_for(rec.completed_duration, rec.total_course_duration);
    rec.refund_amount_cents = refund_amount_for(course.price_cents, rec.refund_percentage);
    rec.reason = reason;

    bool tier_ok = rec.refund_percentage == 90 || rec.refund_percentage == 50
        || rec.refund_percentage == 25 || rec.refund_percentage == 0;
    if (rec.completed_duration < 0 || rec.completed_duration > rec.total_course_duration
        || !tier_ok
        || rec.refund_amount_cents < 0 || rec.refund_amount_cents > course.price_cents) {
        log_error("refund derivation out of range for " + rec.student_id + "/" + rec.course_id);
        return EngineStatus::InvariantViolation;
    }

    out = rec;
    return EngineStatus::Ok;
}

namespace {

// Delete exactly one row. NotEnrolled if nothing was deleted.
EngineStatus remove_enrollment(sqlite3* db, const std::string& student_id,
    const std::string& course_id) {
    StmtPtr st;
    if (!db_prepare(db, "DELETE FROM enrollments WHERE student_id=? AND course_id=?;", st))
        return EngineStatus::StorageError;
    db_bind_text(st.get(), 1, student_id);
    db_bind_text(st.get(), 2, course_id);
    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) {
        db_log_error(db, "remove enrollment " + student_id + "/" + course_id);
        return status_from_sqlite(rc);
    }
    return sqlite3_changes(db) == 1 ? EngineStatus::Ok : EngineStatus::NotEnrolled;
}

EngineStatus insert_dropout(sqlite3* db, const DropoutRecord& rec) {
    const char* sql =
        "INSERT INTO course_dropouts(student_id,course_id,enrollment_date,dropout_date,"
        "total_course_duration,completed_duration,refund_percentage,refund_amount_cents,reason)"
        " VALUES(?,?,?,?,?,?,?,?,?);";
    StmtPtr st;
    if (!db_prepare(db, sql, st)) return EngineStatus::StorageError;
    db_bind_text(st.get(), 1, rec.student_id);
    db_bind_text(st.get(), 2, rec.course_id);
    sqlite3_bind_int64(st.get(), 3, rec.enrollment_date);
    sqlite3_bind_int64(st.get(), 4, rec.dropout_date);
    sqlite3_bind_int(st.get(), 5, rec.total_course_duration);
    sqlite3_bind_int(st.get(), 6, rec.completed_duration);
    sqlite3_bind_int(st.get(), 7, rec.refund_percentage);
    sqlite3_bind_int64(st.get(), 8, rec.refund_amount_cents);
    db_bind_text(st.get(), 9, rec.reason);
    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) {
        db_log_error(db, "insert dropout");
        return status_from_sqlite(rc);
    }
    return EngineStatus::Ok;
}

} // namespace

EngineStatus refund_withdraw(sqlite3* db, const std::string& student_id,
    const std::string& course_id, const std::string& reason, TimePoint now,
    DropoutRecord& out) {
    Enrollment enrollment;
    EngineStatus s = ledger_lookup(db, student_id, course_id, enrollment);
    if (s != EngineStatus::Ok) return s;

    Course course;
    s = catalog_get_course(db, course_id, course);
    if (s == EngineStatus::UnknownCourse) {
        // Enrollment rows cascade with the course, so this is corruption.
        log_error("enrollment without catalog row: " + course_id);
        return EngineStatus::InvariantViolation;
    }
    if (s != EngineStatus::Ok) return s;

    DropoutRecord rec;
    s = build_dropout_record(enrollment, course, now, reason, rec);
    if (s != EngineStatus::Ok) return s;

    s = insert_dropout(db, rec);
    if (s != EngineStatus::Ok) return s;

    s = remove_enrollment(db, student_id, course_id);
    if (s == EngineStatus::NotEnrolled) {
        // The row was seen above on the same transaction.
        log_error("enrollment vanished during withdrawal: " + student_id + "/" + course_id);
        return EngineStatus::InvariantViolation;
    }
    if (s != EngineStatus::Ok) return s;

    out = rec;
    return EngineStatus::Ok;
}

EngineStatus dropout_list_for_student(sqlite3* db, const std::string& student_id,
    std::vector<DropoutRecord>& out) {
    out.clear();
    const char* sql =
        "SELECT course_id,enrollment_date,dropout_date,total_course_duration,completed_duration,"
        "refund_percentage,refund_amount_cents,reason FROM course_dropouts"
        " WHERE student_id=? ORDER BY dropout_date, dropout_id;";
    StmtPtr st;
    if (!db_prepare(db, sql, st)) return EngineStatus::StorageError;
    db_bind_text(st.get(), 1, student_id);
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        DropoutRecord r;
        r.student_id = student_id;
        r.course_id = db_column_string(st.get(), 0);
        r.enrollment_date = sqlite3_column_int64(st.get(), 1);
        r.dropout_date = sqlite3_column_int64(st.get(), 2);
        r.total_course_duration = sqlite3_column_int(st.get(), 3);
        r.completed_duration = sqlite3_column_int(st.get(), 4);
        r.refund_percentage = sqlite3_column_int(st.get(), 5);
        r.refund_amount_cents = sqlite3_column_int64(st.get(), 6);
        r.reason = db_column_string(st.get(), 7);
        out.push_back(r);
    }
    if (rc != SQLITE_DONE) {
        db_log_error(db, "list dropouts");
        return status_from_sqlite(rc);
    }
    return EngineStatus::Ok;
}

std::string format_cents(Cents amount) {
    bool negative = amount < 0;
    unsigned long long abs_amount = negative
        ? static_cast<unsigned long long>(-(amount + 1)) + 1
        : static_cast<unsigned long long>(amount);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s%llu.%02llu", negative ? "-" : "",
        abs_amount / 100, abs_amount % 100);
    return buf;
}
