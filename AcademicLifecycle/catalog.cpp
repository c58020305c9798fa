#include "catalog.hpp"
#include "db.hpp"

namespace {

void read_course_row(sqlite3_stmt* st, Course& c) {
    c.code = db_column_string(st, 0);
    c.title = db_column_string(st, 1);
    c.price_cents = sqlite3_column_int64(st, 2);
    c.total_lessons = sqlite3_column_int(st, 3);
    c.total_assignments = sqlite3_column_int(st, 4);
    c.duration_days = sqlite3_column_int(st, 5);
}

} // namespace

bool catalog_course_valid(const Course& c) {
    return !c.code.empty() && !c.title.empty()
        && c.price_cents >= 0
        && c.total_lessons >= 0 && c.total_assignments >= 0
        && c.duration_days > 0;
}

// INSERT course row.
bool catalog_add_course(sqlite3* db, const Course& c) {
    if (!catalog_course_valid(c)) return false;
    const char* sql =
        "INSERT INTO courses(code,title,price_cents,total_lessons,total_assignments,duration_days)"
        " VALUES(?,?,?,?,?,?);";
    StmtPtr st;
    if (!db_prepare(db, sql, st)) return false;
    db_bind_text(st.get(), 1, c.code);
    db_bind_text(st.get(), 2, c.title);
    sqlite3_bind_int64(st.get(), 3, c.price_cents);
    sqlite3_bind_int(st.get(), 4, c.total_lessons);
    sqlite3_bind_int(st.get(), 5, c.total_assignments);
    sqlite3_bind_int(st.get(), 6, c.duration_days);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        db_log_error(db, "add course " + c.code);
        return false;
    }
    return true;
}

// UPDATE course fields by code.
bool catalog_update_course(sqlite3* db, const Course& c) {
    if (!catalog_course_valid(c)) return false;
    const char* sql =
        "UPDATE courses SET title=?, price_cents=?, total_lessons=?, total_assignments=?, duration_days=?"
        " WHERE code=?;";
    StmtPtr st;
    if (!db_prepare(db, sql, st)) return false;
    db_bind_text(st.get(), 1, c.title);
    sqlite3_bind_int64(st.get(), 2, c.price_cents);
    sqlite3_bind_int(st.get(), 3, c.total_lessons);
    sqlite3_bind_int(st.get(), 4, c.total_assignments);
    sqlite3_bind_int(st.get(), 5, c.duration_days);
    db_bind_text(st.get(), 6, c.code);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        db_log_error(db, "update course " + c.code);
        return false;
    }
    return sqlite3_changes(db) > 0;
}

// Delete a course by code; cascades remove its dependent rows.
bool catalog_delete_course(sqlite3* db, const std::string& code) {
    StmtPtr st;
    if (!db_prepare(db, "DELETE FROM courses WHERE code=?;", st)) return false;
    db_bind_text(st.get(), 1, code);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        db_log_error(db, "delete course " + code);
        return false;
    }
    return sqlite3_changes(db) > 0;
}

EngineStatus catalog_get_course(sqlite3* db, const std::string& code, Course& out) {
    const char* sql =
        "SELECT code,title,price_cents,total_lessons,total_assignments,duration_days"
        " FROM courses WHERE code=?;";
    StmtPtr st;
    if (!db_prepare(db, sql, st)) return EngineStatus::StorageError;
    db_bind_text(st.get(), 1, code);
    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return EngineStatus::UnknownCourse;
    if (rc != SQLITE_ROW) {
        db_log_error(db, "get course " + code);
        return status_from_sqlite(rc);
    }
    read_course_row(st.get(), out);
    return EngineStatus::Ok;
}

bool catalog_list_courses(sqlite3* db, std::vector<Course>& out) {
    out.clear();
    const char* sql =
        "SELECT code,title,price_cents,total_lessons,total_assignments,duration_days"
        " FROM courses ORDER BY code;";
    StmtPtr st;
    if (!db_prepare(db, sql, st)) return false;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        Course c;
        read_course_row(st.get(), c);
        out.push_back(c);
    }
    if (rc != SQLITE_DONE) {
        db_log_error(db, "list courses");
        return false;
    }
    return true;
}
