#include "certificates.hpp"
#include "db.hpp"
#include "enrollment_ledger.hpp"
#include "log.hpp"
#include <cstdint>
#include <cstdio>
#include <ctime>

namespace {

// FNV-1a, 64 bit
std::uint64_t fnv1a(const std::string& data) {
    std::uint64_t h = 0xcbf29ce484222325ULL;
    for (unsigned char c : data) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    return h;
}

std::string compact_utc(TimePoint t) {
    std::time_t tt = static_cast<std::time_t>(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[24];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

void read_certificate_row(sqlite3_stmt* st, Certificate& c) {
    c.student_id = db_column_string(st, 0);
    c.course_id = db_column_string(st, 1);
    if (!parse_certificate_type(db_column_string(st, 2), c.type))
        c.type = CertificateType::Completion;   // CHECK constraint makes this unreachable
    c.issued_at = sqlite3_column_int64(st, 3);
    c.url = db_column_string(st, 4);
}

} // namespace

std::string make_certificate_url(const std::string& student_id, const std::string& course_id,
    CertificateType type, TimePoint issued_at) {
    const char* type_name = certificate_type_name(type);
    std::string key = student_id + '\x1f' + course_id + '\x1f' + type_name + '\x1f'
        + std::to_string(issued_at);
    char digest[17];
    std::snprintf(digest, sizeof(digest), "%016llx",
        static_cast<unsigned long long>(fnv1a(key)));
    return "/certs/" + student_id + "_" + course_id + "_" + type_name + "_"
        + compact_utc(issued_at) + "_" + digest + ".pdf";
}

EngineStatus cert_find(sqlite3* db, const std::string& student_id,
    const std::string& course_id, CertificateType type, bool& found, Certificate& out) {
    found = false;
    const char* sql =
        "SELECT student_id,course_id,certificate_type,issued_at,certificate_url FROM certificates"
        " WHERE student_id=? AND course_id=? AND certificate_type=?;";
    StmtPtr st;
    if (!db_prepare(db, sql, st)) return EngineStatus::StorageError;
    db_bind_text(st.get(), 1, student_id);
    db_bind_text(st.get(), 2, course_id);
    sqlite3_bind_text(st.get(), 3, certificate_type_name(type), -1, SQLITE_STATIC);
    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return EngineStatus::Ok;
    if (rc != SQLITE_ROW) {
        db_log_error(db, "find certificate");
        return status_from_sqlite(rc);
    }
    read_certificate_row(st.get(), out);
    found = true;
    return EngineStatus::Ok;
}

EngineStatus cert_insert(sqlite3* db, const Certificate& cert) {
    const char* sql =
        "INSERT INTO certificates(student_id,course_id,certificate_type,issued_at,certificate_url)"
        " VALUES(?,?,?,?,?);";
    StmtPtr st;
    if (!db_prepare(db, sql, st)) return EngineStatus::StorageError;
    db_bind_text(st.get(), 1, cert.student_id);
    db_bind_text(st.get(), 2, cert.course_id);
    sqlite3_bind_text(st.get(), 3, certificate_type_name(cert.type), -1, SQLITE_STATIC);
    sqlite3_bind_int64(st.get(), 4, cert.issued_at);
    db_bind_text(st.get(), 5, cert.url);
    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) {
        db_log_error(db, "insert certificate");
        // A constraint hit here means the uniqueness check was bypassed.
        if ((rc & 0xFF) == SQLITE_CONSTRAINT) return EngineStatus::InvariantViolation;
        return status_from_sqlite(rc);
    }
    return EngineStatus::Ok;
}

EngineStatus cert_list_for_student(sqlite3* db, const std::string& student_id,
    std::vector<Certificate>& out) {
    out.clear();
    const char* sql =
        "SELECT student_id,course_id,certificate_type,issued_at,certificate_url FROM certificates"
        " WHERE student_id=? ORDER BY issued_at, certificate_id;";
    StmtPtr st;
    if (!db_prepare(db, sql, st)) return EngineStatus::StorageError;
    db_bind_text(st.get(), 1, student_id);
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        Certificate c;
        read_certificate_row(st.get(), c);
        out.push_back(c);
    }
    if (rc != SQLITE_DONE) {
        db_log_error(db, "list certificates");
        return status_from_sqlite(rc);
    }
    return EngineStatus::Ok;
}

EngineStatus cert_issue_award(sqlite3* db, const std::string& student_id,
    const std::string& course_id, AwardType award, TimePoint now,
    bool& created, Certificate& out) {
    created = false;
    CertificateType type = award == AwardType::Excellence
        ? CertificateType::Excellence : CertificateType::Proficiency;

    bool found = false;
    EngineStatus s = cert_find(db, student_id, course_id, type, found, out);
    if (s != EngineStatus::Ok || found) return s;

    Enrollment enrollment;
    s = ledger_lookup(db, student_id, course_id, enrollment);
    if (s == EngineStatus::NotEnrolled) {
        Certificate completion;
        bool completed = false;
        s = cert_find(db, student_id, course_id, CertificateType::Completion, completed, completion);
        if (s != EngineStatus::Ok) return s;
        if (!completed) return EngineStatus::NotEnrolled;
    }
    else if (s != EngineStatus::Ok) {
        return s;
    }

    Certificate cert;
    cert.student_id = student_id;
    cert.course_id = course_id;
    cert.type = type;
    cert.issued_at = now;
    cert.url = make_certificate_url(student_id, course_id, type, now);
    s = cert_insert(db, cert);
    if (s != EngineStatus::Ok) return s;

    created = true;
    out = cert;
    return EngineStatus::Ok;
}

EngineStatus CertificateIssuer::on_progress_changed(sqlite3* db, const ProgressChanged& ev) {
    if (!crossed_threshold(ev.old_percentage, ev.new_percentage, threshold_))
        return EngineStatus::Ok;

    bool found = false;
    Certificate existing;
    EngineStatus s = cert_find(db, ev.student_id, ev.course_id, CertificateType::Completion,
        found, existing);
    if (s != EngineStatus::Ok) return s;
    if (found) {
        log_debug("completion already issued for " + ev.student_id + "/" + ev.course_id);
        return EngineStatus::Ok;
    }

    Certificate cert;
    cert.student_id = ev.student_id;
    cert.course_id = ev.course_id;
    cert.type = CertificateType::Completion;
    cert.issued_at = ev.at;
    cert.url = make_certificate_url(ev.student_id, ev.course_id, cert.type, ev.at);
    s = cert_insert(db, cert);
    if (s != EngineStatus::Ok) return s;

    issued_.push_back(cert);
    return EngineStatus::Ok;
}
