#include "engine.hpp"
#include "catalog.hpp"
#include "enrollment_ledger.hpp"
#include "log.hpp"
#include "refunds.hpp"
#include <sstream>

namespace {

std::string pair_name(const std::string& student_id, const std::string& course_id) {
    return student_id + "/" + course_id;
}

// Mirrors the identity service's ON DELETE CASCADE for one student.
EngineStatus purge_student_rows(sqlite3* db, const std::string& student_id) {
    static const char* kTables[] = {
        "enrollments", "course_progress", "lesson_completions",
        "assignment_submissions", "certificates"
    };
    for (const char* table : kTables) {
        std::string sql = std::string("DELETE FROM ") + table + " WHERE student_id=?;";
        StmtPtr st;
        if (!db_prepare(db, sql.c_str(), st)) return EngineStatus::StorageError;
        db_bind_text(st.get(), 1, student_id);
        int rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) {
            db_log_error(db, std::string("purge ") + table);
            return status_from_sqlite(rc);
        }
    }
    return EngineStatus::Ok;
}

} // namespace

LifecycleEngine::LifecycleEngine(ConnectionPool& pool, const Clock& clock,
    double completion_threshold, EngineListener* listener)
    : pool_(pool), clock_(clock), threshold_(completion_threshold), listener_(listener) {}

template <typename Fn>
EngineStatus LifecycleEngine::run_pair(const std::string& student_id, const std::string& course_id,
    const char* op, Fn&& work) {
    auto guard = locks_.lock(student_id, course_id);
    auto lease = pool_.acquire();
    Transaction tx(lease.get());
    if (tx.status() != EngineStatus::Ok) return tx.status();

    EngineStatus s = work(lease.get());
    if (s != EngineStatus::Ok) {
        LogLevel level = (s == EngineStatus::InvariantViolation || s == EngineStatus::StorageError)
            ? LogLevel::Error : LogLevel::Debug;
        log_message(level, std::string(op) + " " + pair_name(student_id, course_id)
            + " rolled back: " + status_name(s));
        return s;
    }
    return tx.commit();
}

template <typename Fn>
EngineStatus LifecycleEngine::run_unlocked(const char* op, Fn&& work) {
    auto lease = pool_.acquire();
    Transaction tx(lease.get());
    if (tx.status() != EngineStatus::Ok) return tx.status();

    EngineStatus s = work(lease.get());
    if (s != EngineStatus::Ok) {
        log_debug(std::string(op) + " rolled back: " + status_name(s));
        return s;
    }
    return tx.commit();
}

/* =========================
   Startup
   ========================= */

bool LifecycleEngine::init_schema(bool seed_reference_data) {
    EngineStatus s = run_unlocked("init schema", [&](sqlite3* db) {
        if (!db_init_schema(db)) return EngineStatus::StorageError;
        if (seed_reference_data && !db_seed_reference_data(db)) return EngineStatus::StorageError;
        return EngineStatus::Ok;
        });
    return s == EngineStatus::Ok;
}

bool LifecycleEngine::load_policy() {
    auto lease = pool_.acquire();
    SemesterPolicy policy;
    GradingScale scale;
    if (!load_semester_policy(lease.get(), policy)) return false;
    if (!load_grading_scale(lease.get(), scale)) return false;
    if (scale.size() == 0) {
        log_warn("grading scale table is empty, using the standard scale");
        scale = GradingScale::standard();
    }
    policy_ = policy;
    grading_ = scale;
    log_info("loaded " + std::to_string(policy_.size()) + " semester rules, "
        + std::to_string(grading_.size()) + " grade bands");
    return true;
}

/* =========================
   Catalog
   ========================= */

bool LifecycleEngine::add_course(const Course& c) {
    return run_unlocked("add course", [&](sqlite3* db) {
        return catalog_add_course(db, c) ? EngineStatus::Ok : EngineStatus::StorageError;
        }) == EngineStatus::Ok;
}

bool LifecycleEngine::update_course(const Course& c) {
    return run_unlocked("update course", [&](sqlite3* db) {
        return catalog_update_course(db, c) ? EngineStatus::Ok : EngineStatus::UnknownCourse;
        }) == EngineStatus::Ok;
}

bool LifecycleEngine::remove_course(const std::string& code) {
    return run_unlocked("remove course", [&](sqlite3* db) {
        return catalog_delete_course(db, code) ? EngineStatus::Ok : EngineStatus::UnknownCourse;
        }) == EngineStatus::Ok;
}

EngineStatus LifecycleEngine::course(const std::string& code, Course& out) {
    auto lease = pool_.acquire();
    return catalog_get_course(lease.get(), code, out);
}

bool LifecycleEngine::courses(std::vector<Course>& out) {
    auto lease = pool_.acquire();
    return catalog_list_courses(lease.get(), out);
}

/* =========================
   Enrollment ledger
   ========================= */

EngineStatus LifecycleEngine::enroll(const std::string& student_id, const std::string& course_id,
    Enrollment& out) {
    TimePoint now = clock_.now();
    EngineStatus s = run_pair(student_id, course_id, "enroll", [&](sqlite3* db) {
        return ledger_enroll(db, student_id, course_id, now, out);
        });
    if (s == EngineStatus::Ok) log_info("enrolled " + pair_name(student_id, course_id));
    return s;
}

EngineStatus LifecycleEngine::lookup(const std::string& student_id, const std::string& course_id,
    Enrollment& out) {
    auto guard = locks_.lock(student_id, course_id);
    auto lease = pool_.acquire();
    return ledger_lookup(lease.get(), student_id, course_id, out);
}

EngineStatus LifecycleEngine::enrollments_for(const std::string& student_id, std::vector<Enrollment>& out) {
    auto lease = pool_.acquire();
    return ledger_list_for_student(lease.get(), student_id, out);
}

EngineStatus LifecycleEngine::purge_student(const std::string& student_id) {
    EngineStatus s = run_unlocked("purge student", [&](sqlite3* db) {
        return purge_student_rows(db, student_id);
        });
    if (s == EngineStatus::Ok) log_info("purged engine rows of student " + student_id);
    return s;
}

/* =========================
   Progress + certificates
   ========================= */

EngineStatus LifecycleEngine::record_activity(ActivityKind kind, const std::string& student_id,
    const std::string& course_id, const std::string& item_id, ProgressRecord& out) {
    TimePoint now = clock_.now();
    CertificateIssuer issuer(threshold_);
    ProgressRecord rec;
    EngineStatus s = run_pair(student_id, course_id,
        kind == ActivityKind::Lesson ? "lesson completion" : "assignment submission",
        [&](sqlite3* db) {
            return progress_record_activity(db, kind, student_id, course_id, item_id, now, &issuer, rec);
        });
    if (s != EngineStatus::Ok) return s;

    out = rec;
    for (const auto& cert : issuer.issued()) notify_certificate(cert);
    return EngineStatus::Ok;
}

EngineStatus LifecycleEngine::record_lesson_completion(const std::string& student_id,
    const std::string& course_id, const std::string& lesson_id, ProgressRecord& out) {
    return record_activity(ActivityKind::Lesson, student_id, course_id, lesson_id, out);
}

EngineStatus LifecycleEngine::record_assignment_submission(const std::string& student_id,
    const std::string& course_id, const std::string& assignment_id, ProgressRecord& out) {
    return record_activity(ActivityKind::Assignment, student_id, course_id, assignment_id, out);
}

EngineStatus LifecycleEngine::progress(const std::string& student_id, const std::string& course_id,
    ProgressRecord& out) {
    auto guard = locks_.lock(student_id, course_id);
    auto lease = pool_.acquire();
    return progress_get(lease.get(), student_id, course_id, out);
}

EngineStatus LifecycleEngine::certificates_for(const std::string& student_id,
    std::vector<Certificate>& out) {
    auto lease = pool_.acquire();
    return cert_list_for_student(lease.get(), student_id, out);
}

EngineStatus LifecycleEngine::issue_award(const std::string& student_id, const std::string& course_id,
    AwardType award, Certificate& out) {
    TimePoint now = clock_.now();
    bool created = false;
    Certificate cert;
    EngineStatus s = run_pair(student_id, course_id, "issue award", [&](sqlite3* db) {
        return cert_issue_award(db, student_id, course_id, award, now, created, cert);
        });
    if (s != EngineStatus::Ok) return s;

    out = cert;
    if (created) notify_certificate(cert);
    return EngineStatus::Ok;
}

void LifecycleEngine::notify_certificate(const Certificate& cert) {
    log_info(std::string(certificate_type_name(cert.type)) + " certificate issued to "
        + pair_name(cert.student_id, cert.course_id) + ": " + cert.url);
    if (listener_) listener_->on_certificate_issued(cert);
}

/* =========================
   Withdrawal
   ========================= */

EngineStatus LifecycleEngine::withdraw(const std::string& student_id, const std::string& course_id,
    const std::string& reason, DropoutRecord& out) {
    TimePoint now = clock_.now();
    DropoutRecord rec;
    EngineStatus s = run_pair(student_id, course_id, "withdraw", [&](sqlite3* db) {
        return refund_withdraw(db, student_id, course_id, reason, now, rec);
        });
    if (s != EngineStatus::Ok) return s;

    out = rec;
    std::ostringstream msg;
    msg << "withdrawal " << pair_name(student_id, course_id)
        << ": day " << rec.completed_duration << "/" << rec.total_course_duration
        << ", refund " << rec.refund_percentage << "% = " << format_cents(rec.refund_amount_cents);
    log_info(msg.str());
    if (listener_) listener_->on_dropout_recorded(rec);
    return EngineStatus::Ok;
}

EngineStatus LifecycleEngine::dropouts_for(const std::string& student_id,
    std::vector<DropoutRecord>& out) {
    auto lease = pool_.acquire();
    return dropout_list_for_student(lease.get(), student_id, out);
}

/* =========================
   Semester gate
   ========================= */

EngineStatus LifecycleEngine::can_advance(const std::string& course_id, int current_semester,
    int student_credits, double student_gpa, AdvancementDecision& out) const {
    return gate_can_advance(policy_, course_id, current_semester, student_credits, student_gpa, out);
}

bool LifecycleEngine::counts(DbCounts& out) {
    auto lease = pool_.acquire();
    return db_get_counts(lease.get(), out);
}
