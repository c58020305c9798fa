#pragma once
#include <string>
#include <vector>
#include "clock.hpp"
#include "db.hpp"
#include "events.hpp"
#include "grading.hpp"
#include "models.hpp"
#include "pair_locks.hpp"
#include "progress.hpp"
#include "certificates.hpp"
#include "semester_gate.hpp"
#include "status.hpp"

/*
-------------------------------------------------------------------------------
 engine.hpp — Academic lifecycle engine
-------------------------------------------------------------------------------
Entry point for sessions. Each pair operation:

  1. takes the pair lock,
  2. leases a pooled connection and opens an IMMEDIATE transaction,
  3. runs the module functions (ledger, progress + certificate issuer,
     refunds) on that transaction,
  4. commits, or rolls back on any non-Ok status,
  5. after a successful commit only, notifies the listener.

Lifecycle:
  - Construct with a pool, a clock, the completion threshold and an optional
    listener (not owned; must outlive the engine).
  - Call init_schema() and load_policy() once before concurrent use. The
    loaded semester policy and grading scale are then read-only.
-------------------------------------------------------------------------------
*/

class LifecycleEngine {
public:
    LifecycleEngine(ConnectionPool& pool, const Clock& clock, double completion_threshold,
        EngineListener* listener = nullptr);

    LifecycleEngine(const LifecycleEngine&) = delete;
    LifecycleEngine& operator=(const LifecycleEngine&) = delete;

    // ==========================
    // Startup
    // ==========================

    /// Create the schema; optionally insert reference data into empty tables.
    bool init_schema(bool seed_reference_data);

    /// Load semester prerequisites and grading scale from the database.
    bool load_policy();

    const SemesterPolicy& semester_policy() const { return policy_; }
    const GradingScale& grading_scale() const { return grading_; }
    double completion_threshold() const { return threshold_; }

    // ==========================
    // Catalog (collaborator rows)
    // ==========================

    bool add_course(const Course& c);
    bool update_course(const Course& c);
    bool remove_course(const std::string& code);
    EngineStatus course(const std::string& code, Course& out);
    bool courses(std::vector<Course>& out);

    // ==========================
    // Enrollment ledger
    // ==========================

    EngineStatus enroll(const std::string& student_id, const std::string& course_id, Enrollment& out);
    EngineStatus lookup(const std::string& student_id, const std::string& course_id, Enrollment& out);
    EngineStatus enrollments_for(const std::string& student_id, std::vector<Enrollment>& out);

    /// Identity removed a student: drop their enrollments, progress, activity
    /// and certificates. Dropout records are kept.
    EngineStatus purge_student(const std::string& student_id);

    // ==========================
    // Progress + certificates
    // ==========================

    EngineStatus record_lesson_completion(const std::string& student_id, const std::string& course_id,
        const std::string& lesson_id, ProgressRecord& out);
    EngineStatus record_assignment_submission(const std::string& student_id, const std::string& course_id,
        const std::string& assignment_id, ProgressRecord& out);
    EngineStatus progress(const std::string& student_id, const std::string& course_id, ProgressRecord& out);

    EngineStatus certificates_for(const std::string& student_id, std::vector<Certificate>& out);

    /// Externally decided Excellence / Proficiency award, idempotent.
    EngineStatus issue_award(const std::string& student_id, const std::string& course_id,
        AwardType award, Certificate& out);

    // ==========================
    // Withdrawal
    // ==========================

    EngineStatus withdraw(const std::string& student_id, const std::string& course_id,
        const std::string& reason, DropoutRecord& out);
    EngineStatus dropouts_for(const std::string& student_id, std::vector<DropoutRecord>& out);

    // ==========================
    // Semester gate
    // ==========================

    EngineStatus can_advance(const std::string& course_id, int current_semester,
        int student_credits, double student_gpa, AdvancementDecision& out) const;

    bool counts(DbCounts& out);

private:
    template <typename Fn>
    EngineStatus run_pair(const std::string& student_id, const std::string& course_id,
        const char* op, Fn&& work);

    template <typename Fn>
    EngineStatus run_unlocked(const char* op, Fn&& work);

    EngineStatus record_activity(ActivityKind kind, const std::string& student_id,
        const std::string& course_id, const std::string& item_id, ProgressRecord& out);

    void notify_certificate(const Certificate& cert);

    ConnectionPool& pool_;
    const Clock& clock_;
    double threshold_;
    EngineListener* listener_;
    PairLockTable locks_;
    SemesterPolicy policy_;
    GradingScale grading_;
};
