#pragma once
#include <string>
#include "sqlite3.h"
#include "models.hpp"
#include "status.hpp"
#include "events.hpp"

/*
-------------------------------------------------------------------------------
 progress.hpp — Progress accumulator
-------------------------------------------------------------------------------
Turns lesson-completion and assignment-submission events into the per-pair
ProgressRecord. Counts are derived from membership rows (one per lesson or
assignment id), so repeating an event never double-counts.

The percentage is a pure function of the four counts:

    total = total_lessons + total_assignments
    done  = min(completed_lessons, total_lessons)
          + min(submitted_assignments, total_assignments)
    pct   = total == 0 ? 0 : done * 100 / total

clamped to [0, 100] and rounded to two decimals. The stored counts stay raw
(distinct ids seen); only the formula caps them. Totals are read from the
catalog on every event, so a catalog change is picked up by the next event.

After the record is written, ProgressChanged{old, new} goes to the observer
on the same connection and transaction; its status is returned as-is, which
aborts the caller's unit of work on failure.
-------------------------------------------------------------------------------
*/

enum class ActivityKind { Lesson, Assignment };

/// Pure percentage formula, see above.
double compute_percentage(int total_lessons, int completed_lessons,
    int total_assignments, int submitted_assignments);

/// Fill rec.percentage from its counts. InvariantViolation on negative
/// counts or a result outside [0, 100].
EngineStatus derive_percentage(ProgressRecord& rec);

/// Record one activity for an enrolled pair and recompute progress.
/// `observer` may be null.
EngineStatus progress_record_activity(sqlite3* db, ActivityKind kind,
    const std::string& student_id, const std::string& course_id,
    const std::string& item_id, TimePoint now,
    ProgressObserver* observer, ProgressRecord& out);

inline EngineStatus progress_record_lesson_completion(sqlite3* db,
    const std::string& student_id, const std::string& course_id,
    const std::string& lesson_id, TimePoint now,
    ProgressObserver* observer, ProgressRecord& out) {
    return progress_record_activity(db, ActivityKind::Lesson, student_id, course_id,
        lesson_id, now, observer, out);
}

inline EngineStatus progress_record_assignment_submission(sqlite3* db,
    const std::string& student_id, const std::string& course_id,
    const std::string& assignment_id, TimePoint now,
    ProgressObserver* observer, ProgressRecord& out) {
    return progress_record_activity(db, ActivityKind::Assignment, student_id, course_id,
        assignment_id, now, observer, out);
}

/// Stored record for the pair. An enrolled pair with no activity yet gets a
/// zero record built from catalog totals; otherwise NotEnrolled.
EngineStatus progress_get(sqlite3* db, const std::string& student_id,
    const std::string& course_id, ProgressRecord& out);
