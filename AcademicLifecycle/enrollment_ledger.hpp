#pragma once
#include <string>
#include <vector>
#include "sqlite3.h"
#include "models.hpp"
#include "status.hpp"

/*
-------------------------------------------------------------------------------
 enrollment_ledger.hpp — Which student is active in which course, since when
-------------------------------------------------------------------------------
The ledger is the only place enrollment rows are created. There is no
public delete: the withdrawal processor (refunds.cpp) removes the row in the
same transaction that writes the dropout record, so a student can never
leave a course without a refund record (catalog cascades excepted).

All functions run on the caller's open transaction.
-------------------------------------------------------------------------------
*/

/// Create the enrollment. AlreadyEnrolled if the pair is active,
/// UnknownCourse if the course is not in the catalog.
EngineStatus ledger_enroll(sqlite3* db, const std::string& student_id,
    const std::string& course_id, TimePoint now, Enrollment& out);

/// NotEnrolled if there is no active row for the pair.
EngineStatus ledger_lookup(sqlite3* db, const std::string& student_id,
    const std::string& course_id, Enrollment& out);

/// Active enrollments of one student, oldest first.
EngineStatus ledger_list_for_student(sqlite3* db, const std::string& student_id,
    std::vector<Enrollment>& out);
