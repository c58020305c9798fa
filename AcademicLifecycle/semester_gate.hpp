#pragma once
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "sqlite3.h"
#include "models.hpp"
#include "status.hpp"

/*
-------------------------------------------------------------------------------
 semester_gate.hpp — Semester advancement policy
-------------------------------------------------------------------------------
SemesterPolicy is an immutable table of SemesterPrerequisite rows keyed by
(course, current semester). It is loaded once at startup and passed to
gate_can_advance explicitly; nothing here touches the database after load.

A student may advance iff credits >= min_credits_required and
gpa >= min_gpa_required for the matching row. No matching row is a
configuration gap (NoPolicyDefined), never a default.
-------------------------------------------------------------------------------
*/

class SemesterPolicy {
public:
    SemesterPolicy() = default;

    /// Later rows with an already seen (course, semester) key are ignored
    /// and logged.
    explicit SemesterPolicy(const std::vector<SemesterPrerequisite>& rows);

    bool find(const std::string& course_id, int current_semester, SemesterPrerequisite& out) const;
    size_t size() const { return rules_.size(); }

private:
    std::map<std::pair<std::string, int>, SemesterPrerequisite> rules_;
};

/// Read every semester_prerequisites row.
bool load_semester_policy(sqlite3* db, SemesterPolicy& out);

struct AdvancementDecision {
    bool allowed = false;
    int next_semester = 0;
    int min_credits_required = 0;
    double min_gpa_required = 0.0;
};

EngineStatus gate_can_advance(const SemesterPolicy& policy, const std::string& course_id,
    int current_semester, int student_credits, double student_gpa, AdvancementDecision& out);
