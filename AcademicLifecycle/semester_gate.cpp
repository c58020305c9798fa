#include "semester_gate.hpp"
#include "db.hpp"
#include "log.hpp"

SemesterPolicy::SemesterPolicy(const std::vector<SemesterPrerequisite>& rows) {
    for (const auto& r : rows) {
        auto inserted = rules_.emplace(std::make_pair(r.course_id, r.current_semester), r);
        if (!inserted.second)
            log_warn("duplicate semester rule ignored: " + r.course_id
                + " semester " + std::to_string(r.current_semester));
    }
}

bool SemesterPolicy::find(const std::string& course_id, int current_semester,
    SemesterPrerequisite& out) const {
    auto it = rules_.find(std::make_pair(course_id, current_semester));
    if (it == rules_.end()) return false;
    out = it->second;
    return true;
}

bool load_semester_policy(sqlite3* db, SemesterPolicy& out) {
    const char* sql =
        "SELECT course_id,current_semester,next_semester,min_credits_required,min_gpa_required"
        " FROM semester_prerequisites ORDER BY course_id, current_semester;";
    StmtPtr st;
    if (!db_prepare(db, sql, st)) return false;

    std::vector<SemesterPrerequisite> rows;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        SemesterPrerequisite p;
        p.course_id = db_column_string(st.get(), 0);
        p.current_semester = sqlite3_column_int(st.get(), 1);
        p.next_semester = sqlite3_column_int(st.get(), 2);
        p.min_credits_required = sqlite3_column_int(st.get(), 3);
        p.min_gpa_required = sqlite3_column_double(st.get(), 4);
        rows.push_back(p);
    }
    if (rc != SQLITE_DONE) {
        db_log_error(db, "load semester policy");
        return false;
    }
    out = SemesterPolicy(rows);
    return true;
}

EngineStatus gate_can_advance(const SemesterPolicy& policy, const std::string& course_id,
    int current_semester, int student_credits, double student_gpa, AdvancementDecision& out) {
    SemesterPrerequisite rule;
    if (!policy.find(course_id, current_semester, rule)) return EngineStatus::NoPolicyDefined;

    out.next_semester = rule.next_semester;
    out.min_credits_required = rule.min_credits_required;
    out.min_gpa_required = rule.min_gpa_required;
    out.allowed = student_credits >= rule.min_credits_required
        && student_gpa >= rule.min_gpa_required;
    return EngineStatus::Ok;
}
