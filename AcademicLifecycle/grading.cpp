#include "grading.hpp"
#include "db.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

GradingScale::GradingScale(std::vector<GradeBand> bands) : bands_(std::move(bands)) {
    std::sort(bands_.begin(), bands_.end(),
        [](const GradeBand& a, const GradeBand& b) { return a.min_percentage > b.min_percentage; });
}

GradingScale GradingScale::standard() {
    return GradingScale({
        { "A+", 90.0, 100.0, 10.0, "Outstanding" },
        { "A",  80.0, 89.99,  9.0, "Excellent" },
        { "B+", 70.0, 79.99,  8.0, "Very Good" },
        { "B",  60.0, 69.99,  7.0, "Good" },
        { "C+", 50.0, 59.99,  6.0, "Average" },
        { "C",  40.0, 49.99,  5.0, "Below Average" },
        { "D",  35.0, 39.99,  4.0, "Pass" },
        { "F",   0.0, 34.99,  0.0, "Fail" },
    });
}

bool GradingScale::grade_for(double percentage, GradeBand& out) const {
    if (!std::isfinite(percentage) || percentage < 0.0 || percentage > 100.0) return false;
    for (const auto& b : bands_) {
        if (percentage >= b.min_percentage) { out = b; return true; }
    }
    return false;
}

bool load_grading_scale(sqlite3* db, GradingScale& out) {
    StmtPtr st;
    if (!db_prepare(db,
        "SELECT grade,min_percentage,max_percentage,grade_points,remarks FROM grading_scale;", st))
        return false;
    std::vector<GradeBand> bands;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        GradeBand b;
        b.grade = db_column_string(st.get(), 0);
        b.min_percentage = sqlite3_column_double(st.get(), 1);
        b.max_percentage = sqlite3_column_double(st.get(), 2);
        b.grade_points = sqlite3_column_double(st.get(), 3);
        b.remarks = db_column_string(st.get(), 4);
        bands.push_back(b);
    }
    if (rc != SQLITE_DONE) {
        db_log_error(db, "load grading scale");
        return false;
    }
    out = GradingScale(std::move(bands));
    return true;
}

bool compute_gpa(const GradingScale& scale, const std::vector<SubjectResult>& results,
    double& gpa, int& earned_credits) {
    double weighted = 0.0;
    int attempted = 0;
    int earned = 0;
    for (const auto& r : results) {
        if (r.credits <= 0) return false;
        GradeBand band;
        if (!scale.grade_for(r.percentage, band)) return false;
        weighted += band.grade_points * r.credits;
        attempted += r.credits;
        if (band.grade_points > 0.0) earned += r.credits;
    }
    gpa = attempted == 0 ? 0.0 : std::round(weighted / attempted * 100.0) / 100.0;
    earned_credits = earned;
    return true;
}
