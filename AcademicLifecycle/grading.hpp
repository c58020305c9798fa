#pragma once
#include <string>
#include <vector>
#include "sqlite3.h"

/*
-------------------------------------------------------------------------------
 grading.hpp — Percentage to grade points, GPA and earned credits
-------------------------------------------------------------------------------
The semester gate takes a GPA and a credit total from its caller. These
helpers produce both from subject results using the institution's grading
scale (A+ 90-100 = 10 points ... F 0-34.99 = 0 points).

A percentage maps to the band with the highest min_percentage not above it,
so the 0.01 gaps between stored bands (89.99 / 90.00) never fall through.
-------------------------------------------------------------------------------
*/

struct GradeBand {
    std::string grade;
    double min_percentage = 0.0;
    double max_percentage = 0.0;
    double grade_points = 0.0;
    std::string remarks;
};

struct SubjectResult {
    int credits = 0;             // > 0
    double percentage = 0.0;     // 0..100
};

class GradingScale {
public:
    GradingScale() = default;
    explicit GradingScale(std::vector<GradeBand> bands);

    /// The scale the database is seeded with.
    static GradingScale standard();

    /// False for a percentage outside [0, 100] or an empty scale.
    bool grade_for(double percentage, GradeBand& out) const;

    size_t size() const { return bands_.size(); }

private:
    std::vector<GradeBand> bands_;   // sorted by min_percentage, descending
};

bool load_grading_scale(sqlite3* db, GradingScale& out);

/// Credit-weighted grade points over all subjects, and the credits of
/// subjects with non-zero grade points. An empty list gives 0 / 0.
/// False if a subject has non-positive credits or an ungradable percentage.
bool compute_gpa(const GradingScale& scale, const std::vector<SubjectResult>& results,
    double& gpa, int& earned_credits);
