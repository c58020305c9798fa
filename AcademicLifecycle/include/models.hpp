#pragma once
#include <cstdint>
#include <string>

/*
-------------------------------------------------------------------------------
 models.hpp — Core domain structs
-------------------------------------------------------------------------------
Plain value types for the academic lifecycle engine:
  - Course             (catalog row the engine reads: price, totals, duration)
  - Enrollment         (active student/course pair)
  - ProgressRecord     (counts + derived completion percentage)
  - Certificate        (Completion / Excellence / Proficiency)
  - DropoutRecord      (immutable withdrawal audit row with refund)
  - SemesterPrerequisite (advancement policy row)

Times are UTC seconds since the Unix epoch. Money is integer cents.
Derived fields (percentage, refund_percentage, refund_amount_cents) are only
ever filled in by the engine; callers read them.
-------------------------------------------------------------------------------
*/

using TimePoint = std::int64_t;   // unix seconds, UTC
using Cents = std::int64_t;

constexpr std::int64_t kSecondsPerDay = 86400;

// A catalog course as seen by the engine
struct Course {
    std::string code;              // primary key-like, e.g. DSA101
    std::string title;
    Cents price_cents{ 0 };        // >= 0
    int total_lessons{ 0 };        // >= 0
    int total_assignments{ 0 };    // >= 0
    int duration_days{ 180 };      // > 0, used for refund tiers
};

// An active enrollment
struct Enrollment {
    std::string student_id;
    std::string course_id;
    TimePoint enrolled_at{ 0 };
};

// Per-pair progress. percentage is derived, see compute_percentage().
struct ProgressRecord {
    std::string student_id;
    std::string course_id;
    int total_lessons{ 0 };
    int completed_lessons{ 0 };
    int total_assignments{ 0 };
    int submitted_assignments{ 0 };
    double percentage{ 0.0 };      // 0..100, two decimals
    TimePoint last_updated{ 0 };
};

enum class CertificateType { Completion, Excellence, Proficiency };

struct Certificate {
    std::string student_id;
    std::string course_id;
    CertificateType type{ CertificateType::Completion };
    TimePoint issued_at{ 0 };
    std::string url;
};

// Append-only withdrawal record
struct DropoutRecord {
    std::string student_id;
    std::string course_id;
    TimePoint enrollment_date{ 0 };
    TimePoint dropout_date{ 0 };
    int total_course_duration{ 0 };  // days
    int completed_duration{ 0 };     // days, clamped to [0, total]
    int refund_percentage{ 0 };      // 90 / 50 / 25 / 0
    Cents refund_amount_cents{ 0 };
    std::string reason;
};

// One advancement rule: (course, current_semester) -> thresholds
struct SemesterPrerequisite {
    std::string course_id;
    int current_semester{ 0 };
    int next_semester{ 0 };
    int min_credits_required{ 0 };
    double min_gpa_required{ 0.0 };
};

/// "Completion" / "Excellence" / "Proficiency"
const char* certificate_type_name(CertificateType t);

/// Parse the storage spelling back. Returns false for unknown text.
bool parse_certificate_type(const std::string& text, CertificateType& out);
