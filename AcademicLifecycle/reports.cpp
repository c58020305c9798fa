#include "reports.hpp"
#include "refunds.hpp"
#include <ctime>
#include <iomanip>

std::string format_date(TimePoint t) {
    std::time_t tt = static_cast<std::time_t>(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

void print_courses(std::ostream& os, const std::vector<Course>& courses) {
    if (courses.empty()) { os << "No courses.\n"; return; }
    for (const auto& c : courses)
        os << c.code << " - " << c.title
            << " | price=" << format_cents(c.price_cents)
            << " lessons=" << c.total_lessons
            << " assignments=" << c.total_assignments
            << " duration=" << c.duration_days << "d\n";
}

void print_enrollments(std::ostream& os, const std::vector<Enrollment>& rows) {
    if (rows.empty()) { os << "No enrollments.\n"; return; }
    for (const auto& e : rows)
        os << e.student_id << " -> " << e.course_id
            << " | since " << format_date(e.enrolled_at) << "\n";
}

void print_progress(std::ostream& os, const ProgressRecord& rec) {
    os << rec.student_id << " in " << rec.course_id
        << " | lessons " << rec.completed_lessons << "/" << rec.total_lessons
        << " assignments " << rec.submitted_assignments << "/" << rec.total_assignments
        << " | " << std::fixed << std::setprecision(2) << rec.percentage << "%"
        << std::defaultfloat << "\n";
}

void print_certificates(std::ostream& os, const std::vector<Certificate>& certs) {
    if (certs.empty()) { os << "No certificates.\n"; return; }
    for (const auto& c : certs)
        os << c.course_id << " | " << certificate_type_name(c.type)
            << " | " << format_date(c.issued_at)
            << " | " << c.url << "\n";
}

void print_dropout(std::ostream& os, const DropoutRecord& rec) {
    os << rec.student_id << " left " << rec.course_id
        << " on " << format_date(rec.dropout_date)
        << " | day " << rec.completed_duration << " of " << rec.total_course_duration
        << " | refund " << rec.refund_percentage << "% = " << format_cents(rec.refund_amount_cents);
    if (!rec.reason.empty()) os << " | " << rec.reason;
    os << "\n";
}

void print_dropouts(std::ostream& os, const std::vector<DropoutRecord>& rows) {
    if (rows.empty()) { os << "No dropout records.\n"; return; }
    for (const auto& r : rows) print_dropout(os, r);
}

void print_decision(std::ostream& os, const AdvancementDecision& d) {
    os << (d.allowed ? "May advance" : "May not advance")
        << " to semester " << d.next_semester
        << " (requires " << d.min_credits_required << " credits, GPA "
        << std::fixed << std::setprecision(2) << d.min_gpa_required << std::defaultfloat << ")\n";
}
