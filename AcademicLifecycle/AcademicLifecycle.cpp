/*
-------------------------------------------------------------------------------
 AcademicLifecycle.cpp
-------------------------------------------------------------------------------
 Purpose:
   Operator console for the academic lifecycle engine (main()). Drives the
   engine through a menu: catalog rows, enrollment, lesson/assignment events,
   progress and certificates, withdrawals with refunds, semester advancement.

 Data flow:
   - Persistent store: SQLite through a ConnectionPool (db.hpp).
   - Every action is one engine call; the engine owns transactions. The
     console only validates input and prints results.
   - Certificates and dropouts are announced by ConsoleListener, which the
     engine calls after the transaction commits.

 User input model:
   - Text fields are validated with helpers in validation.hpp.
   - Prompts return InputCtl:
       * Back  -> cancel current action and return to the menu
       * Exit  -> leave the app (we set choice = 0 and break)

 Configuration:
   - ALE_* environment variables, see config.hpp.
-------------------------------------------------------------------------------
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include "config.hpp"
#include "engine.hpp"
#include "log.hpp"
#include "refunds.hpp"
#include "reports.hpp"
#include "validation.hpp"
using namespace std;         // OK for this small console app; avoid in headers

namespace {

// Notification and revenue collaborators, stood in for by stdout.
class ConsoleListener : public EngineListener {
public:
    void on_certificate_issued(const Certificate& cert) override {
        cout << "  ** " << certificate_type_name(cert.type) << " certificate issued to "
            << cert.student_id << " for " << cert.course_id << "\n"
            << "     " << cert.url << "\n";
    }
    void on_dropout_recorded(const DropoutRecord& rec) override {
        cout << "  ** refund liability " << format_cents(rec.refund_amount_cents)
            << " posted for " << rec.student_id << "/" << rec.course_id << "\n";
    }
};

void show_welcome() {
    cout << "=====================================================\n";
    cout << "                        WELCOME                      \n";
    cout << "=====================================================\n";
    cout << "              Academic Lifecycle Console             \n";
    cout << "-----------------------------------------------------\n";
    cout << "   Enrollment - Progress - Certificates - Refunds    \n";
    cout << "=====================================================\n\n";
}

void report_failure(EngineStatus s) {
    cout << "Failed: " << status_message(s) << ".\n";
}

} // namespace

//-----------------------------------------
int main() {
    show_welcome();

    EngineConfig config;
    try {
        config = EngineConfig::loadFromEnv();
    }
    catch (const std::exception& e) {
        cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }
    log_set_level(config.log_level);

    // --- Database bootstrap -------------------------------------------------
    std::unique_ptr<ConnectionPool> pool;
    try {
        pool = std::make_unique<ConnectionPool>(config.db_path, config.pool_size, config.busy_timeout_ms);
    }
    catch (const std::exception& e) {
        cerr << "Could not open database: " << e.what() << "\n";
        return 1;
    }

    SystemClock clock;
    ConsoleListener listener;
    LifecycleEngine engine(*pool, clock, config.completion_threshold, &listener);

    // Schema and reference data on first run; bail out on a partial schema.
    if (!engine.init_schema(true) || !engine.load_policy()) {
        cerr << "Could not initialize database.\n";
        return 1;
    }

    // --- Menu loop ----------------------------------------------------------
    int choice = -1;

    // Reset the cin state and discard the rest of the current line.
    auto clear_input = [] {
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        };

    while (choice != 0) {
        DbCounts counts;
        if (!engine.counts(counts)) counts = DbCounts{};

        std::cout
            << "=====================================================\n"
            << "                      MAIN MENU                      \n"
            << "=====================================================\n"
            << "  Courses: " << counts.courses
            << "  Enrolled: " << counts.enrollments
            << "  Certificates: " << counts.certificates
            << "  Dropouts: " << counts.dropouts << "\n"
            << "-----------------------------------------------------\n"
            << " CATALOG:                                            \n"
            << "  [1]  View courses        [2]  Add course           \n"
            << "-----------------------------------------------------\n"
            << " STUDENTS:                                           \n"
            << "  [3]  Enroll student      [4]  View enrollments     \n"
            << "  [5]  Lesson completed    [6]  Assignment submitted \n"
            << "  [7]  View progress       [8]  View certificates    \n"
            << "  [9]  Issue merit award                             \n"
            << "-----------------------------------------------------\n"
            << " WITHDRAWAL / ADVANCEMENT:                           \n"
            << "  [10] Withdraw student    [11] View dropout records \n"
            << "  [12] Check semester advancement                    \n"
            << "-----------------------------------------------------\n"
            << "  [0]  EXIT                                          \n"
            << "=====================================================\n"
            << "  CHOICE: ";

        if (!(std::cin >> choice)) {
            if (std::cin.eof()) break;
            clear_input();
            continue;
        }

        // Always clear the trailing newline before using getline()-style prompts.
        clear_input();

        // ---- 1) View courses -----------------------------------------------
        if (choice == 1) {
            std::vector<Course> courses;
            if (engine.courses(courses)) print_courses(std::cout, courses);
            else std::cout << "Could not read the catalog.\n";
        }

        // ---- 2) Add course -------------------------------------------------
        else if (choice == 2) {
            Course c;
            double price = 0;

            auto a = prompt_until_valid_or_back("Code (e.g. DSA101)", c.code, is_valid_course_code,
                "Invalid code. 3 letters + 3 digits.");
            if (a == InputCtl::Back) continue;
            if (a == InputCtl::Exit) { choice = 0; break; }

            auto b = prompt_until_valid_or_back("Title", c.title, is_non_empty_short, "Title required (max 60).");
            if (b == InputCtl::Back) continue;
            if (b == InputCtl::Exit) { choice = 0; break; }

            auto p = prompt_number_or_back("Price", price, 0, 1000000);
            if (p == InputCtl::Back) continue;
            if (p == InputCtl::Exit) { choice = 0; break; }

            auto l = prompt_int_or_back("Total lessons", c.total_lessons, 0, 1000);
            if (l == InputCtl::Back) continue;
            if (l == InputCtl::Exit) { choice = 0; break; }

            auto s = prompt_int_or_back("Total assignments", c.total_assignments, 0, 1000);
            if (s == InputCtl::Back) continue;
            if (s == InputCtl::Exit) { choice = 0; break; }

            auto d = prompt_int_or_back("Duration in days", c.duration_days, 1, 3650);
            if (d == InputCtl::Back) continue;
            if (d == InputCtl::Exit) { choice = 0; break; }

            c.price_cents = std::llround(price * 100.0);

            if (engine.add_course(c)) std::cout << "Course added.\n";
            else std::cout << "Could not add course (duplicate code or DB error).\n";
        }

        // ---- 3) Enroll -----------------------------------------------------
        else if (choice == 3) {
            std::string r, code;

            auto p1 = prompt_until_valid_or_back("Student id (e.g. S001)", r, is_valid_student_id, "Invalid student id.");
            if (p1 == InputCtl::Back) continue;
            if (p1 == InputCtl::Exit) { choice = 0; break; }

            auto p2 = prompt_until_valid_or_back("Course Code", code, is_valid_course_code, "Invalid code.");
            if (p2 == InputCtl::Back) continue;
            if (p2 == InputCtl::Exit) { choice = 0; break; }

            Enrollment e;
            EngineStatus st = engine.enroll(r, code, e);
            if (st == EngineStatus::Ok) std::cout << "Enrolled " << r << " in " << code
                << " on " << format_date(e.enrolled_at) << ".\n";
            else report_failure(st);
        }

        // ---- 4) View enrollments ------------------------------------------
        else if (choice == 4) {
            std::string r;
            auto p1 = prompt_until_valid_or_back("Student id", r, is_valid_student_id, "Invalid student id.");
            if (p1 == InputCtl::Back) continue;
            if (p1 == InputCtl::Exit) { choice = 0; break; }

            std::vector<Enrollment> rows;
            EngineStatus st = engine.enrollments_for(r, rows);
            if (st == EngineStatus::Ok) print_enrollments(std::cout, rows);
            else report_failure(st);
        }

        // ---- 5/6) Lesson completed / assignment submitted ------------------
        else if (choice == 5 || choice == 6) {
            bool lesson = (choice == 5);
            std::string r, code, item;

            auto p1 = prompt_until_valid_or_back("Student id", r, is_valid_student_id, "Invalid student id.");
            if (p1 == InputCtl::Back) continue;
            if (p1 == InputCtl::Exit) { choice = 0; break; }

            auto p2 = prompt_until_valid_or_back("Course Code", code, is_valid_course_code, "Invalid code.");
            if (p2 == InputCtl::Back) continue;
            if (p2 == InputCtl::Exit) { choice = 0; break; }

            auto p3 = prompt_until_valid_or_back(lesson ? "Lesson id" : "Assignment id", item,
                is_valid_item_id, "Letters, digits, '-' or '_' (max 20).");
            if (p3 == InputCtl::Back) continue;
            if (p3 == InputCtl::Exit) { choice = 0; break; }

            ProgressRecord rec;
            EngineStatus st = lesson
                ? engine.record_lesson_completion(r, code, item, rec)
                : engine.record_assignment_submission(r, code, item, rec);
            if (st == EngineStatus::Ok) print_progress(std::cout, rec);
            else report_failure(st);
        }

        // ---- 7) View progress ---------------------------------------------
        else if (choice == 7) {
            std::string r, code;

            auto p1 = prompt_until_valid_or_back("Student id", r, is_valid_student_id, "Invalid student id.");
            if (p1 == InputCtl::Back) continue;
            if (p1 == InputCtl::Exit) { choice = 0; break; }

            auto p2 = prompt_until_valid_or_back("Course Code", code, is_valid_course_code, "Invalid code.");
            if (p2 == InputCtl::Back) continue;
            if (p2 == InputCtl::Exit) { choice = 0; break; }

            ProgressRecord rec;
            EngineStatus st = engine.progress(r, code, rec);
            if (st == EngineStatus::Ok) print_progress(std::cout, rec);
            else report_failure(st);
        }

        // ---- 8) View certificates -----------------------------------------
        else if (choice == 8) {
            std::string r;
            auto p1 = prompt_until_valid_or_back("Student id", r, is_valid_student_id, "Invalid student id.");
            if (p1 == InputCtl::Back) continue;
            if (p1 == InputCtl::Exit) { choice = 0; break; }

            std::vector<Certificate> certs;
            EngineStatus st = engine.certificates_for(r, certs);
            if (st == EngineStatus::Ok) print_certificates(std::cout, certs);
            else report_failure(st);
        }

        // ---- 9) Merit award ------------------------------------------------
        else if (choice == 9) {
            std::string r, code;
            int kind = 1;

            auto p1 = prompt_until_valid_or_back("Student id", r, is_valid_student_id, "Invalid student id.");
            if (p1 == InputCtl::Back) continue;
            if (p1 == InputCtl::Exit) { choice = 0; break; }

            auto p2 = prompt_until_valid_or_back("Course Code", code, is_valid_course_code, "Invalid code.");
            if (p2 == InputCtl::Back) continue;
            if (p2 == InputCtl::Exit) { choice = 0; break; }

            auto p3 = prompt_int_or_back("Award (1=Excellence, 2=Proficiency)", kind, 1, 2);
            if (p3 == InputCtl::Back) continue;
            if (p3 == InputCtl::Exit) { choice = 0; break; }

            Certificate cert;
            AwardType award = kind == 1 ? AwardType::Excellence : AwardType::Proficiency;
            EngineStatus st = engine.issue_award(r, code, award, cert);
            if (st == EngineStatus::Ok) std::cout << "Award on record: " << cert.url << "\n";
            else report_failure(st);
        }

        // ---- 10) Withdraw --------------------------------------------------
        else if (choice == 10) {
            std::string r, code, reason;

            auto p1 = prompt_until_valid_or_back("Student id", r, is_valid_student_id, "Invalid student id.");
            if (p1 == InputCtl::Back) continue;
            if (p1 == InputCtl::Exit) { choice = 0; break; }

            auto p2 = prompt_until_valid_or_back("Course Code", code, is_valid_course_code, "Invalid code.");
            if (p2 == InputCtl::Back) continue;
            if (p2 == InputCtl::Exit) { choice = 0; break; }

            auto p3 = prompt_until_valid_or_back("Reason", reason, is_valid_reason, "Max 120 characters.");
            if (p3 == InputCtl::Back) continue;
            if (p3 == InputCtl::Exit) { choice = 0; break; }

            // The withdrawal cannot be undone: ask before removing the enrollment.
            auto c = confirm_or_back("Withdraw " + r + " from " + code + "?");
            if (c == InputCtl::Back) continue;
            if (c == InputCtl::Exit) { choice = 0; break; }

            DropoutRecord rec;
            EngineStatus st = engine.withdraw(r, code, reason, rec);
            if (st == EngineStatus::Ok) print_dropout(std::cout, rec);
            else report_failure(st);
        }

        // ---- 11) Dropout records ------------------------------------------
        else if (choice == 11) {
            std::string r;
            auto p1 = prompt_until_valid_or_back("Student id", r, is_valid_student_id, "Invalid student id.");
            if (p1 == InputCtl::Back) continue;
            if (p1 == InputCtl::Exit) { choice = 0; break; }

            std::vector<DropoutRecord> rows;
            EngineStatus st = engine.dropouts_for(r, rows);
            if (st == EngineStatus::Ok) print_dropouts(std::cout, rows);
            else report_failure(st);
        }

        // ---- 12) Semester advancement -------------------------------------
        else if (choice == 12) {
            std::string code;
            int semester = 1, credits = 0;
            double gpa = 0;

            auto p1 = prompt_until_valid_or_back("Course Code", code, is_valid_course_code, "Invalid code.");
            if (p1 == InputCtl::Back) continue;
            if (p1 == InputCtl::Exit) { choice = 0; break; }

            auto p2 = prompt_int_or_back("Current semester", semester, 1, 12);
            if (p2 == InputCtl::Back) continue;
            if (p2 == InputCtl::Exit) { choice = 0; break; }

            auto p3 = prompt_int_or_back("Credits earned", credits, 0, 400);
            if (p3 == InputCtl::Back) continue;
            if (p3 == InputCtl::Exit) { choice = 0; break; }

            auto p4 = prompt_number_or_back("GPA", gpa, 0, 10);
            if (p4 == InputCtl::Back) continue;
            if (p4 == InputCtl::Exit) { choice = 0; break; }

            AdvancementDecision d;
            EngineStatus st = engine.can_advance(code, semester, credits, gpa, d);
            if (st == EngineStatus::Ok) print_decision(std::cout, d);
            else report_failure(st);
        }

        // ---- Unknown option guard -----------------------------------------
        else if (choice != 0) {
            std::cout << "Unknown option.\n";
        }
    }

    // Pool closes its connections on destruction.
    return 0;
}
