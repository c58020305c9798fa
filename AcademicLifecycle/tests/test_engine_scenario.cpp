#include "test_support.hpp"
#include "refunds.hpp"
#include "reports.hpp"
#include <sstream>

class ScenarioTest : public EngineFixture {};

// Enroll, study to the threshold, withdraw: one certificate and a 90% refund.
TEST_F(ScenarioTest, StudyThenWithdraw) {
    add_course("ALG200", 100000, 10, 0, 180);
    enroll("S001", "ALG200");

    ProgressRecord rec;
    for (int i = 1; i <= 9; ++i) {
        clock_.advance_days(1);
        ASSERT_EQ(engine_->record_lesson_completion("S001", "ALG200", "L" + std::to_string(i), rec),
            EngineStatus::Ok);
    }
    EXPECT_DOUBLE_EQ(rec.percentage, 90.0);
    EXPECT_EQ(completion_count("S001", "ALG200"), 1);

    clock_.set(kStart + 40 * kSecondsPerDay);
    DropoutRecord drop;
    ASSERT_EQ(engine_->withdraw("S001", "ALG200", "schedule conflict", drop), EngineStatus::Ok);
    EXPECT_EQ(drop.completed_duration, 40);
    EXPECT_EQ(drop.refund_percentage, 90);
    EXPECT_EQ(drop.refund_amount_cents, 90000);
    EXPECT_EQ(format_cents(drop.refund_amount_cents), "900.00");

    Enrollment e;
    EXPECT_EQ(engine_->lookup("S001", "ALG200", e), EngineStatus::NotEnrolled);

    std::vector<Certificate> certs;
    ASSERT_EQ(engine_->certificates_for("S001", certs), EngineStatus::Ok);
    EXPECT_EQ(certs.size(), 1u);

    auto announced = listener_.dropouts();
    ASSERT_EQ(announced.size(), 1u);
    EXPECT_EQ(announced[0].refund_amount_cents, 90000);

    DbCounts counts;
    ASSERT_TRUE(engine_->counts(counts));
    EXPECT_EQ(counts.enrollments, 0);
    EXPECT_EQ(counts.certificates, 1);
    EXPECT_EQ(counts.dropouts, 1);
}

// A failure after the dropout insert must leave neither the record nor a
// missing enrollment behind.
TEST_F(ScenarioTest, WithdrawalIsAllOrNothing) {
    enroll("S001", "DSA101");
    clock_.advance_days(12);

    sqlite3* db = nullptr;
    ASSERT_TRUE(db_open(db, path_, 5000));
    ASSERT_TRUE(db_exec(db,
        "CREATE TRIGGER block_enrollment_delete BEFORE DELETE ON enrollments"
        " BEGIN SELECT RAISE(ABORT, 'blocked'); END;"));

    DropoutRecord rec;
    EXPECT_EQ(engine_->withdraw("S001", "DSA101", "", rec), EngineStatus::StorageError);

    std::vector<DropoutRecord> rows;
    ASSERT_EQ(engine_->dropouts_for("S001", rows), EngineStatus::Ok);
    EXPECT_TRUE(rows.empty());
    Enrollment e;
    EXPECT_EQ(engine_->lookup("S001", "DSA101", e), EngineStatus::Ok);
    EXPECT_TRUE(listener_.dropouts().empty());

    ASSERT_TRUE(db_exec(db, "DROP TRIGGER block_enrollment_delete;"));
    db_close(db);

    ASSERT_EQ(engine_->withdraw("S001", "DSA101", "", rec), EngineStatus::Ok);
    EXPECT_EQ(rec.completed_duration, 12);
}

// A failing certificate insert rolls the progress update back with it.
TEST_F(ScenarioTest, CertificateFailureRollsBackProgress) {
    enroll("S001", "DSA101");
    complete_lessons("S001", "DSA101", 1, 8);

    sqlite3* db = nullptr;
    ASSERT_TRUE(db_open(db, path_, 5000));
    ASSERT_TRUE(db_exec(db,
        "CREATE TRIGGER block_certificates BEFORE INSERT ON certificates"
        " BEGIN SELECT RAISE(ABORT, 'blocked'); END;"));

    ProgressRecord rec;
    EXPECT_NE(engine_->record_lesson_completion("S001", "DSA101", "L9", rec), EngineStatus::Ok);

    ASSERT_EQ(engine_->progress("S001", "DSA101", rec), EngineStatus::Ok);
    EXPECT_EQ(rec.completed_lessons, 8);
    EXPECT_DOUBLE_EQ(rec.percentage, 80.0);

    ASSERT_TRUE(db_exec(db, "DROP TRIGGER block_certificates;"));
    db_close(db);

    ASSERT_EQ(engine_->record_lesson_completion("S001", "DSA101", "L9", rec), EngineStatus::Ok);
    EXPECT_EQ(completion_count("S001", "DSA101"), 1);
}

// Another writer holds the database lock: the operation reports Busy,
// changes nothing, and succeeds unchanged once the lock is gone.
TEST_F(ScenarioTest, LockedDatabaseReportsBusy) {
    ConnectionPool impatient_pool(path_, 1, 0);
    LifecycleEngine impatient(impatient_pool, clock_, 90.0, &listener_);

    sqlite3* writer = nullptr;
    ASSERT_TRUE(db_open(writer, path_, 5000));
    ASSERT_TRUE(db_exec(writer, "BEGIN IMMEDIATE;"));

    Enrollment e;
    EngineStatus s = impatient.enroll("S001", "DSA101", e);
    EXPECT_EQ(s, EngineStatus::Busy);
    EXPECT_TRUE(is_retryable(s));

    ASSERT_TRUE(db_exec(writer, "ROLLBACK;"));
    db_close(writer);

    EXPECT_EQ(engine_->lookup("S001", "DSA101", e), EngineStatus::NotEnrolled);
    DbCounts counts;
    ASSERT_TRUE(engine_->counts(counts));
    EXPECT_EQ(counts.enrollments, 0);

    ASSERT_EQ(impatient.enroll("S001", "DSA101", e), EngineStatus::Ok);
    EXPECT_EQ(engine_->lookup("S001", "DSA101", e), EngineStatus::Ok);
}

TEST_F(ScenarioTest, StatusMessagesHideInternals) {
    EXPECT_STREQ(status_message(EngineStatus::InvariantViolation), "internal error");
    EXPECT_STREQ(status_message(EngineStatus::StorageError), "internal error");
    EXPECT_STREQ(status_name(EngineStatus::NoPolicyDefined), "NoPolicyDefined");
    EXPECT_TRUE(is_retryable(EngineStatus::Busy));
    EXPECT_FALSE(is_retryable(EngineStatus::NotEnrolled));
}

TEST_F(ScenarioTest, ReportsRenderRecords) {
    enroll("S001", "DSA101");
    clock_.advance_days(30);
    DropoutRecord rec;
    ASSERT_EQ(engine_->withdraw("S001", "DSA101", "moving", rec), EngineStatus::Ok);

    std::ostringstream os;
    print_dropout(os, rec);
    EXPECT_EQ(os.str(), "S001 left DSA101 on 2026-01-31 | day 30 of 180 | refund 90% = 900.00 | moving\n");

    std::ostringstream empty;
    print_certificates(empty, {});
    EXPECT_EQ(empty.str(), "No certificates.\n");
}
