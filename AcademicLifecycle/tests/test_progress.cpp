#include "test_support.hpp"
#include "progress.hpp"

TEST(PercentageTest, Formula) {
    EXPECT_DOUBLE_EQ(compute_percentage(10, 9, 0, 0), 90.0);
    EXPECT_DOUBLE_EQ(compute_percentage(12, 12, 4, 4), 100.0);
    EXPECT_DOUBLE_EQ(compute_percentage(12, 6, 4, 2), 50.0);
    EXPECT_DOUBLE_EQ(compute_percentage(3, 1, 0, 0), 33.33);
    EXPECT_DOUBLE_EQ(compute_percentage(3, 2, 0, 0), 66.67);
}

TEST(PercentageTest, ZeroTotalsGiveZero) {
    EXPECT_DOUBLE_EQ(compute_percentage(0, 0, 0, 0), 0.0);
    EXPECT_DOUBLE_EQ(compute_percentage(0, 5, 0, 1), 0.0);
}

TEST(PercentageTest, ClampedWhenCountsExceedTotals) {
    EXPECT_DOUBLE_EQ(compute_percentage(5, 8, 0, 0), 100.0);
}

TEST(PercentageTest, SurplusOfOneKindDoesNotCoverTheOther) {
    EXPECT_DOUBLE_EQ(compute_percentage(12, 15, 4, 0), 75.0);
    EXPECT_DOUBLE_EQ(compute_percentage(12, 0, 4, 9), 25.0);
    EXPECT_DOUBLE_EQ(compute_percentage(12, 15, 4, 4), 100.0);
}

TEST(PercentageTest, DeriveRejectsNegativeCounts) {
    log_set_level(LogLevel::Error);
    ProgressRecord rec;
    rec.total_lessons = 10;
    rec.completed_lessons = -1;
    EXPECT_EQ(derive_percentage(rec), EngineStatus::InvariantViolation);

    rec.completed_lessons = 4;
    ASSERT_EQ(derive_percentage(rec), EngineStatus::Ok);
    EXPECT_DOUBLE_EQ(rec.percentage, 40.0);
}

class ProgressTest : public EngineFixture {};

TEST_F(ProgressTest, LessonsAndAssignmentsCountTogether) {
    enroll("S001", "LIN101");    // 12 lessons, 4 assignments
    ProgressRecord rec;
    ASSERT_EQ(engine_->record_lesson_completion("S001", "LIN101", "L1", rec), EngineStatus::Ok);
    ASSERT_EQ(engine_->record_assignment_submission("S001", "LIN101", "A1", rec), EngineStatus::Ok);
    EXPECT_EQ(rec.completed_lessons, 1);
    EXPECT_EQ(rec.submitted_assignments, 1);
    EXPECT_EQ(rec.total_lessons, 12);
    EXPECT_EQ(rec.total_assignments, 4);
    EXPECT_DOUBLE_EQ(rec.percentage, 12.5);
}

TEST_F(ProgressTest, RepeatedEventDoesNotChangeRecord) {
    enroll("S001", "DSA101");
    ProgressRecord first;
    ASSERT_EQ(engine_->record_lesson_completion("S001", "DSA101", "L1", first), EngineStatus::Ok);

    clock_.advance_days(1);
    ProgressRecord again;
    ASSERT_EQ(engine_->record_lesson_completion("S001", "DSA101", "L1", again), EngineStatus::Ok);
    EXPECT_EQ(again.completed_lessons, 1);
    EXPECT_DOUBLE_EQ(again.percentage, first.percentage);
    EXPECT_EQ(again.last_updated, first.last_updated);

    ProgressRecord stored;
    ASSERT_EQ(engine_->progress("S001", "DSA101", stored), EngineStatus::Ok);
    EXPECT_EQ(stored.completed_lessons, 1);
    EXPECT_DOUBLE_EQ(stored.percentage, 10.0);
}

TEST_F(ProgressTest, EventForUnenrolledPairIsRejected) {
    ProgressRecord rec;
    EXPECT_EQ(engine_->record_lesson_completion("S009", "DSA101", "L1", rec), EngineStatus::NotEnrolled);
    EXPECT_EQ(engine_->record_assignment_submission("S009", "LIN101", "A1", rec), EngineStatus::NotEnrolled);
    EXPECT_EQ(engine_->progress("S009", "DSA101", rec), EngineStatus::NotEnrolled);
}

TEST_F(ProgressTest, EnrolledPairWithoutActivityReadsZero) {
    enroll("S001", "LIN101");
    ProgressRecord rec;
    ASSERT_EQ(engine_->progress("S001", "LIN101", rec), EngineStatus::Ok);
    EXPECT_EQ(rec.completed_lessons, 0);
    EXPECT_EQ(rec.total_lessons, 12);
    EXPECT_DOUBLE_EQ(rec.percentage, 0.0);
}

TEST_F(ProgressTest, CourseWithoutItemsStaysAtZero) {
    enroll("S001", "CSE100");    // no lessons, no assignments
    ProgressRecord rec;
    ASSERT_EQ(engine_->record_lesson_completion("S001", "CSE100", "L1", rec), EngineStatus::Ok);
    EXPECT_DOUBLE_EQ(rec.percentage, 0.0);
    EXPECT_EQ(completion_count("S001", "CSE100"), 0);
}

TEST_F(ProgressTest, ExtraLessonsClampAtHundred) {
    add_course("TIN100", 1000, 2, 0, 30);
    enroll("S001", "TIN100");
    complete_lessons("S001", "TIN100", 1, 3);
    ProgressRecord rec;
    ASSERT_EQ(engine_->progress("S001", "TIN100", rec), EngineStatus::Ok);
    EXPECT_EQ(rec.completed_lessons, 3);
    EXPECT_DOUBLE_EQ(rec.percentage, 100.0);
}

TEST_F(ProgressTest, CatalogChangeIsPickedUpOnNextEvent) {
    add_course("GRW100", 1000, 4, 0, 30);
    enroll("S001", "GRW100");
    complete_lessons("S001", "GRW100", 1, 2);

    Course c;
    ASSERT_EQ(engine_->course("GRW100", c), EngineStatus::Ok);
    c.total_lessons = 8;
    ASSERT_TRUE(engine_->update_course(c));

    ProgressRecord rec;
    ASSERT_EQ(engine_->record_lesson_completion("S001", "GRW100", "L2", rec), EngineStatus::Ok);
    EXPECT_EQ(rec.total_lessons, 8);
    EXPECT_DOUBLE_EQ(rec.percentage, 25.0);
}

TEST_F(ProgressTest, ProgressKeptAfterWithdrawal) {
    enroll("S001", "DSA101");
    complete_lessons("S001", "DSA101", 1, 3);
    DropoutRecord drop;
    ASSERT_EQ(engine_->withdraw("S001", "DSA101", "", drop), EngineStatus::Ok);

    ProgressRecord rec;
    ASSERT_EQ(engine_->progress("S001", "DSA101", rec), EngineStatus::Ok);
    EXPECT_EQ(rec.completed_lessons, 3);
    EXPECT_EQ(engine_->record_lesson_completion("S001", "DSA101", "L4", rec), EngineStatus::NotEnrolled);
}

TEST_F(ProgressTest, ExtraLessonsDoNotReplaceAssignments) {
    enroll("S001", "LIN101");    // 12 lessons, 4 assignments
    complete_lessons("S001", "LIN101", 1, 15);

    ProgressRecord rec;
    ASSERT_EQ(engine_->progress("S001", "LIN101", rec), EngineStatus::Ok);
    EXPECT_EQ(rec.completed_lessons, 15);
    EXPECT_EQ(rec.submitted_assignments, 0);
    EXPECT_DOUBLE_EQ(rec.percentage, 75.0);
    EXPECT_EQ(completion_count("S001", "LIN101"), 0);

    // Two real submissions: (12 + 2) / 16 = 87.5, still short.
    ASSERT_EQ(engine_->record_assignment_submission("S001", "LIN101", "A1", rec), EngineStatus::Ok);
    ASSERT_EQ(engine_->record_assignment_submission("S001", "LIN101", "A2", rec), EngineStatus::Ok);
    EXPECT_DOUBLE_EQ(rec.percentage, 87.5);
    EXPECT_EQ(completion_count("S001", "LIN101"), 0);

    ASSERT_EQ(engine_->record_assignment_submission("S001", "LIN101", "A3", rec), EngineStatus::Ok);
    EXPECT_DOUBLE_EQ(rec.percentage, 93.75);
    EXPECT_EQ(completion_count("S001", "LIN101"), 1);
}
