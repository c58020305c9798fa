#include "test_support.hpp"
#include "certificates.hpp"

TEST(CertificateUrlTest, Deterministic) {
    std::string a = make_certificate_url("S001", "DSA101", CertificateType::Completion, kStart);
    std::string b = make_certificate_url("S001", "DSA101", CertificateType::Completion, kStart);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.rfind("/certs/S001_DSA101_Completion_20260101T000000Z_", 0), 0u);
    EXPECT_EQ(a.substr(a.size() - 4), ".pdf");
}

TEST(CertificateUrlTest, DiffersByInput) {
    std::string base = make_certificate_url("S001", "DSA101", CertificateType::Completion, kStart);
    EXPECT_NE(base, make_certificate_url("S002", "DSA101", CertificateType::Completion, kStart));
    EXPECT_NE(base, make_certificate_url("S001", "LIN101", CertificateType::Completion, kStart));
    EXPECT_NE(base, make_certificate_url("S001", "DSA101", CertificateType::Excellence, kStart));
    EXPECT_NE(base, make_certificate_url("S001", "DSA101", CertificateType::Completion, kStart + 1));
}

TEST(CertificateTypeTest, NamesParseBack) {
    for (auto t : { CertificateType::Completion, CertificateType::Excellence, CertificateType::Proficiency }) {
        CertificateType parsed;
        ASSERT_TRUE(parse_certificate_type(certificate_type_name(t), parsed));
        EXPECT_EQ(parsed, t);
    }
    CertificateType parsed;
    EXPECT_FALSE(parse_certificate_type("Diploma", parsed));
}

TEST(CrossingTest, OnlyUpwardCrossing) {
    EXPECT_TRUE(crossed_threshold(80.0, 90.0, 90.0));
    EXPECT_TRUE(crossed_threshold(0.0, 100.0, 90.0));
    EXPECT_FALSE(crossed_threshold(90.0, 100.0, 90.0));
    EXPECT_FALSE(crossed_threshold(80.0, 89.99, 90.0));
    EXPECT_FALSE(crossed_threshold(95.0, 85.0, 90.0));
}

class CertificateTest : public EngineFixture {};

TEST_F(CertificateTest, IssuedOnceAtThreshold) {
    enroll("S001", "DSA101");    // 10 lessons
    complete_lessons("S001", "DSA101", 1, 8);
    EXPECT_EQ(completion_count("S001", "DSA101"), 0);

    clock_.advance_days(20);
    complete_lessons("S001", "DSA101", 9, 9);
    EXPECT_EQ(completion_count("S001", "DSA101"), 1);

    complete_lessons("S001", "DSA101", 10, 10);
    complete_lessons("S001", "DSA101", 9, 10);
    EXPECT_EQ(completion_count("S001", "DSA101"), 1);

    auto announced = listener_.certificates();
    ASSERT_EQ(announced.size(), 1u);
    EXPECT_EQ(announced[0].type, CertificateType::Completion);
    EXPECT_EQ(announced[0].issued_at, kStart + 20 * kSecondsPerDay);
    EXPECT_EQ(announced[0].url,
        make_certificate_url("S001", "DSA101", CertificateType::Completion, kStart + 20 * kSecondsPerDay));
}

TEST_F(CertificateTest, JumpPastThresholdIssuesOne) {
    add_course("TWO100", 1000, 2, 0, 30);
    enroll("S001", "TWO100");
    complete_lessons("S001", "TWO100", 1, 1);     // 50
    complete_lessons("S001", "TWO100", 2, 2);     // 100
    EXPECT_EQ(completion_count("S001", "TWO100"), 1);
}

TEST_F(CertificateTest, NotReissuedAfterTotalsGrowAndShrink) {
    add_course("VAR100", 1000, 10, 0, 30);
    enroll("S001", "VAR100");
    complete_lessons("S001", "VAR100", 1, 9);
    ASSERT_EQ(completion_count("S001", "VAR100"), 1);

    // Lessons added to the course: the pair drops below the threshold.
    Course c;
    ASSERT_EQ(engine_->course("VAR100", c), EngineStatus::Ok);
    c.total_lessons = 20;
    ASSERT_TRUE(engine_->update_course(c));
    complete_lessons("S001", "VAR100", 10, 10);

    // And climbs back over it.
    complete_lessons("S001", "VAR100", 11, 18);
    EXPECT_EQ(completion_count("S001", "VAR100"), 1);
    EXPECT_EQ(listener_.certificates().size(), 1u);
}

TEST_F(CertificateTest, LowerThresholdFromConfiguration) {
    LifecycleEngine lenient(*pool_, clock_, 50.0, &listener_);
    ASSERT_TRUE(lenient.load_policy());
    Enrollment e;
    ASSERT_EQ(lenient.enroll("S001", "DSA101", e), EngineStatus::Ok);
    ProgressRecord rec;
    for (int i = 1; i <= 5; ++i)
        ASSERT_EQ(lenient.record_lesson_completion("S001", "DSA101", "L" + std::to_string(i), rec),
            EngineStatus::Ok);
    EXPECT_EQ(completion_count("S001", "DSA101"), 1);
}

TEST_F(CertificateTest, AwardsAreIdempotentPerType) {
    enroll("S001", "DSA101");
    Certificate first;
    ASSERT_EQ(engine_->issue_award("S001", "DSA101", AwardType::Excellence, first), EngineStatus::Ok);
    EXPECT_EQ(first.type, CertificateType::Excellence);

    clock_.advance_days(1);
    Certificate second;
    ASSERT_EQ(engine_->issue_award("S001", "DSA101", AwardType::Excellence, second), EngineStatus::Ok);
    EXPECT_EQ(second.url, first.url);
    EXPECT_EQ(second.issued_at, first.issued_at);

    Certificate prof;
    ASSERT_EQ(engine_->issue_award("S001", "DSA101", AwardType::Proficiency, prof), EngineStatus::Ok);

    std::vector<Certificate> certs;
    ASSERT_EQ(engine_->certificates_for("S001", certs), EngineStatus::Ok);
    EXPECT_EQ(certs.size(), 2u);
    EXPECT_EQ(listener_.certificates().size(), 2u);
}

TEST_F(CertificateTest, AwardNeedsEnrollmentOrCompletion) {
    Certificate cert;
    EXPECT_EQ(engine_->issue_award("S001", "DSA101", AwardType::Proficiency, cert), EngineStatus::NotEnrolled);

    enroll("S001", "DSA101");
    complete_lessons("S001", "DSA101", 1, 9);
    DropoutRecord drop;
    ASSERT_EQ(engine_->withdraw("S001", "DSA101", "", drop), EngineStatus::Ok);

    // Completed before leaving: still eligible.
    EXPECT_EQ(engine_->issue_award("S001", "DSA101", AwardType::Excellence, cert), EngineStatus::Ok);
}
