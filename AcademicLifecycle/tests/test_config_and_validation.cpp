#include <gtest/gtest.h>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include "config.hpp"
#include "log.hpp"
#include "validation.hpp"

namespace {

void clear_env() {
    for (const char* name : { "ALE_DB_PATH", "ALE_POOL_SIZE", "ALE_BUSY_TIMEOUT_MS",
        "ALE_COMPLETION_THRESHOLD", "ALE_LOG_LEVEL" })
        unsetenv(name);
}

} // namespace

TEST(ConfigTest, DefaultsWhenUnset) {
    clear_env();
    EngineConfig c = EngineConfig::loadFromEnv();
    EXPECT_EQ(c.db_path, "academic.db");
    EXPECT_EQ(c.pool_size, 4);
    EXPECT_EQ(c.busy_timeout_ms, 5000);
    EXPECT_DOUBLE_EQ(c.completion_threshold, 90.0);
    EXPECT_EQ(c.log_level, LogLevel::Info);
}

TEST(ConfigTest, ReadsEnvironment) {
    clear_env();
    setenv("ALE_DB_PATH", "/tmp/other.db", 1);
    setenv("ALE_POOL_SIZE", "8", 1);
    setenv("ALE_COMPLETION_THRESHOLD", "75.5", 1);
    setenv("ALE_LOG_LEVEL", "debug", 1);
    EngineConfig c = EngineConfig::loadFromEnv();
    EXPECT_EQ(c.db_path, "/tmp/other.db");
    EXPECT_EQ(c.pool_size, 8);
    EXPECT_DOUBLE_EQ(c.completion_threshold, 75.5);
    EXPECT_EQ(c.log_level, LogLevel::Debug);
    clear_env();
}

TEST(ConfigTest, RejectsMalformedValues) {
    clear_env();
    setenv("ALE_POOL_SIZE", "four", 1);
    EXPECT_THROW(EngineConfig::loadFromEnv(), std::runtime_error);
    setenv("ALE_POOL_SIZE", "0", 1);
    EXPECT_THROW(EngineConfig::loadFromEnv(), std::runtime_error);
    clear_env();
    setenv("ALE_COMPLETION_THRESHOLD", "120", 1);
    EXPECT_THROW(EngineConfig::loadFromEnv(), std::runtime_error);
    clear_env();
    setenv("ALE_LOG_LEVEL", "LOUD", 1);
    EXPECT_THROW(EngineConfig::loadFromEnv(), std::runtime_error);
    clear_env();
}

TEST(LogTest, ParseLevels) {
    LogLevel level;
    ASSERT_TRUE(parse_log_level("WARN", level));
    EXPECT_EQ(level, LogLevel::Warn);
    ASSERT_TRUE(parse_log_level("error", level));
    EXPECT_EQ(level, LogLevel::Error);
    EXPECT_FALSE(parse_log_level("verbose", level));

    LogLevel before = log_get_level();
    log_set_level(LogLevel::Warn);
    EXPECT_EQ(log_get_level(), LogLevel::Warn);
    log_set_level(before);
}

TEST(ValidationTest, Identifiers) {
    EXPECT_TRUE(is_valid_student_id("S001"));
    EXPECT_TRUE(is_valid_student_id("S123456"));
    EXPECT_FALSE(is_valid_student_id("S01"));
    EXPECT_FALSE(is_valid_student_id("X001"));

    EXPECT_TRUE(is_valid_course_code("DSA101"));
    EXPECT_FALSE(is_valid_course_code("dsa101"));
    EXPECT_FALSE(is_valid_course_code("DSA10"));

    EXPECT_TRUE(is_valid_item_id("lesson-01_a"));
    EXPECT_FALSE(is_valid_item_id(""));
    EXPECT_FALSE(is_valid_item_id("has space"));
}

TEST(ValidationTest, TextFields) {
    EXPECT_EQ(trim("  DSA101 \t"), "DSA101");
    EXPECT_TRUE(is_non_empty_short("Linear Algebra"));
    EXPECT_FALSE(is_non_empty_short("   "));
    EXPECT_TRUE(is_valid_reason(""));
    EXPECT_FALSE(is_valid_reason(std::string(121, 'x')));
    EXPECT_TRUE(is_back("B"));
    EXPECT_TRUE(is_exit("q"));
    EXPECT_FALSE(is_exit("0"));
}

namespace {

// Feeds `input` to std::cin and swallows prompt text for one scope.
class ConsoleInput {
public:
    explicit ConsoleInput(const std::string& input)
        : in_(input), old_in_(std::cin.rdbuf(in_.rdbuf())), old_out_(std::cout.rdbuf(out_.rdbuf())) {}
    ~ConsoleInput() {
        std::cin.rdbuf(old_in_);
        std::cout.rdbuf(old_out_);
        std::cin.clear();
    }

private:
    std::istringstream in_;
    std::ostringstream out_;
    std::streambuf* old_in_;
    std::streambuf* old_out_;
};

} // namespace

TEST(PromptTest, WholeNumberRejectsFractions) {
    ConsoleInput input("2.7\n9.5\n3\n");
    int semester = 0;
    ASSERT_EQ(prompt_int_or_back("Current semester", semester, 1, 12), InputCtl::Ok);
    EXPECT_EQ(semester, 3);
}

TEST(PromptTest, WholeNumberRangeAndControls) {
    {
        ConsoleInput input("13\nabc\n12\n");
        int semester = 0;
        ASSERT_EQ(prompt_int_or_back("Current semester", semester, 1, 12), InputCtl::Ok);
        EXPECT_EQ(semester, 12);
    }
    {
        ConsoleInput input("b\n");
        int n = 7;
        EXPECT_EQ(prompt_int_or_back("Credits earned", n, 0, 400), InputCtl::Back);
        EXPECT_EQ(n, 7);
    }
    {
        ConsoleInput input("");
        int n = 0;
        EXPECT_EQ(prompt_int_or_back("Credits earned", n, 0, 400), InputCtl::Exit);
    }
}

TEST(PromptTest, DecimalPromptStillTakesFractions) {
    ConsoleInput input("6.25\n");
    double gpa = 0;
    ASSERT_EQ(prompt_number_or_back("GPA", gpa, 0, 10), InputCtl::Ok);
    EXPECT_DOUBLE_EQ(gpa, 6.25);
}
