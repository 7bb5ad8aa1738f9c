/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace gantt_engine;

TEST(TaskStatusTest, ToString) {
    EXPECT_EQ(to_string(TaskStatus::Open), "Open");
    EXPECT_EQ(to_string(TaskStatus::InProgress), "In Progress");
    EXPECT_EQ(to_string(TaskStatus::Completed), "Completed");
    EXPECT_EQ(to_string(TaskStatus::Cancelled), "Cancelled");
}

TEST(TaskStatusTest, ParseAcceptsBothSpellings) {
    EXPECT_EQ(parse_task_status("In Progress"), TaskStatus::InProgress);
    EXPECT_EQ(parse_task_status("InProgress"), TaskStatus::InProgress);
    EXPECT_EQ(parse_task_status("Review"), TaskStatus::Review);
    EXPECT_FALSE(parse_task_status("done").has_value());
}

TEST(DependencyTypeTest, ShortCodes) {
    EXPECT_EQ(short_code(DependencyType::FinishToStart), "FS");
    EXPECT_EQ(short_code(DependencyType::StartToStart), "SS");
    EXPECT_EQ(short_code(DependencyType::FinishToFinish), "FF");
    EXPECT_EQ(short_code(DependencyType::StartToFinish), "SF");
}

TEST(DependencyTypeTest, ParseShortAndLongForms) {
    EXPECT_EQ(parse_dependency_type("SS"), DependencyType::StartToStart);
    EXPECT_EQ(parse_dependency_type("Finish to Finish"), DependencyType::FinishToFinish);
    EXPECT_EQ(parse_dependency_type("Start to Finish"), DependencyType::StartToFinish);
    EXPECT_FALSE(parse_dependency_type("fs").has_value());
}

TEST(DependencyTypeTest, LongFormRoundTrip) {
    for (auto type : {DependencyType::FinishToStart, DependencyType::StartToStart,
                      DependencyType::FinishToFinish, DependencyType::StartToFinish}) {
        EXPECT_EQ(parse_dependency_type(to_string(type)), type);
    }
}

TEST(DependencyModeTest, Parse) {
    EXPECT_EQ(parse_dependency_mode("Strict"), DependencyMode::Strict);
    EXPECT_EQ(parse_dependency_mode("Flexible"), DependencyMode::Flexible);
    EXPECT_EQ(parse_dependency_mode("Off"), DependencyMode::Off);
    EXPECT_FALSE(parse_dependency_mode("strict").has_value());
}

TEST(SchedulingTypeTest, ParseAndFormat) {
    EXPECT_EQ(parse_scheduling_type("Fixed Duration"), SchedulingType::FixedDuration);
    EXPECT_EQ(parse_scheduling_type("FixedDuration"), SchedulingType::FixedDuration);
    EXPECT_EQ(parse_scheduling_type("Hammock"), SchedulingType::Hammock);
    EXPECT_EQ(parse_scheduling_type("Buffer"), SchedulingType::Buffer);
    EXPECT_FALSE(parse_scheduling_type("hammock").has_value());
    EXPECT_EQ(to_string(SchedulingType::FixedDuration), "Fixed Duration");
}

static_assert(short_code(DependencyType::FinishToStart) == "FS");
