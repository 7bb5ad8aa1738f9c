/**
 * @file test_cascade_engine.cpp
 * @brief Unit tests for cascade propagation and completion advance.
 */

#include "cascade/cascade_engine.hpp"
#include "core/date.hpp"

#include <gtest/gtest.h>
#include <algorithm>

using namespace gantt_engine;

// ─── Helpers ─────────────────────────────────

static Date jan(unsigned day) {
    return *make_date(2026, 1, day);
}

static Task make_task(const std::string& id, std::optional<Date> start,
                      std::optional<Date> due, TaskStatus status = TaskStatus::Open) {
    return Task{.id = id, .name = "Task " + id, .start_date = start, .due_date = due,
                .status = status};
}

static Dependency dep(const std::string& task, const std::string& depends_on,
                      DependencyType type = DependencyType::FinishToStart, int32_t lag = 0) {
    return Dependency{.task = task, .depends_on = depends_on, .type = type, .lag_days = lag};
}

static ProjectGraph build(const GraphSnapshot& snapshot) {
    auto graph = ProjectGraph::build(snapshot);
    EXPECT_TRUE(graph.has_value()) << graph.error().message;
    return std::move(graph).value();
}

/// A → B → C, back to back, five days each from Jan 1.
static GraphSnapshot abc_chain() {
    GraphSnapshot snapshot;
    snapshot.project_id = "P1";
    snapshot.start_date = jan(1);
    snapshot.dependency_mode = DependencyMode::Strict;
    snapshot.tasks = {make_task("A", jan(1), jan(5)),
                      make_task("B", jan(6), jan(10)),
                      make_task("C", jan(11), jan(15))};
    snapshot.dependencies = {dep("B", "A"), dep("C", "B")};
    return snapshot;
}

// ─── Propagation ─────────────────────────────

TEST(CascadeTest, ChainShiftsEveryDependent) {
    auto result = compute_cascade(build(abc_chain()), "A", std::nullopt, jan(8));
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_EQ(result->trigger, "A");
    EXPECT_EQ(result->total_affected, 2u);
    EXPECT_EQ(result->affected_tasks(), (std::vector<TaskId>{"B", "C"}));
    ASSERT_EQ(result->entries.size(), 4u);

    const auto& b_start = result->entries[0];
    EXPECT_EQ(b_start.task_id, "B");
    EXPECT_EQ(b_start.task_name, "Task B");
    EXPECT_EQ(b_start.field, CascadeField::StartDate);
    EXPECT_EQ(b_start.old_value, jan(6));
    EXPECT_EQ(b_start.new_value, jan(9));
    EXPECT_EQ(b_start.days_shift, 3);

    EXPECT_EQ(result->entries[1].field, CascadeField::DueDate);
    EXPECT_EQ(result->entries[1].new_value, jan(13));
    EXPECT_EQ(result->entries[2].new_value, jan(14));
    EXPECT_EQ(result->entries[3].new_value, jan(18));
}

TEST(CascadeTest, SlackAbsorbsSmallShift) {
    auto snapshot = abc_chain();
    snapshot.tasks[1] = make_task("B", jan(9), jan(13));
    snapshot.tasks[2] = make_task("C", jan(14), jan(18));

    auto result = compute_cascade(build(snapshot), "A", std::nullopt, jan(7));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
    EXPECT_EQ(result->total_affected, 0u);
}

TEST(CascadeTest, MovingEarlierNeverPullsDependents) {
    auto result = compute_cascade(build(abc_chain()), "A", std::nullopt, jan(3));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(CascadeTest, DiamondTakesLargestRequiredShift) {
    GraphSnapshot snapshot;
    snapshot.tasks = {make_task("A", jan(1), jan(5)),
                      make_task("B", jan(6), jan(10)),
                      make_task("C", jan(6), jan(7)),
                      make_task("D", jan(13), jan(14))};
    snapshot.dependencies = {dep("B", "A"), dep("C", "A"),
                             dep("D", "B"), dep("D", "C", DependencyType::FinishToStart, 5)};

    auto result = compute_cascade(build(snapshot), "A", std::nullopt, jan(7));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->total_affected, 3u);

    const auto it = std::find_if(result->entries.begin(), result->entries.end(),
                                 [](const CascadeEntry& e) { return e.task_id == "D"; });
    ASSERT_NE(it, result->entries.end());
    EXPECT_EQ(it->days_shift, 2);
    EXPECT_EQ(it->new_value, jan(15));
}

TEST(CascadeTest, LagIsHonoured) {
    auto snapshot = abc_chain();
    snapshot.dependencies[0].lag_days = 2;
    snapshot.tasks[1] = make_task("B", jan(8), jan(12));
    snapshot.tasks[2] = make_task("C", jan(13), jan(17));

    auto result = compute_cascade(build(snapshot), "A", std::nullopt, jan(6));
    ASSERT_TRUE(result.has_value());
    ASSERT_FALSE(result->empty());
    EXPECT_EQ(result->entries[0].new_value, jan(9));
    EXPECT_EQ(result->total_affected, 2u);
}

// ─── Dependency Types ────────────────────────

TEST(CascadeTest, StartToStartIgnoresFinishOnlyChange) {
    GraphSnapshot snapshot;
    snapshot.tasks = {make_task("A", jan(1), jan(5)), make_task("B", jan(3), jan(5))};
    snapshot.dependencies = {dep("B", "A", DependencyType::StartToStart, 2)};
    auto graph = build(snapshot);

    auto finish_only = compute_cascade(graph, "A", std::nullopt, jan(9));
    ASSERT_TRUE(finish_only.has_value());
    EXPECT_TRUE(finish_only->empty());

    auto moved_start = compute_cascade(graph, "A", jan(4), std::nullopt);
    ASSERT_TRUE(moved_start.has_value());
    ASSERT_EQ(moved_start->entries.size(), 2u);
    EXPECT_EQ(moved_start->entries[0].days_shift, 3);
    EXPECT_EQ(moved_start->entries[0].new_value, jan(6));
}

TEST(CascadeTest, FinishToFinishMovesDueDate) {
    GraphSnapshot snapshot;
    snapshot.tasks = {make_task("A", jan(1), jan(5)), make_task("B", jan(2), jan(5))};
    snapshot.dependencies = {dep("B", "A", DependencyType::FinishToFinish)};

    auto result = compute_cascade(build(snapshot), "A", std::nullopt, jan(7));
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->entries.size(), 2u);
    EXPECT_EQ(result->entries[0].new_value, jan(4));
    EXPECT_EQ(result->entries[1].new_value, jan(7));
}

TEST(CascadeTest, StartToFinish) {
    GraphSnapshot snapshot;
    snapshot.tasks = {make_task("A", jan(5), jan(9)), make_task("B", jan(1), jan(4))};
    snapshot.dependencies = {dep("B", "A", DependencyType::StartToFinish)};

    // B must finish no earlier than the day before A starts.
    auto result = compute_cascade(build(snapshot), "A", jan(8), std::nullopt);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->entries.size(), 2u);
    EXPECT_EQ(result->entries[1].field, CascadeField::DueDate);
    EXPECT_EQ(result->entries[1].new_value, jan(7));
}

// ─── Stop Conditions ─────────────────────────

TEST(CascadeTest, CompletedDependentIsHeldAndShields) {
    auto snapshot = abc_chain();
    snapshot.find_task("B")->status = TaskStatus::Completed;

    auto result = compute_cascade(build(snapshot), "A", std::nullopt, jan(8));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
    EXPECT_EQ(result->held, (std::vector<TaskId>{"B"}));
    EXPECT_EQ(describe(*result), "No tasks affected (1 completed held)");
}

TEST(CascadeTest, UnscheduledDependentWarnsAndStops) {
    auto snapshot = abc_chain();
    snapshot.tasks[1] = make_task("B", std::nullopt, std::nullopt);

    auto result = compute_cascade(build(snapshot), "A", std::nullopt, jan(12));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
    ASSERT_EQ(result->warnings.size(), 1u);
    EXPECT_EQ(result->warnings[0].code, ErrorCode::UnscheduledPredecessor);
    EXPECT_EQ(result->warnings[0].task_id, "B");
}

TEST(CascadeTest, DueOnlyTaskGetsSingleEntry) {
    auto snapshot = abc_chain();
    snapshot.tasks[1] = make_task("B", std::nullopt, jan(6));

    auto result = compute_cascade(build(snapshot), "A", std::nullopt, jan(7));
    ASSERT_TRUE(result.has_value());
    ASSERT_FALSE(result->entries.empty());
    EXPECT_EQ(result->entries[0].task_id, "B");
    EXPECT_EQ(result->entries[0].field, CascadeField::DueDate);
    EXPECT_EQ(result->entries[0].new_value, jan(8));
}

TEST(CascadeTest, CompletedTriggerOrNoDatesGivesEmpty) {
    auto snapshot = abc_chain();
    auto graph = build(snapshot);
    auto no_dates = compute_cascade(graph, "A", std::nullopt, std::nullopt);
    ASSERT_TRUE(no_dates.has_value());
    EXPECT_TRUE(no_dates->empty());

    snapshot.find_task("A")->status = TaskStatus::Completed;
    auto completed = compute_cascade(build(snapshot), "A", std::nullopt, jan(20));
    ASSERT_TRUE(completed.has_value());
    EXPECT_TRUE(completed->empty());
}

TEST(CascadeTest, ApplyingResultIsIdempotent) {
    auto snapshot = abc_chain();
    auto first = compute_cascade(build(snapshot), "A", std::nullopt, jan(8));
    ASSERT_TRUE(first.has_value());

    snapshot.find_task("A")->due_date = jan(8);
    for (const auto& entry : first->entries) {
        auto* task = snapshot.find_task(entry.task_id);
        if (entry.field == CascadeField::StartDate) task->start_date = entry.new_value;
        else task->due_date = entry.new_value;
    }

    auto second = compute_cascade(build(snapshot), "A", std::nullopt, jan(8));
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(second->empty());
}

// ─── Errors ──────────────────────────────────

TEST(CascadeTest, UnknownTask) {
    auto result = compute_cascade(build(abc_chain()), "Z", jan(1), std::nullopt);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::UnknownTask);
}

TEST(CascadeTest, DueBeforeStartRejected) {
    auto result = compute_cascade(build(abc_chain()), "A", std::nullopt, *make_date(2025, 12, 30));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidDates);
}

// ─── Blocked / Completion Advance ────────────

TEST(CascadeTest, BlockedFollowsFinishToStartPredecessors) {
    auto snapshot = abc_chain();
    EXPECT_TRUE(is_blocked(build(snapshot), "B"));
    snapshot.find_task("A")->status = TaskStatus::Completed;
    EXPECT_FALSE(is_blocked(build(snapshot), "B"));
}

TEST(CompletionAdvanceTest, PullsReadySuccessorForward) {
    auto snapshot = abc_chain();
    snapshot.tasks[1] = make_task("B", jan(10), jan(14));

    auto result = plan_completion_advance(build(snapshot), "A", jan(3));
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->entries.size(), 2u);
    EXPECT_EQ(result->entries[0].new_value, jan(6));
    EXPECT_EQ(result->entries[1].new_value, jan(10));
    EXPECT_EQ(result->entries[0].days_shift, -4);
    EXPECT_EQ(describe(*result), "1 task will move earlier");
}

TEST(CompletionAdvanceTest, LateCompletionPushesSuccessor) {
    auto result = plan_completion_advance(build(abc_chain()), "A", jan(8));
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->entries.size(), 2u);
    EXPECT_EQ(result->entries[0].new_value, jan(8));
    EXPECT_EQ(result->entries[0].days_shift, 2);
}

TEST(CompletionAdvanceTest, OnTimeCompletionChangesNothing) {
    auto result = plan_completion_advance(build(abc_chain()), "A", jan(5));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(CompletionAdvanceTest, WaitsForOtherOpenPredecessors) {
    auto snapshot = abc_chain();
    snapshot.tasks.push_back(make_task("X", jan(1), jan(3)));
    snapshot.dependencies.push_back(dep("B", "X"));

    auto result = plan_completion_advance(build(snapshot), "A", jan(9));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(CompletionAdvanceTest, IsNotTransitive) {
    auto result = plan_completion_advance(build(abc_chain()), "A", jan(12));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->affected_tasks(), (std::vector<TaskId>{"B"}));
}

// ─── Hammock Tasks ───────────────────────────

/// A → H → C with H a Hammock; X is a second, later predecessor of H.
static GraphSnapshot hammock_between(std::optional<Date> h_start = std::nullopt,
                                     std::optional<Date> h_due = std::nullopt) {
    GraphSnapshot snapshot;
    snapshot.project_id = "P1";
    auto hammock = make_task("H", h_start, h_due);
    hammock.scheduling_type = SchedulingType::Hammock;
    snapshot.tasks = {make_task("A", jan(1), jan(5)),
                      hammock,
                      make_task("C", jan(11), jan(15))};
    snapshot.dependencies = {dep("H", "A"), dep("C", "H")};
    return snapshot;
}

TEST(HammockTest, SpansGapBetweenNeighbours) {
    auto graph = build(hammock_between());
    auto span = hammock_span(graph, "H");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->start, jan(6));
    EXPECT_EQ(span->due, jan(10));

    auto updates = plan_hammock_updates(graph);
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].task_id, "H");
    EXPECT_FALSE(updates[0].old_start.has_value());
    EXPECT_EQ(updates[0].span, (DateSpan{jan(6), jan(10)}));
}

TEST(HammockTest, LatestPredecessorAndLagsNarrowTheSpan) {
    auto snapshot = hammock_between();
    snapshot.tasks.push_back(make_task("X", jan(1), jan(6)));
    snapshot.dependencies = {dep("H", "A", DependencyType::FinishToStart, 1),
                             dep("H", "X"),
                             dep("C", "H", DependencyType::FinishToStart, 2)};

    auto span = hammock_span(build(snapshot), "H");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->start, jan(7));
    EXPECT_EQ(span->due, jan(8));
}

TEST(HammockTest, NoSpanWithoutBothAnchors) {
    auto snapshot = hammock_between();
    snapshot.dependencies = {dep("H", "A")};
    EXPECT_FALSE(hammock_span(build(snapshot), "H").has_value());

    auto crossing = hammock_between();
    crossing.tasks[2] = make_task("C", jan(6), jan(8));
    EXPECT_FALSE(hammock_span(build(crossing), "H").has_value());

    EXPECT_FALSE(hammock_span(build(abc_chain()), "B").has_value());
}

TEST(HammockTest, UpToDateHammockNeedsNoUpdate) {
    EXPECT_TRUE(plan_hammock_updates(build(hammock_between(jan(6), jan(10)))).empty());

    auto stale = plan_hammock_updates(build(hammock_between(jan(2), jan(3))));
    ASSERT_EQ(stale.size(), 1u);
    EXPECT_EQ(stale[0].old_start, jan(2));
    EXPECT_EQ(stale[0].old_due, jan(3));
}

TEST(HammockTest, DatesCannotBeSetDirectly) {
    auto result = compute_cascade(build(hammock_between(jan(6), jan(10))), "H", jan(7), std::nullopt);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DerivedDates);
}

TEST(HammockTest, CascadeLeavesHammockDependentAlone) {
    auto result = compute_cascade(build(hammock_between(jan(6), jan(10))), "A", std::nullopt, jan(8));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
    EXPECT_TRUE(result->warnings.empty());
}

// ─── Summaries ───────────────────────────────

TEST(CascadeSummaryTest, DelayedChain) {
    auto result = compute_cascade(build(abc_chain()), "A", std::nullopt, jan(8));
    ASSERT_TRUE(result.has_value());

    auto impact = summarize(*result);
    EXPECT_EQ(impact.total_affected, 2u);
    EXPECT_EQ(impact.delayed, 2u);
    EXPECT_EQ(impact.advanced, 0u);
    EXPECT_EQ(impact.max_shift, 3);
    EXPECT_EQ(impact.min_shift, 3);
    EXPECT_DOUBLE_EQ(impact.average_shift, 3.0);
    EXPECT_EQ(describe(*result), "2 tasks will be delayed");
}

TEST(CascadeSummaryTest, MixedDirections) {
    CascadeResult result;
    result.entries = {
        CascadeEntry{.task_id = "B", .field = CascadeField::StartDate, .days_shift = 2},
        CascadeEntry{.task_id = "B", .field = CascadeField::DueDate, .days_shift = 2},
        CascadeEntry{.task_id = "C", .field = CascadeField::StartDate, .days_shift = -1},
    };

    auto impact = summarize(result);
    EXPECT_EQ(impact.total_affected, 2u);
    EXPECT_EQ(impact.max_shift, 2);
    EXPECT_EQ(impact.min_shift, -1);
    EXPECT_DOUBLE_EQ(impact.average_shift, 0.5);
    EXPECT_EQ(describe(result), "1 task delayed, 1 task advanced");
}

TEST(CascadeSummaryTest, EmptyResult) {
    EXPECT_EQ(describe(CascadeResult{}), "No tasks affected");
    EXPECT_EQ(summarize(CascadeResult{}).total_affected, 0u);
}
