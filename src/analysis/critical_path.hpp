/**
 * @file critical_path.hpp
 * @brief Critical Path Method over a ProjectGraph.
 *
 * Forward and backward passes over the graph's topological order. All four
 * dependency types are honoured: FS and SS constrain the successor's start,
 * FF and SF its finish. Offsets are whole days from the project start; the
 * public result converts them back into inclusive calendar dates.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/project_graph.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace gantt_engine {

struct CriticalPathOptions {
    /// Duration assumed for a task without dates.
    int64_t default_duration_days = 1;
};

/**
 * @brief CPM figures for one task.
 *
 * Finish dates are the inclusive last working day, so a one-day task has
 * earliest_start == earliest_finish.
 */
struct TaskSchedule {
    TaskId task_id;
    int64_t duration_days = 0;
    Date earliest_start;
    Date earliest_finish;
    Date latest_start;
    Date latest_finish;
    int64_t slack_days = 0;
    bool critical = false;
    bool unscheduled = false;
};

struct CriticalPathResult {
    std::optional<Date> project_start;
    std::optional<Date> project_finish;       ///< Inclusive
    std::vector<TaskSchedule> schedule;       ///< Topological order
    std::vector<TaskId> critical_path;        ///< Zero-slack tasks, topological order
    std::vector<Warning> warnings;

    [[nodiscard]] const TaskSchedule* find(const TaskId& id) const noexcept;
    [[nodiscard]] bool is_critical(const TaskId& id) const noexcept;
    [[nodiscard]] bool empty() const noexcept { return schedule.empty(); }
};

/**
 * @brief Run the forward and backward passes.
 *
 * `project_start` is the implicit root; tasks without predecessors start
 * there. When absent, the earliest task date in the graph is used; if no task
 * has a date the result is empty and carries a MissingProjectStart warning.
 *
 * Pure function of its inputs.
 */
[[nodiscard]] CriticalPathResult analyze_critical_path(const ProjectGraph& graph,
                                                       std::optional<Date> project_start,
                                                       const CriticalPathOptions& options = {});

/// Convenience overload anchored at the graph's own project start.
[[nodiscard]] CriticalPathResult analyze_critical_path(const ProjectGraph& graph,
                                                       const CriticalPathOptions& options = {});

}  // namespace gantt_engine
