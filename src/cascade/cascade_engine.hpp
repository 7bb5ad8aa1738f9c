/**
 * @file cascade_engine.hpp
 * @brief Date-shift propagation through dependent tasks.
 *
 * The engine only computes; applying a result (atomically in Strict mode,
 * after confirmation in Flexible mode) is the caller's business. Shifts are
 * forward-only: a dependent moves later just far enough to satisfy every
 * constraint from a predecessor that moved in the same run, and keeps its
 * duration.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/project_graph.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gantt_engine {

enum class CascadeField : uint8_t {
    StartDate,
    DueDate
};

[[nodiscard]] constexpr std::string_view to_string(CascadeField field) noexcept {
    switch (field) {
        case CascadeField::StartDate: return "start_date";
        case CascadeField::DueDate:   return "due_date";
    }
    return "unknown";
}

/**
 * @brief One stored date field that changes.
 */
struct CascadeEntry {
    TaskId task_id;
    std::string task_name;
    CascadeField field = CascadeField::StartDate;
    Date old_value;
    Date new_value;
    int64_t days_shift = 0;

    bool operator==(const CascadeEntry&) const = default;
};

/**
 * @brief Everything a cascade run decided.
 *
 * Entries are grouped per task in topological order, start_date before
 * due_date. `total_affected` counts distinct tasks, not entries.
 */
struct CascadeResult {
    TaskId trigger;
    std::vector<CascadeEntry> entries;
    size_t total_affected = 0;
    std::vector<TaskId> held;          ///< Completed dependents that would have moved
    std::vector<Warning> warnings;

    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }

    /// Distinct task ids, in entry order.
    [[nodiscard]] std::vector<TaskId> affected_tasks() const;

    bool operator==(const CascadeResult&) const = default;
};

/**
 * @brief Aggregate view of a cascade, per task.
 */
struct CascadeImpact {
    size_t total_affected = 0;
    size_t delayed = 0;
    size_t advanced = 0;
    int64_t max_shift = 0;
    int64_t min_shift = 0;
    double average_shift = 0.0;       ///< Rounded to one decimal
};

/**
 * @brief Compute the shifts implied by moving `changed_task` to new dates.
 *
 * An omitted date keeps its stored value; when both are omitted, or the task
 * is Completed, the result is empty. Only edges whose type depends on a
 * boundary that actually moved are followed out of the trigger: FS and FF
 * need a finish change, SS and SF a start change.
 *
 * Completed dependents are held in place and stop propagation. Unscheduled
 * dependents cannot be shifted; they stop propagation and add an
 * UnscheduledPredecessor warning. Hammock dependents are skipped: their
 * dates follow from plan_hammock_updates once the cascade is written.
 *
 * Errors: UnknownTask, InvalidDates (resulting start after due),
 * DerivedDates (new dates for a Hammock task).
 */
[[nodiscard]] Result<CascadeResult> compute_cascade(const ProjectGraph& graph,
                                                    const TaskId& changed_task,
                                                    std::optional<Date> new_start,
                                                    std::optional<Date> new_end);

/// True if `task` waits on an open FS predecessor or an open member of its
/// depends_on_group.
[[nodiscard]] bool is_blocked(const ProjectGraph& graph, const TaskId& task);

// ── Hammock tasks ─────────────────────────────

/**
 * @brief A Hammock task whose stored dates are out of line with its anchors.
 */
struct HammockUpdate {
    TaskId task_id;
    std::optional<Date> old_start;
    std::optional<Date> old_due;
    DateSpan span;

    bool operator==(const HammockUpdate&) const = default;
};

/**
 * @brief Dates a Hammock task stretches to.
 *
 * Starts at the latest FS predecessor finish boundary plus lag and ends the
 * day before the earliest FS successor start minus lag. Unscheduled
 * neighbours are ignored. nullopt for a task that is not a Hammock, when an
 * anchor is missing, or when the anchors leave no day between them.
 */
[[nodiscard]] std::optional<DateSpan> hammock_span(const ProjectGraph& graph, const TaskId& task);

/// Every Hammock task whose stored dates differ from hammock_span, in id order.
[[nodiscard]] std::vector<HammockUpdate> plan_hammock_updates(const ProjectGraph& graph);

/**
 * @brief Shifts that follow from `completed_task` being marked Completed.
 *
 * Every FS successor that is neither Completed nor Cancelled, has a start
 * date, and whose other FS predecessors are all Completed is moved to start
 * at max(today, completed due + 1) + lag, keeping its duration. Shifts may be
 * negative (work pulled forward). Not transitive.
 */
[[nodiscard]] Result<CascadeResult> plan_completion_advance(const ProjectGraph& graph,
                                                            const TaskId& completed_task,
                                                            Date today);

[[nodiscard]] CascadeImpact summarize(const CascadeResult& result);

/// One-line preview text, e.g. "2 tasks will be delayed".
[[nodiscard]] std::string describe(const CascadeResult& result);

}  // namespace gantt_engine
