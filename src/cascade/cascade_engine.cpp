/**
 * @file cascade_engine.cpp
 * @brief Cascade propagation, blocked predicate and completion advance.
 */

#include "cascade/cascade_engine.hpp"

#include "core/date.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>

namespace gantt_engine {

namespace {

/// True if a change of the given boundaries moves the constraint an edge of
/// this type places on its successor.
bool constrained_by(DependencyType type, bool start_changed, bool end_changed) {
    switch (type) {
        case DependencyType::FinishToStart:
        case DependencyType::FinishToFinish:
            return end_changed;
        case DependencyType::StartToStart:
        case DependencyType::StartToFinish:
            return start_changed;
    }
    return false;
}

/// Days `succ` has to move later to satisfy the edge, or <= 0 if satisfied.
int64_t required_shift(DependencyType type, int32_t lag, const DateSpan& pred,
                       const DateSpan& succ) {
    switch (type) {
        case DependencyType::FinishToStart:
            return days_between(succ.start, add_days(pred.finish_boundary(), lag));
        case DependencyType::StartToStart:
            return days_between(succ.start, add_days(pred.start, lag));
        case DependencyType::FinishToFinish:
            return days_between(succ.due, add_days(pred.due, lag));
        case DependencyType::StartToFinish:
            return days_between(succ.due, add_days(pred.start, lag - 1));
    }
    return 0;
}

/// Entries for the stored fields of `task` moving by `shift` days.
void push_entries(CascadeResult& result, const Task& task, int64_t shift) {
    if (task.start_date) {
        result.entries.push_back(CascadeEntry{
            .task_id = task.id,
            .task_name = task.name,
            .field = CascadeField::StartDate,
            .old_value = *task.start_date,
            .new_value = add_days(*task.start_date, shift),
            .days_shift = shift,
        });
    }
    if (task.due_date) {
        result.entries.push_back(CascadeEntry{
            .task_id = task.id,
            .task_name = task.name,
            .field = CascadeField::DueDate,
            .old_value = *task.due_date,
            .new_value = add_days(*task.due_date, shift),
            .days_shift = shift,
        });
    }
    ++result.total_affected;
}

std::string plural_tasks(size_t n) {
    return std::to_string(n) + (n == 1 ? " task" : " tasks");
}

}  // anonymous namespace

std::vector<TaskId> CascadeResult::affected_tasks() const {
    std::vector<TaskId> out;
    for (const auto& entry : entries) {
        if (out.empty() || out.back() != entry.task_id) {
            out.push_back(entry.task_id);
        }
    }
    return out;
}

// ─────────────────────────────────────────────
// Cascade
// ─────────────────────────────────────────────

Result<CascadeResult> compute_cascade(const ProjectGraph& graph,
                                      const TaskId& changed_task,
                                      std::optional<Date> new_start,
                                      std::optional<Date> new_end) {
    const auto* trigger = graph.find_task(changed_task);
    if (!trigger) {
        return make_error<CascadeResult>(ErrorCode::UnknownTask,
                                         "Task " + changed_task + " not found");
    }

    if (trigger->is_hammock() && (new_start || new_end)) {
        return make_error<CascadeResult>(ErrorCode::DerivedDates,
            "Hammock task " + changed_task + " takes its dates from its neighbours");
    }

    const auto start = new_start ? new_start : trigger->start_date;
    const auto due = new_end ? new_end : trigger->due_date;
    if (start && due && *start > *due) {
        return make_error<CascadeResult>(ErrorCode::InvalidDates,
            "Due date " + format_date(*due) + " is before start date " + format_date(*start));
    }

    CascadeResult result;
    result.trigger = changed_task;
    if ((!new_start && !new_end) || trigger->is_completed()) {
        return result;
    }

    Task moved_trigger = *trigger;
    moved_trigger.start_date = start;
    moved_trigger.due_date = due;

    const auto old_span = trigger->span();
    const auto new_span = moved_trigger.span();
    const bool start_changed = !old_span || old_span->start != new_span->start;
    const bool end_changed = !old_span || old_span->due != new_span->due;
    if (!start_changed && !end_changed) {
        return result;
    }

    // Tasks whose span changed in this run, with the span they now occupy.
    std::unordered_map<TaskId, DateSpan> moved{{changed_task, *new_span}};

    auto seeds = [&](const TaskId& pred, DependencyType type) {
        if (!moved.contains(pred)) return false;
        return pred != changed_task || constrained_by(type, start_changed, end_changed);
    };

    for (const auto& id : graph.topological_order()) {
        if (id == changed_task) continue;

        const auto* task = graph.find_task(id);
        std::vector<const EdgeRef*> active;
        for (const auto& edge : graph.predecessors(id)) {
            if (seeds(edge.other, edge.type)) active.push_back(&edge);
        }
        if (active.empty() || task->is_hammock()) continue;

        const auto span = task->span();
        if (!span) {
            if (!task->is_completed()) {
                result.warnings.push_back(Warning{
                    ErrorCode::UnscheduledPredecessor, id,
                    "Task " + id + " has no dates; the cascade stops there"});
            }
            continue;
        }

        int64_t shift = 0;
        for (const auto* edge : active) {
            shift = std::max(shift, required_shift(edge->type, edge->lag_days,
                                                   moved.at(edge->other), *span));
        }
        if (shift == 0) continue;

        // Completed work never moves and shields everything behind it.
        if (task->is_completed()) {
            result.held.push_back(id);
            continue;
        }

        moved.emplace(id, span->shifted(shift));
        push_entries(result, *task, shift);
    }

    return result;
}

bool is_blocked(const ProjectGraph& graph, const TaskId& task) {
    return graph.is_blocked(task);
}

// ─────────────────────────────────────────────
// Hammock Tasks
// ─────────────────────────────────────────────

std::optional<DateSpan> hammock_span(const ProjectGraph& graph, const TaskId& task) {
    const auto* hammock = graph.find_task(task);
    if (!hammock || !hammock->is_hammock()) return std::nullopt;

    std::optional<Date> start;
    for (const auto& edge : graph.predecessors(task)) {
        if (edge.type != DependencyType::FinishToStart) continue;
        const auto pred = graph.span(edge.other);
        if (!pred) continue;
        const auto candidate = add_days(pred->finish_boundary(), edge.lag_days);
        if (!start || candidate > *start) start = candidate;
    }

    std::optional<Date> due;
    for (const auto& edge : graph.successors(task)) {
        if (edge.type != DependencyType::FinishToStart) continue;
        const auto succ = graph.span(edge.other);
        if (!succ) continue;
        const auto candidate = add_days(succ->start, -1 - static_cast<int64_t>(edge.lag_days));
        if (!due || candidate < *due) due = candidate;
    }

    if (!start || !due || *start > *due) return std::nullopt;
    return DateSpan{*start, *due};
}

std::vector<HammockUpdate> plan_hammock_updates(const ProjectGraph& graph) {
    std::vector<HammockUpdate> updates;
    for (const auto* task : graph.tasks()) {
        const auto span = hammock_span(graph, task->id);
        if (!span) continue;
        if (task->start_date == span->start && task->due_date == span->due) continue;
        updates.push_back({task->id, task->start_date, task->due_date, *span});
    }
    return updates;
}

// ─────────────────────────────────────────────
// Completion Advance
// ─────────────────────────────────────────────

Result<CascadeResult> plan_completion_advance(const ProjectGraph& graph,
                                              const TaskId& completed_task,
                                              Date today) {
    const auto* completed = graph.find_task(completed_task);
    if (!completed) {
        return make_error<CascadeResult>(ErrorCode::UnknownTask,
                                         "Task " + completed_task + " not found");
    }

    Date anchor = today;
    if (completed->due_date) {
        anchor = std::max(today, add_days(*completed->due_date, 1));
    }

    CascadeResult result;
    result.trigger = completed_task;

    for (const auto& edge : graph.successors(completed_task)) {
        if (edge.type != DependencyType::FinishToStart) continue;

        const auto* succ = graph.find_task(edge.other);
        if (succ->status == TaskStatus::Completed || succ->status == TaskStatus::Cancelled) {
            continue;
        }
        if (!succ->start_date || succ->is_hammock()) continue;

        const bool still_waiting = std::ranges::any_of(graph.predecessors(succ->id),
            [&](const EdgeRef& pred) {
                if (pred.type != DependencyType::FinishToStart) return false;
                if (pred.other == completed_task) return false;
                return !graph.find_task(pred.other)->is_completed();
            });
        if (still_waiting) continue;

        const int64_t shift = days_between(*succ->start_date, add_days(anchor, edge.lag_days));
        if (shift == 0) continue;
        push_entries(result, *succ, shift);
    }

    return result;
}

// ─────────────────────────────────────────────
// Preview Helpers
// ─────────────────────────────────────────────

CascadeImpact summarize(const CascadeResult& result) {
    CascadeImpact impact;
    std::unordered_set<TaskId> seen;
    int64_t total = 0;

    for (const auto& entry : result.entries) {
        if (!seen.insert(entry.task_id).second) continue;

        if (impact.total_affected == 0) {
            impact.max_shift = entry.days_shift;
            impact.min_shift = entry.days_shift;
        } else {
            impact.max_shift = std::max(impact.max_shift, entry.days_shift);
            impact.min_shift = std::min(impact.min_shift, entry.days_shift);
        }
        if (entry.days_shift > 0) ++impact.delayed;
        if (entry.days_shift < 0) ++impact.advanced;
        total += entry.days_shift;
        ++impact.total_affected;
    }

    if (impact.total_affected > 0) {
        const double avg = static_cast<double>(total) / static_cast<double>(impact.total_affected);
        impact.average_shift = std::round(avg * 10.0) / 10.0;
    }
    return impact;
}

std::string describe(const CascadeResult& result) {
    const auto impact = summarize(result);

    std::string text;
    if (impact.delayed > 0 && impact.advanced > 0) {
        text = plural_tasks(impact.delayed) + " delayed, " + plural_tasks(impact.advanced) + " advanced";
    } else if (impact.delayed > 0) {
        text = plural_tasks(impact.delayed) + " will be delayed";
    } else if (impact.advanced > 0) {
        text = plural_tasks(impact.advanced) + " will move earlier";
    } else {
        text = "No tasks affected";
    }

    if (!result.held.empty()) {
        text += " (" + std::to_string(result.held.size()) + " completed held)";
    }
    return text;
}

}  // namespace gantt_engine
