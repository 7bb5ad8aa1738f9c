/**
 * @file snapshot.hpp
 * @brief Plain records for one project's tasks, milestones and dependency
 *        edges, as handed over by the persistence layer.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gantt_engine {

/**
 * @brief Inclusive calendar span occupied by a task.
 *
 * The start boundary is the morning of `start`; the finish boundary is the
 * morning after `due`.
 */
struct DateSpan {
    Date start;
    Date due;

    /// Days between the start and finish boundaries (a one-day task has 1).
    [[nodiscard]] constexpr int64_t duration_days() const noexcept {
        return (due - start).count() + 1;
    }

    [[nodiscard]] constexpr Date finish_boundary() const noexcept {
        return due + std::chrono::days{1};
    }

    [[nodiscard]] constexpr DateSpan shifted(int64_t days) const noexcept {
        return DateSpan{start + std::chrono::days{days}, due + std::chrono::days{days}};
    }

    bool operator==(const DateSpan&) const = default;
};

/**
 * @brief A task node.
 */
struct Task {
    TaskId id;
    std::string name;
    std::optional<Date> start_date;
    std::optional<Date> due_date;
    TaskStatus status = TaskStatus::Open;
    double sort_order = 0.0;
    uint64_t creation_index = 0;
    std::string task_group;                 ///< Empty when the task is in no group
    std::string depends_on_group;           ///< Waits for every other task of this group
    SchedulingType scheduling_type = SchedulingType::FixedDuration;
    int32_t buffer_size = 0;                ///< Buffer tasks only, in days

    [[nodiscard]] bool is_completed() const noexcept { return status == TaskStatus::Completed; }
    [[nodiscard]] bool is_closed() const noexcept {
        return status == TaskStatus::Completed || status == TaskStatus::Cancelled;
    }
    [[nodiscard]] bool is_hammock() const noexcept { return scheduling_type == SchedulingType::Hammock; }
    [[nodiscard]] bool is_unscheduled() const noexcept { return !start_date && !due_date; }

    /// Effective span; a task with a single date occupies that one day.
    [[nodiscard]] std::optional<DateSpan> span() const noexcept {
        if (start_date && due_date) return DateSpan{*start_date, *due_date};
        if (start_date) return DateSpan{*start_date, *start_date};
        if (due_date) return DateSpan{*due_date, *due_date};
        return std::nullopt;
    }

    bool operator==(const Task&) const = default;
};

/**
 * @brief A milestone node; never part of a dependency edge.
 */
struct Milestone {
    ItemId id;
    std::string name;
    std::optional<Date> due_date;
    double sort_order = 0.0;
    uint64_t creation_index = 0;

    bool operator==(const Milestone&) const = default;
};

/**
 * @brief `task` cannot satisfy its type constraint until `depends_on` does.
 */
struct Dependency {
    TaskId task;
    TaskId depends_on;
    DependencyType type = DependencyType::FinishToStart;
    int32_t lag_days = 0;

    bool operator==(const Dependency&) const = default;
};

/**
 * @brief Everything the engine needs to know about one project.
 */
struct GraphSnapshot {
    ProjectId project_id;
    std::optional<Date> start_date;
    DependencyMode dependency_mode = DependencyMode::Flexible;
    std::vector<Task> tasks;
    std::vector<Milestone> milestones;
    std::vector<Dependency> dependencies;

    [[nodiscard]] const Task* find_task(const TaskId& id) const noexcept {
        for (const auto& task : tasks) {
            if (task.id == id) return &task;
        }
        return nullptr;
    }

    [[nodiscard]] Task* find_task(const TaskId& id) noexcept {
        for (auto& task : tasks) {
            if (task.id == id) return &task;
        }
        return nullptr;
    }

    [[nodiscard]] const Milestone* find_milestone(const ItemId& id) const noexcept {
        for (const auto& milestone : milestones) {
            if (milestone.id == id) return &milestone;
        }
        return nullptr;
    }

    [[nodiscard]] Milestone* find_milestone(const ItemId& id) noexcept {
        for (auto& milestone : milestones) {
            if (milestone.id == id) return &milestone;
        }
        return nullptr;
    }

    [[nodiscard]] const Dependency* find_dependency(const TaskId& task,
                                                    const TaskId& depends_on) const noexcept {
        for (const auto& dep : dependencies) {
            if (dep.task == task && dep.depends_on == depends_on) return &dep;
        }
        return nullptr;
    }

    bool operator==(const GraphSnapshot&) const = default;
};

}  // namespace gantt_engine
