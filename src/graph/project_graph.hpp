/**
 * @file project_graph.hpp
 * @brief Directed acyclic graph of one project's tasks and milestones.
 *
 * Built fresh from a GraphSnapshot for every scheduling operation. Provides
 * predecessor/successor edge lists, a deterministic topological order, node
 * lookup and the "completed predecessors never block" business rule. Owns no
 * I/O and is never mutated after construction.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/snapshot.hpp"

#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace gantt_engine {

/**
 * @brief One side of a dependency edge as seen from a node.
 *
 * In a predecessor list `other` is the task depended on; in a successor list
 * it is the dependent task.
 */
struct EdgeRef {
    TaskId other;
    DependencyType type = DependencyType::FinishToStart;
    int32_t lag_days = 0;
};

class ProjectGraph {
public:
    /**
     * @brief Validate a snapshot and index it.
     *
     * Fails on duplicate ids, inverted dates, edges naming unknown tasks or
     * milestones, self edges, duplicate edges, stored cycles, and tasks that
     * depend on their own group.
     */
    static Result<ProjectGraph> build(const GraphSnapshot& snapshot);

    // ── Lookup ────────────────────────────────
    [[nodiscard]] const Task* find_task(const TaskId& id) const noexcept;
    [[nodiscard]] const Milestone* find_milestone(const ItemId& id) const noexcept;
    [[nodiscard]] bool contains(const ItemId& id) const noexcept;
    [[nodiscard]] size_t task_count() const noexcept;
    [[nodiscard]] std::optional<DateSpan> span(const TaskId& id) const;

    /// Tasks in id order.
    [[nodiscard]] std::vector<const Task*> tasks() const;
    [[nodiscard]] const std::vector<Dependency>& edges() const noexcept { return edges_; }

    [[nodiscard]] const ProjectId& project_id() const noexcept { return project_id_; }
    [[nodiscard]] const std::optional<Date>& project_start() const noexcept { return project_start_; }
    [[nodiscard]] DependencyMode dependency_mode() const noexcept { return mode_; }

    // ── Adjacency ─────────────────────────────
    [[nodiscard]] const std::vector<EdgeRef>& predecessors(const TaskId& id) const;
    [[nodiscard]] const std::vector<EdgeRef>& successors(const TaskId& id) const;

    /// Predecessor edges whose predecessor is not Completed.
    [[nodiscard]] std::vector<EdgeRef> constraining_predecessors(const TaskId& id) const;

    /**
     * @brief True iff the task has to wait.
     *
     * Some Finish-to-Start predecessor is not Completed, or some other task
     * of its `depends_on_group` is neither Completed nor Cancelled.
     */
    [[nodiscard]] bool is_blocked(const TaskId& id) const;

    /// Tasks of `group` in id order; empty for an unknown or empty name.
    [[nodiscard]] std::vector<const Task*> group_members(const std::string& group) const;

    [[nodiscard]] bool is_terminal(const TaskId& id) const;

    // ── Ordering ──────────────────────────────

    /// Kahn's algorithm; among ready tasks the smallest id goes first.
    [[nodiscard]] std::vector<TaskId> topological_order() const;

    /// A cycle through the stored edges, or nullopt (always nullopt once built).
    [[nodiscard]] std::optional<std::vector<TaskId>> find_cycle() const;

private:
    ProjectGraph() = default;

    ProjectId project_id_;
    std::optional<Date> project_start_;
    DependencyMode mode_ = DependencyMode::Flexible;

    std::map<TaskId, Task> tasks_;
    std::map<ItemId, Milestone> milestones_;
    std::unordered_map<TaskId, std::vector<EdgeRef>> successors_;     // forward edges
    std::unordered_map<TaskId, std::vector<EdgeRef>> predecessors_;   // backward edges
    std::vector<Dependency> edges_;
};

}  // namespace gantt_engine
