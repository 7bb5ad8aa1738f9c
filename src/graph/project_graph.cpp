/**
 * @file project_graph.cpp
 * @brief ProjectGraph implementation: validation, adjacency and ordering.
 *
 * Kahn's algorithm with an id-ordered ready set gives a deterministic
 * topological order; an iterative three-colour DFS reports stored cycles.
 * All algorithms are O(V+E) (times log V for the ordered ready set).
 */

#include "graph/project_graph.hpp"

#include <algorithm>
#include <functional>
#include <queue>
#include <unordered_set>

namespace gantt_engine {

namespace {

const std::vector<EdgeRef> kNoEdges;

std::string join_path(const std::vector<TaskId>& path) {
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += " → ";
        out += path[i];
    }
    return out;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<ProjectGraph> ProjectGraph::build(const GraphSnapshot& snapshot) {
    ProjectGraph graph;
    graph.project_id_ = snapshot.project_id;
    graph.project_start_ = snapshot.start_date;
    graph.mode_ = snapshot.dependency_mode;

    for (const auto& task : snapshot.tasks) {
        if (task.start_date && task.due_date && *task.start_date > *task.due_date) {
            return make_error<ProjectGraph>(ErrorCode::InvalidDates,
                "Due date cannot be before start date for task " + task.id);
        }
        if (!task.depends_on_group.empty() && task.depends_on_group == task.task_group) {
            return make_error<ProjectGraph>(ErrorCode::InvalidDependency,
                "Task " + task.id + " cannot depend on the group it belongs to");
        }
        if (!graph.tasks_.emplace(task.id, task).second) {
            return make_error<ProjectGraph>(ErrorCode::DuplicateId, "Duplicate task id: " + task.id);
        }
        graph.successors_[task.id];
        graph.predecessors_[task.id];
    }

    for (const auto& milestone : snapshot.milestones) {
        if (graph.tasks_.contains(milestone.id) ||
            !graph.milestones_.emplace(milestone.id, milestone).second) {
            return make_error<ProjectGraph>(ErrorCode::DuplicateId,
                "Duplicate item id: " + milestone.id);
        }
    }

    std::unordered_set<std::string> seen_pairs;
    for (const auto& dep : snapshot.dependencies) {
        if (dep.task == dep.depends_on) {
            return make_error<ProjectGraph>(ErrorCode::SelfDependency,
                "Task cannot depend on itself: " + dep.task, {dep.task, dep.task});
        }
        for (const auto* id : {&dep.task, &dep.depends_on}) {
            if (!graph.tasks_.contains(*id)) {
                return make_error<ProjectGraph>(ErrorCode::UnknownTask,
                    "Dependency references unknown task: " + *id);
            }
        }
        if (!seen_pairs.insert(dep.task + '\x1f' + dep.depends_on).second) {
            return make_error<ProjectGraph>(ErrorCode::DuplicateDependency,
                "Dependency already exists: " + dep.task + " depends on " + dep.depends_on);
        }

        graph.successors_[dep.depends_on].push_back({dep.task, dep.type, dep.lag_days});
        graph.predecessors_[dep.task].push_back({dep.depends_on, dep.type, dep.lag_days});
        graph.edges_.push_back(dep);
    }

    auto by_other = [](const EdgeRef& a, const EdgeRef& b) { return a.other < b.other; };
    for (auto& [_, list] : graph.successors_) std::sort(list.begin(), list.end(), by_other);
    for (auto& [_, list] : graph.predecessors_) std::sort(list.begin(), list.end(), by_other);

    if (auto cycle = graph.find_cycle()) {
        return make_error<ProjectGraph>(ErrorCode::CycleDetected,
            "Stored dependencies contain a cycle: " + join_path(*cycle), std::move(*cycle));
    }

    return graph;
}

// ─────────────────────────────────────────────
// Lookup
// ─────────────────────────────────────────────

const Task* ProjectGraph::find_task(const TaskId& id) const noexcept {
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

const Milestone* ProjectGraph::find_milestone(const ItemId& id) const noexcept {
    auto it = milestones_.find(id);
    return it == milestones_.end() ? nullptr : &it->second;
}

bool ProjectGraph::contains(const ItemId& id) const noexcept {
    return tasks_.contains(id) || milestones_.contains(id);
}

size_t ProjectGraph::task_count() const noexcept {
    return tasks_.size();
}

std::optional<DateSpan> ProjectGraph::span(const TaskId& id) const {
    const auto* task = find_task(id);
    if (!task) return std::nullopt;
    return task->span();
}

std::vector<const Task*> ProjectGraph::tasks() const {
    std::vector<const Task*> out;
    out.reserve(tasks_.size());
    for (const auto& [_, task] : tasks_) {
        out.push_back(&task);
    }
    return out;
}

// ─────────────────────────────────────────────
// Adjacency
// ─────────────────────────────────────────────

const std::vector<EdgeRef>& ProjectGraph::predecessors(const TaskId& id) const {
    auto it = predecessors_.find(id);
    return it == predecessors_.end() ? kNoEdges : it->second;
}

const std::vector<EdgeRef>& ProjectGraph::successors(const TaskId& id) const {
    auto it = successors_.find(id);
    return it == successors_.end() ? kNoEdges : it->second;
}

std::vector<EdgeRef> ProjectGraph::constraining_predecessors(const TaskId& id) const {
    std::vector<EdgeRef> out;
    for (const auto& edge : predecessors(id)) {
        const auto* pred = find_task(edge.other);
        if (pred && !pred->is_completed()) {
            out.push_back(edge);
        }
    }
    return out;
}

bool ProjectGraph::is_blocked(const TaskId& id) const {
    const bool waits_on_task = std::ranges::any_of(constraining_predecessors(id), [](const EdgeRef& edge) {
        return edge.type == DependencyType::FinishToStart;
    });
    if (waits_on_task) return true;

    const auto* task = find_task(id);
    if (!task || task->depends_on_group.empty()) return false;
    return std::ranges::any_of(group_members(task->depends_on_group), [&](const Task* member) {
        return member->id != id && !member->is_closed();
    });
}

std::vector<const Task*> ProjectGraph::group_members(const std::string& group) const {
    std::vector<const Task*> out;
    if (group.empty()) return out;
    for (const auto& [_, task] : tasks_) {
        if (task.task_group == group) out.push_back(&task);
    }
    return out;
}

bool ProjectGraph::is_terminal(const TaskId& id) const {
    return successors(id).empty();
}

// ─────────────────────────────────────────────
// Topological Ordering (Kahn's Algorithm)
// ─────────────────────────────────────────────

std::vector<TaskId> ProjectGraph::topological_order() const {
    std::unordered_map<TaskId, size_t> in_degree;
    for (const auto& [id, _] : tasks_) {
        in_degree[id] = predecessors(id).size();
    }

    std::priority_queue<TaskId, std::vector<TaskId>, std::greater<>> ready;
    for (const auto& [id, deg] : in_degree) {
        if (deg == 0) {
            ready.push(id);
        }
    }

    std::vector<TaskId> order;
    order.reserve(tasks_.size());

    while (!ready.empty()) {
        auto current = ready.top();
        ready.pop();
        order.push_back(current);

        for (const auto& edge : successors(current)) {
            if (--in_degree[edge.other] == 0) {
                ready.push(edge.other);
            }
        }
    }

    return order;
}

// ─────────────────────────────────────────────
// Cycle Detection
// ─────────────────────────────────────────────

std::optional<std::vector<TaskId>> ProjectGraph::find_cycle() const {
    enum class Color : uint8_t { White, Gray, Black };
    std::unordered_map<TaskId, Color> color;

    for (const auto& [id, _] : tasks_) {
        color[id] = Color::White;
    }

    for (const auto& [start_id, _] : tasks_) {
        if (color[start_id] != Color::White) continue;

        struct Frame {
            TaskId node;
            size_t neighbor_idx;
        };

        std::vector<Frame> dfs_stack;
        dfs_stack.push_back({start_id, 0});
        color[start_id] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& frame = dfs_stack.back();
            const auto& adj = successors(frame.node);

            if (frame.neighbor_idx >= adj.size()) {
                color[frame.node] = Color::Black;
                dfs_stack.pop_back();
                continue;
            }

            const auto neighbor = adj[frame.neighbor_idx].other;
            ++frame.neighbor_idx;

            if (color[neighbor] == Color::Gray) {
                // The gray frames from `neighbor` upward form the cycle.
                std::vector<TaskId> cycle;
                auto it = std::find_if(dfs_stack.begin(), dfs_stack.end(),
                                       [&](const Frame& f) { return f.node == neighbor; });
                for (; it != dfs_stack.end(); ++it) {
                    cycle.push_back(it->node);
                }
                cycle.push_back(neighbor);
                return cycle;
            }
            if (color[neighbor] == Color::White) {
                color[neighbor] = Color::Gray;
                dfs_stack.push_back({neighbor, 0});
            }
        }
    }

    return std::nullopt;
}

}  // namespace gantt_engine
