/**
 * @file cycle_guard.cpp
 * @brief Iterative DFS over depends-on links, reporting the path found.
 */

#include "graph/cycle_guard.hpp"

#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gantt_engine {

Result<void> would_create_cycle(const Dependency& candidate,
                                std::span<const Dependency> existing_edges) {
    if (candidate.task == candidate.depends_on) {
        return Error{ErrorCode::CycleDetected,
                     "Task cannot depend on itself: " + candidate.task,
                     {candidate.task, candidate.task}};
    }

    // task → the tasks it depends on
    std::unordered_map<TaskId, std::vector<TaskId>> depends_on;
    for (const auto& edge : existing_edges) {
        depends_on[edge.task].push_back(edge.depends_on);
    }

    struct Frame {
        TaskId node;
        size_t next_idx;
    };

    std::unordered_set<TaskId> visited{candidate.depends_on};
    std::vector<Frame> stack{{candidate.depends_on, 0}};

    while (!stack.empty()) {
        auto& frame = stack.back();
        auto it = depends_on.find(frame.node);
        if (it == depends_on.end() || frame.next_idx >= it->second.size()) {
            stack.pop_back();
            continue;
        }

        const TaskId next = it->second[frame.next_idx++];
        if (next == candidate.task) {
            std::vector<TaskId> path;
            path.reserve(stack.size() + 2);
            for (const auto& f : stack) path.push_back(f.node);
            path.push_back(candidate.task);
            path.push_back(candidate.depends_on);

            std::string rendered;
            for (size_t i = 0; i < path.size(); ++i) {
                if (i > 0) rendered += " → ";
                rendered += path[i];
            }
            return Error{ErrorCode::CycleDetected,
                         "Adding this dependency would create a circular reference: " + rendered,
                         std::move(path)};
        }
        if (visited.insert(next).second) {
            stack.push_back({next, 0});
        }
    }

    return {};
}

bool creates_cycle(const Dependency& candidate, std::span<const Dependency> existing_edges) {
    return !would_create_cycle(candidate, existing_edges).has_value();
}

Result<void> validate_new_dependency(const ProjectGraph& graph, const Dependency& candidate) {
    for (const auto* id : {&candidate.task, &candidate.depends_on}) {
        if (graph.find_task(*id)) continue;
        if (graph.find_milestone(*id)) {
            return Error{ErrorCode::InvalidDependency,
                         "Milestones cannot take part in dependencies: " + *id};
        }
        return Error{ErrorCode::UnknownTask, "Task " + *id + " not found"};
    }

    if (candidate.task != candidate.depends_on) {
        for (const auto& edge : graph.predecessors(candidate.task)) {
            if (edge.other == candidate.depends_on) {
                return Error{ErrorCode::DuplicateDependency, "Dependency already exists"};
            }
        }
    }

    return would_create_cycle(candidate, graph.edges());
}

}  // namespace gantt_engine
