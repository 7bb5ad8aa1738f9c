/**
 * @file scenario_generator.cpp
 * @brief Synthetic project generator: all topology implementations.
 *
 * Generates snapshots that model common project shapes:
 * - Linear chains (strictly sequential phases)
 * - Fan-out/fan-in (parallel work streams merging into one task)
 * - Diamond (repeated parallel stages)
 * - Random DAGs (for stress testing and benchmarking)
 */

#include "graph/scenario_generator.hpp"

#include "core/date.hpp"

#include <algorithm>
#include <format>

namespace gantt_engine {

namespace {

Task make_task(GraphSnapshot& snapshot, std::string id, std::string name,
               Date start, int64_t duration_days) {
    const auto index = static_cast<uint64_t>(snapshot.tasks.size());
    Task task{
        .id = std::move(id),
        .name = std::move(name),
        .start_date = start,
        .due_date = add_days(start, duration_days - 1),
        .status = TaskStatus::Open,
        .sort_order = static_cast<double>(index + 1),
        .creation_index = index,
    };
    snapshot.tasks.push_back(task);
    return task;
}

void link(GraphSnapshot& snapshot, const TaskId& task, const TaskId& depends_on) {
    snapshot.dependencies.push_back(Dependency{
        .task = task,
        .depends_on = depends_on,
        .type = DependencyType::FinishToStart,
        .lag_days = 0,
    });
}

GraphSnapshot empty_project(std::string id, Date start) {
    GraphSnapshot snapshot;
    snapshot.project_id = std::move(id);
    snapshot.start_date = start;
    snapshot.dependency_mode = DependencyMode::Strict;
    return snapshot;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Linear Chain: T0 → T1 → T2 → ... → Tn-1
// ─────────────────────────────────────────────

GraphSnapshot ScenarioGenerator::linear_chain(size_t num_tasks, Date start, int64_t duration_days) {
    auto snapshot = empty_project("chain", start);

    TaskId prev_id;
    Date next_start = start;
    for (size_t i = 0; i < num_tasks; ++i) {
        auto task = make_task(snapshot, std::format("chain_{}", i),
                              std::format("Chain Task {}", i), next_start, duration_days);
        if (i > 0) {
            link(snapshot, task.id, prev_id);
        }
        prev_id = task.id;
        next_start = add_days(*task.due_date, 1);
    }

    return snapshot;
}

// ─────────────────────────────────────────────
// Fan-out / Fan-in:
//          src
//       /   |   \   (backslash)
//     b_0  b_1  b_2  ... b_{width-1}
//       \   |   /
//          sink
// ─────────────────────────────────────────────

GraphSnapshot ScenarioGenerator::fan_out_fan_in(size_t width, Date start, int64_t duration_days) {
    auto snapshot = empty_project("fan", start);

    auto src = make_task(snapshot, "fan_src", "Fan-Out Source", start, duration_days);
    const Date branch_start = add_days(*src.due_date, 1);

    std::vector<TaskId> branch_ids;
    for (size_t i = 0; i < width; ++i) {
        auto branch = make_task(snapshot, std::format("fan_branch_{}", i),
                                std::format("Branch {}", i), branch_start, duration_days);
        link(snapshot, branch.id, src.id);
        branch_ids.push_back(branch.id);
    }

    auto sink = make_task(snapshot, "fan_sink", "Fan-In Sink",
                          add_days(branch_start, duration_days), duration_days);
    for (const auto& branch_id : branch_ids) {
        link(snapshot, sink.id, branch_id);
    }

    return snapshot;
}

// ─────────────────────────────────────────────
// Diamond: Repeated fan-out/fan-in at each depth level.
//
//   Depth 0:        hub_0
//              /      |      \    [fan-out]
//            d_0_0  d_0_1  d_0_2
//              \      |      /    [fan-in]
//                   merge_0
//                      |
//   Depth 1:        hub_1
//                     ...
// ─────────────────────────────────────────────

GraphSnapshot ScenarioGenerator::diamond(size_t depth, size_t width, Date start,
                                         int64_t duration_days) {
    auto snapshot = empty_project("diamond", start);

    TaskId prev_merge;
    Date level_start = start;

    for (size_t d = 0; d < depth; ++d) {
        auto hub = make_task(snapshot, std::format("hub_{}", d), std::format("Hub {}", d),
                             level_start, duration_days);
        if (d > 0) {
            link(snapshot, hub.id, prev_merge);
        }

        const Date branch_start = add_days(*hub.due_date, 1);
        std::vector<TaskId> branch_ids;
        for (size_t w = 0; w < width; ++w) {
            auto branch = make_task(snapshot, std::format("diamond_{}_{}", d, w),
                                    std::format("Diamond D{} B{}", d, w), branch_start, duration_days);
            link(snapshot, branch.id, hub.id);
            branch_ids.push_back(branch.id);
        }

        auto merge = make_task(snapshot, std::format("merge_{}", d), std::format("Merge {}", d),
                               add_days(branch_start, duration_days), duration_days);
        for (const auto& bid : branch_ids) {
            link(snapshot, merge.id, bid);
        }

        prev_merge = merge.id;
        level_start = add_days(*merge.due_date, 1);
    }

    return snapshot;
}

// ─────────────────────────────────────────────
// Random DAG:
// Erdős–Rényi-style edges, only from lower-indexed to higher-indexed
// tasks to guarantee acyclicity.
// ─────────────────────────────────────────────

GraphSnapshot ScenarioGenerator::random_dag(size_t num_tasks,
                                            float edge_probability,
                                            Date start,
                                            int64_t max_duration_days,
                                            int32_t max_lag_days,
                                            std::mt19937& rng) {
    auto snapshot = empty_project("random", start);

    std::uniform_int_distribution<int64_t> duration_dist(1, std::max<int64_t>(1, max_duration_days));
    std::uniform_int_distribution<int64_t> offset_dist(0, static_cast<int64_t>(num_tasks) * 2);
    std::uniform_int_distribution<int32_t> lag_dist(0, std::max(0, max_lag_days));
    std::uniform_int_distribution<int> type_dist(0, 3);

    std::vector<TaskId> task_ids;
    task_ids.reserve(num_tasks);

    for (size_t i = 0; i < num_tasks; ++i) {
        auto task = make_task(snapshot, std::format("rand_{}", i), std::format("Random Task {}", i),
                              add_days(start, offset_dist(rng)), duration_dist(rng));
        task_ids.push_back(task.id);
    }

    constexpr DependencyType kTypes[] = {
        DependencyType::FinishToStart, DependencyType::StartToStart,
        DependencyType::FinishToFinish, DependencyType::StartToFinish,
    };

    std::uniform_real_distribution<float> edge_dist(0.0f, 1.0f);
    for (size_t i = 0; i < num_tasks; ++i) {
        for (size_t j = i + 1; j < num_tasks; ++j) {
            if (edge_dist(rng) < edge_probability) {
                snapshot.dependencies.push_back(Dependency{
                    .task = task_ids[j],
                    .depends_on = task_ids[i],
                    .type = kTypes[type_dist(rng)],
                    .lag_days = lag_dist(rng),
                });
            }
        }
    }

    return snapshot;
}

}  // namespace gantt_engine
