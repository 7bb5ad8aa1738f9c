/**
 * @file buffer_tracker.hpp
 * @brief How much of a Buffer task's allowance its FS predecessors have used.
 *
 * A Buffer task sits after work whose finish may slip. Each FS predecessor is
 * expected to finish `lag + 1` days before the buffer starts; every day it
 * finishes later counts against `buffer_size`.
 */

#pragma once

#include "core/types.hpp"
#include "graph/project_graph.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace gantt_engine {

struct BufferStatus {
    TaskId task_id;
    int32_t buffer_size = 0;
    int64_t delay_days = 0;          ///< Summed lateness of FS predecessors
    double consumed_percent = 0.0;   ///< Capped at 100

    bool operator==(const BufferStatus&) const = default;
};

/**
 * @brief Consumption of one Buffer task.
 *
 * nullopt unless the task is a Buffer with a positive buffer_size and a start
 * date. Predecessors without both dates are not counted.
 */
[[nodiscard]] std::optional<BufferStatus> buffer_consumption(const ProjectGraph& graph,
                                                             const TaskId& task);

/// buffer_consumption for every Buffer task that has one, in id order.
[[nodiscard]] std::vector<BufferStatus> buffer_report(const ProjectGraph& graph);

}  // namespace gantt_engine
