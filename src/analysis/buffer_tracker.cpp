/**
 * @file buffer_tracker.cpp
 * @brief Buffer consumption from predecessor lateness.
 */

#include "analysis/buffer_tracker.hpp"

#include "core/date.hpp"

#include <algorithm>
#include <utility>

namespace gantt_engine {

std::optional<BufferStatus> buffer_consumption(const ProjectGraph& graph, const TaskId& task) {
    const auto* buffer = graph.find_task(task);
    if (!buffer || buffer->scheduling_type != SchedulingType::Buffer) return std::nullopt;
    if (buffer->buffer_size <= 0 || !buffer->start_date) return std::nullopt;

    BufferStatus status;
    status.task_id = task;
    status.buffer_size = buffer->buffer_size;

    for (const auto& edge : graph.predecessors(task)) {
        if (edge.type != DependencyType::FinishToStart) continue;
        const auto* pred = graph.find_task(edge.other);
        if (!pred->start_date || !pred->due_date) continue;

        const auto expected_end = add_days(*buffer->start_date, -1 - static_cast<int64_t>(edge.lag_days));
        const auto delay = days_between(expected_end, *pred->due_date);
        if (delay > 0) status.delay_days += delay;
    }

    const double ratio = static_cast<double>(status.delay_days) / static_cast<double>(status.buffer_size);
    status.consumed_percent = std::min(100.0, ratio * 100.0);
    return status;
}

std::vector<BufferStatus> buffer_report(const ProjectGraph& graph) {
    std::vector<BufferStatus> report;
    for (const auto* task : graph.tasks()) {
        if (auto status = buffer_consumption(graph, task->id)) {
            report.push_back(std::move(*status));
        }
    }
    return report;
}

}  // namespace gantt_engine
