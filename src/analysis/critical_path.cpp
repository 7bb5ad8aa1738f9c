/**
 * @file critical_path.cpp
 * @brief CPM forward/backward passes.
 *
 * Offsets are measured between boundaries: `es` is the start boundary and
 * `ef` the finish boundary (morning after the last day), both in days from
 * the project start. With d = duration of the successor S and D that of the
 * predecessor P:
 *
 *   type | forward: es(S) >=      | backward: lf(P) <=
 *   FS   | ef(P) + lag            | ls(S) - lag
 *   SS   | es(P) + lag            | ls(S) - lag + D
 *   FF   | ef(P) + lag - d        | lf(S) - lag
 *   SF   | es(P) + lag - d        | lf(S) - lag + D
 */

#include "analysis/critical_path.hpp"

#include "core/date.hpp"

#include <algorithm>
#include <unordered_map>

namespace gantt_engine {

namespace {

struct Offsets {
    int64_t duration = 0;
    int64_t es = 0;
    int64_t ef = 0;
    int64_t ls = 0;
    int64_t lf = 0;
};

std::optional<Date> earliest_task_date(const ProjectGraph& graph) {
    std::optional<Date> earliest;
    for (const auto* task : graph.tasks()) {
        if (auto span = task->span(); span && (!earliest || span->start < *earliest)) {
            earliest = span->start;
        }
    }
    return earliest;
}

int64_t forward_bound(const EdgeRef& edge, const Offsets& pred, int64_t own_duration) {
    switch (edge.type) {
        case DependencyType::FinishToStart:  return pred.ef + edge.lag_days;
        case DependencyType::StartToStart:   return pred.es + edge.lag_days;
        case DependencyType::FinishToFinish: return pred.ef + edge.lag_days - own_duration;
        case DependencyType::StartToFinish:  return pred.es + edge.lag_days - own_duration;
    }
    return pred.ef + edge.lag_days;
}

int64_t backward_bound(const EdgeRef& edge, const Offsets& succ, int64_t own_duration) {
    switch (edge.type) {
        case DependencyType::FinishToStart:  return succ.ls - edge.lag_days;
        case DependencyType::StartToStart:   return succ.ls - edge.lag_days + own_duration;
        case DependencyType::FinishToFinish: return succ.lf - edge.lag_days;
        case DependencyType::StartToFinish:  return succ.lf - edge.lag_days + own_duration;
    }
    return succ.ls - edge.lag_days;
}

}  // anonymous namespace

const TaskSchedule* CriticalPathResult::find(const TaskId& id) const noexcept {
    auto it = std::find_if(schedule.begin(), schedule.end(),
                           [&](const TaskSchedule& s) { return s.task_id == id; });
    return it == schedule.end() ? nullptr : &*it;
}

bool CriticalPathResult::is_critical(const TaskId& id) const noexcept {
    const auto* entry = find(id);
    return entry && entry->critical;
}

CriticalPathResult analyze_critical_path(const ProjectGraph& graph,
                                         const CriticalPathOptions& options) {
    return analyze_critical_path(graph, graph.project_start(), options);
}

CriticalPathResult analyze_critical_path(const ProjectGraph& graph,
                                         std::optional<Date> project_start,
                                         const CriticalPathOptions& options) {
    CriticalPathResult result;
    if (graph.task_count() == 0) return result;

    if (!project_start) project_start = earliest_task_date(graph);
    if (!project_start) {
        result.warnings.push_back(Warning{
            ErrorCode::MissingProjectStart, {},
            "Project " + graph.project_id() + " has no start date and no dated tasks"});
        return result;
    }
    result.project_start = project_start;

    const auto order = graph.topological_order();
    std::unordered_map<TaskId, Offsets> offsets;
    offsets.reserve(order.size());

    // ── Forward pass ──────────────────────────
    for (const auto& id : order) {
        const auto* task = graph.find_task(id);
        auto& own = offsets[id];
        if (auto span = task->span()) {
            own.duration = span->duration_days();
        } else {
            own.duration = options.default_duration_days;
            if (!graph.successors(id).empty()) {
                result.warnings.push_back(Warning{
                    ErrorCode::UnscheduledPredecessor, id,
                    "Task " + id + " has no dates; assuming " +
                        std::to_string(options.default_duration_days) + " day(s)"});
            }
        }

        own.es = 0;
        for (const auto& edge : graph.predecessors(id)) {
            own.es = std::max(own.es, forward_bound(edge, offsets.at(edge.other), own.duration));
        }
        own.ef = own.es + own.duration;
    }

    // Terminal tasks seed the finish; a start-linked predecessor may still
    // end later than every terminal task, so it is folded in too.
    int64_t finish = 0;
    for (const auto& [_, o] : offsets) finish = std::max(finish, o.ef);

    // ── Backward pass ─────────────────────────
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        auto& own = offsets[*it];
        own.lf = finish;
        for (const auto& edge : graph.successors(*it)) {
            own.lf = std::min(own.lf, backward_bound(edge, offsets.at(edge.other), own.duration));
        }
        own.ls = own.lf - own.duration;
    }

    const Date origin = *project_start;
    result.project_finish = add_days(origin, finish - 1);
    result.schedule.reserve(order.size());

    for (const auto& id : order) {
        const auto& o = offsets.at(id);
        TaskSchedule entry{
            .task_id = id,
            .duration_days = o.duration,
            .earliest_start = add_days(origin, o.es),
            .earliest_finish = add_days(origin, o.ef - 1),
            .latest_start = add_days(origin, o.ls),
            .latest_finish = add_days(origin, o.lf - 1),
            .slack_days = o.ls - o.es,
            .critical = o.ls == o.es,
            .unscheduled = graph.find_task(id)->is_unscheduled(),
        };
        if (entry.critical) result.critical_path.push_back(id);
        result.schedule.push_back(std::move(entry));
    }

    return result;
}

}  // namespace gantt_engine
