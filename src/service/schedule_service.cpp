/**
 * @file schedule_service.cpp
 * @brief Mode dispatch, transactions and decision logging.
 */

#include "service/schedule_service.hpp"

#include "core/date.hpp"
#include "graph/cycle_guard.hpp"
#include "graph/project_graph.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace gantt_engine {

namespace {

/// Date writes for the trigger followed by every cascade entry.
std::vector<DateUpdate> date_writes(const TaskId& task, std::optional<Date> new_start,
                                    std::optional<Date> new_end, const CascadeResult& cascade) {
    std::vector<DateUpdate> writes;
    if (new_start || new_end) {
        writes.push_back({task, new_start, new_end});
    }

    std::map<TaskId, size_t> slot;
    for (const auto& entry : cascade.entries) {
        auto [it, inserted] = slot.try_emplace(entry.task_id, writes.size());
        if (inserted) writes.push_back({entry.task_id, std::nullopt, std::nullopt});
        auto& write = writes[it->second];
        switch (entry.field) {
            case CascadeField::StartDate: write.start_date = entry.new_value; break;
            case CascadeField::DueDate:   write.due_date = entry.new_value;   break;
        }
    }
    return writes;
}

/// True if the stored dates already equal the trigger change and every
/// previewed entry.
bool store_reflects(const GraphSnapshot& snapshot, const TaskId& task,
                    std::optional<Date> new_start, std::optional<Date> new_end,
                    const CascadeResult& preview) {
    const auto* trigger = snapshot.find_task(task);
    if (!trigger) return false;
    if (new_start && trigger->start_date != new_start) return false;
    if (new_end && trigger->due_date != new_end) return false;

    for (const auto& entry : preview.entries) {
        const auto* stored = snapshot.find_task(entry.task_id);
        if (!stored) return false;
        const auto& field = entry.field == CascadeField::StartDate ? stored->start_date
                                                                   : stored->due_date;
        if (field != entry.new_value) return false;
    }
    return true;
}

/// The checks compute_cascade applies to a trigger, for paths that skip it.
Result<void> check_trigger(const ProjectGraph& graph, const TaskId& task,
                           std::optional<Date> new_start, std::optional<Date> new_end) {
    const auto* stored = graph.find_task(task);
    if (!stored) return Error{ErrorCode::UnknownTask, "Task " + task + " not found"};
    if (stored->is_hammock() && (new_start || new_end)) {
        return Error{ErrorCode::DerivedDates,
                     "Hammock task " + task + " takes its dates from its neighbours"};
    }

    const auto start = new_start ? new_start : stored->start_date;
    const auto due = new_end ? new_end : stored->due_date;
    if (start && due && *start > *due) {
        return Error{ErrorCode::InvalidDates,
                     "Due date " + format_date(*due) + " is before start date " + format_date(*start)};
    }
    return {};
}

/// Add the Hammock writes that follow once `changes` lands on `snapshot`,
/// merged into any date write the set already holds for the same task.
Result<std::vector<HammockUpdate>> add_hammock_writes(const GraphSnapshot& snapshot,
                                                      ChangeSet& changes) {
    if (changes.empty()) return std::vector<HammockUpdate>{};

    GraphSnapshot after = snapshot;
    if (auto applied = apply_changes(after, changes); !applied) return applied.error();
    auto graph = ProjectGraph::build(after);
    if (!graph) return graph.error();

    auto updates = plan_hammock_updates(*graph);
    for (const auto& update : updates) {
        auto it = std::ranges::find(changes.dates, update.task_id, &DateUpdate::task);
        if (it == changes.dates.end()) {
            changes.dates.push_back({update.task_id, update.span.start, update.span.due});
        } else {
            it->start_date = update.span.start;
            it->due_date = update.span.due;
        }
    }
    return updates;
}

LogFields fields_for(const ProjectId& project, const TaskId& task) {
    return {{"project", project}, {"task", task}};
}

}  // anonymous namespace

ScheduleService::ScheduleService(IProjectStore& store, EngineConfig config, Logger& logger)
    : store_(store)
    , config_(std::move(config))
    , logger_(logger)
    , sequencer_(config_.sequencer) {}

// ─────────────────────────────────────────────
// Dependencies
// ─────────────────────────────────────────────

Result<void> ScheduleService::add_dependency(const ProjectId& project, const Dependency& dependency) {
    std::vector<HammockUpdate> hammocks;
    auto outcome = store_.transact(project, [&](const GraphSnapshot& snapshot) -> Result<ChangeSet> {
        auto graph = ProjectGraph::build(snapshot);
        if (!graph) return graph.error();

        if (auto valid = validate_new_dependency(*graph, dependency); !valid) {
            return valid.error();
        }

        ChangeSet changes;
        changes.added_dependencies.push_back(dependency);
        auto rederived = add_hammock_writes(snapshot, changes);
        if (!rederived) return rederived.error();
        hammocks = std::move(*rederived);
        return changes;
    });

    auto fields = fields_for(project, dependency.task);
    fields.emplace_back("depends_on", dependency.depends_on);
    fields.emplace_back("type", std::string(short_code(dependency.type)));

    if (!outcome) {
        fields.emplace_back("error", std::string(to_string(outcome.error().code)));
        logger_.warn("Dependency rejected: " + outcome.error().message, fields);
        return outcome;
    }

    fields.emplace_back("lag_days", std::to_string(dependency.lag_days));
    logger_.info("Dependency added", fields);
    log_hammocks(project, hammocks);
    return outcome;
}

Result<void> ScheduleService::remove_dependency(const ProjectId& project, const TaskId& task,
                                                const TaskId& depends_on) {
    std::vector<HammockUpdate> hammocks;
    auto outcome = store_.transact(project, [&](const GraphSnapshot& snapshot) -> Result<ChangeSet> {
        if (!snapshot.find_dependency(task, depends_on)) {
            return Error{ErrorCode::UnknownDependency,
                         "Task " + task + " does not depend on " + depends_on};
        }
        ChangeSet changes;
        changes.removed_dependencies.push_back({task, depends_on});
        auto rederived = add_hammock_writes(snapshot, changes);
        if (!rederived) return rederived.error();
        hammocks = std::move(*rederived);
        return changes;
    });

    auto fields = fields_for(project, task);
    fields.emplace_back("depends_on", depends_on);
    if (outcome) {
        logger_.info("Dependency removed", fields);
        log_hammocks(project, hammocks);
    } else {
        logger_.warn("Dependency removal failed: " + outcome.error().message, fields);
    }
    return outcome;
}

Result<void> ScheduleService::update_dependency(const ProjectId& project, const TaskId& task,
                                                const TaskId& depends_on,
                                                std::optional<DependencyType> type,
                                                std::optional<int32_t> lag_days) {
    std::vector<HammockUpdate> hammocks;
    auto outcome = store_.transact(project, [&](const GraphSnapshot& snapshot) -> Result<ChangeSet> {
        const auto* existing = snapshot.find_dependency(task, depends_on);
        if (!existing) {
            return Error{ErrorCode::UnknownDependency,
                         "Task " + task + " does not depend on " + depends_on};
        }

        Dependency updated = *existing;
        if (type) updated.type = *type;
        if (lag_days) updated.lag_days = *lag_days;

        ChangeSet changes;
        if (updated != *existing) changes.updated_dependencies.push_back(updated);
        auto rederived = add_hammock_writes(snapshot, changes);
        if (!rederived) return rederived.error();
        hammocks = std::move(*rederived);
        return changes;
    });

    auto fields = fields_for(project, task);
    fields.emplace_back("depends_on", depends_on);
    if (outcome) {
        logger_.info("Dependency updated", fields);
        log_hammocks(project, hammocks);
    } else {
        logger_.warn("Dependency update failed: " + outcome.error().message, fields);
    }
    return outcome;
}

// ─────────────────────────────────────────────
// Groups
// ─────────────────────────────────────────────

Result<void> ScheduleService::update_task_groups(const ProjectId& project, const TaskId& task,
                                                 std::optional<std::string> task_group,
                                                 std::optional<std::string> depends_on_group) {
    auto outcome = store_.transact(project, [&](const GraphSnapshot& snapshot) -> Result<ChangeSet> {
        const auto* stored = snapshot.find_task(task);
        if (!stored) return Error{ErrorCode::UnknownTask, "Task " + task + " not found"};

        const auto& group = task_group ? *task_group : stored->task_group;
        const auto& waits_on = depends_on_group ? *depends_on_group : stored->depends_on_group;
        if (!waits_on.empty() && waits_on == group) {
            return Error{ErrorCode::InvalidDependency,
                         "Task " + task + " cannot depend on the group it belongs to"};
        }

        ChangeSet changes;
        if (group != stored->task_group || waits_on != stored->depends_on_group) {
            changes.groups.push_back({task, task_group, depends_on_group});
        }
        return changes;
    });

    auto fields = fields_for(project, task);
    if (task_group) fields.emplace_back("task_group", *task_group);
    if (depends_on_group) fields.emplace_back("depends_on_group", *depends_on_group);
    if (outcome) {
        logger_.info("Task groups updated", fields);
    } else {
        logger_.warn("Task group change rejected: " + outcome.error().message, fields);
    }
    return outcome;
}

// ─────────────────────────────────────────────
// Dates
// ─────────────────────────────────────────────

Result<DateUpdateOutcome> ScheduleService::update_task_dates(const ProjectId& project,
                                                             const TaskId& task,
                                                             std::optional<Date> new_start,
                                                             std::optional<Date> new_end) {
    DateUpdateOutcome outcome;

    auto committed = store_.transact(project, [&](const GraphSnapshot& snapshot) -> Result<ChangeSet> {
        auto graph = ProjectGraph::build(snapshot);
        if (!graph) return graph.error();

        outcome.mode = graph->dependency_mode();
        ChangeSet changes;

        switch (outcome.mode) {
            case DependencyMode::Strict: {
                auto cascade = compute_cascade(*graph, task, new_start, new_end);
                if (!cascade) return cascade.error();
                outcome.cascade = std::move(*cascade);
                changes.dates = date_writes(task, new_start, new_end, outcome.cascade);
                break;
            }
            case DependencyMode::Flexible: {
                auto cascade = compute_cascade(*graph, task, new_start, new_end);
                if (!cascade) return cascade.error();
                outcome.cascade = std::move(*cascade);
                if (!outcome.cascade.empty()) {
                    outcome.pending_confirmation = true;
                    return changes;
                }
                changes.dates = date_writes(task, new_start, new_end, outcome.cascade);
                break;
            }
            case DependencyMode::Off: {
                if (auto valid = check_trigger(*graph, task, new_start, new_end); !valid) {
                    return valid.error();
                }
                outcome.blocked = graph->is_blocked(task);
                changes.dates = date_writes(task, new_start, new_end, CascadeResult{});
                break;
            }
        }

        auto rederived = add_hammock_writes(snapshot, changes);
        if (!rederived) return rederived.error();
        outcome.hammocks = std::move(*rederived);
        outcome.applied = !changes.empty();
        return changes;
    });

    auto fields = fields_for(project, task);
    fields.emplace_back("mode", std::string(to_string(outcome.mode)));

    if (!committed) {
        fields.emplace_back("error", std::string(to_string(committed.error().code)));
        logger_.warn("Date change rejected: " + committed.error().message, fields);
        return committed.error();
    }

    fields.emplace_back("total_affected", std::to_string(outcome.cascade.total_affected));
    if (outcome.pending_confirmation) {
        logger_.info("Cascade awaiting confirmation: " + describe(outcome.cascade), fields);
    } else {
        logger_.info("Task dates updated", fields);
    }
    for (const auto& warning : outcome.cascade.warnings) {
        logger_.warn(warning.message, fields_for(project, warning.task_id));
    }
    log_hammocks(project, outcome.hammocks);
    return outcome;
}

Result<CascadeResult> ScheduleService::preview_cascade(const ProjectId& project, const TaskId& task,
                                                       std::optional<Date> new_start,
                                                       std::optional<Date> new_end) {
    auto snapshot = store_.snapshot(project);
    if (!snapshot) return snapshot.error();

    auto graph = ProjectGraph::build(*snapshot);
    if (!graph) return graph.error();

    auto cascade = compute_cascade(*graph, task, new_start, new_end);
    if (cascade) {
        logger_.debug("Cascade preview: " + describe(*cascade), fields_for(project, task));
    }
    return cascade;
}

Result<CascadeResult> ScheduleService::apply_cascade(const ProjectId& project, const TaskId& task,
                                                     std::optional<Date> new_start,
                                                     std::optional<Date> new_end,
                                                     const CascadeResult& preview) {
    CascadeResult applied;
    bool already_applied = false;
    std::vector<HammockUpdate> hammocks;

    auto committed = store_.transact(project, [&](const GraphSnapshot& snapshot) -> Result<ChangeSet> {
        auto graph = ProjectGraph::build(snapshot);
        if (!graph) return graph.error();

        auto fresh = compute_cascade(*graph, task, new_start, new_end);
        if (!fresh) return fresh.error();

        ChangeSet changes;
        if (*fresh == preview) {
            applied = std::move(*fresh);
            changes.dates = date_writes(task, new_start, new_end, applied);
            auto rederived = add_hammock_writes(snapshot, changes);
            if (!rederived) return rederived.error();
            hammocks = std::move(*rederived);
            return changes;
        }
        if (store_reflects(snapshot, task, new_start, new_end, preview)) {
            already_applied = true;
            applied = preview;
            return changes;
        }
        return Error{ErrorCode::StaleCascadePreview,
                     "Schedule changed since the preview; please review again"};
    });

    auto fields = fields_for(project, task);
    if (!committed) {
        fields.emplace_back("error", std::string(to_string(committed.error().code)));
        logger_.warn("Cascade not applied: " + committed.error().message, fields);
        return committed.error();
    }

    fields.emplace_back("total_affected", std::to_string(applied.total_affected));
    logger_.info(already_applied ? "Cascade already applied" : "Cascade applied", fields);
    log_hammocks(project, hammocks);
    return applied;
}

Result<CascadeResult> ScheduleService::complete_task(const ProjectId& project, const TaskId& task,
                                                     Date today) {
    CascadeResult advance;
    std::vector<HammockUpdate> hammocks;

    auto committed = store_.transact(project, [&](const GraphSnapshot& snapshot) -> Result<ChangeSet> {
        auto graph = ProjectGraph::build(snapshot);
        if (!graph) return graph.error();
        if (!graph->find_task(task)) {
            return Error{ErrorCode::UnknownTask, "Task " + task + " not found"};
        }

        ChangeSet changes;
        changes.statuses.push_back({task, TaskStatus::Completed});

        if (graph->dependency_mode() != DependencyMode::Off) {
            auto planned = plan_completion_advance(*graph, task, today);
            if (!planned) return planned.error();
            advance = std::move(*planned);
            changes.dates = date_writes(task, std::nullopt, std::nullopt, advance);
        }

        auto rederived = add_hammock_writes(snapshot, changes);
        if (!rederived) return rederived.error();
        hammocks = std::move(*rederived);
        return changes;
    });

    auto fields = fields_for(project, task);
    if (!committed) {
        logger_.warn("Completion failed: " + committed.error().message, fields);
        return committed.error();
    }

    fields.emplace_back("advanced", std::to_string(advance.total_affected));
    logger_.info("Task completed", fields);
    log_hammocks(project, hammocks);
    return advance;
}

// ─────────────────────────────────────────────
// Read-only Views
// ─────────────────────────────────────────────

Result<CriticalPathResult> ScheduleService::critical_path(const ProjectId& project) {
    auto snapshot = store_.snapshot(project);
    if (!snapshot) return snapshot.error();

    auto graph = ProjectGraph::build(*snapshot);
    if (!graph) return graph.error();

    auto result = analyze_critical_path(*graph, CriticalPathOptions{
        .default_duration_days = config_.scheduling.default_duration_days,
    });
    for (const auto& warning : result.warnings) {
        logger_.warn(warning.message, fields_for(project, warning.task_id));
    }
    return result;
}

Result<std::vector<TaskId>> ScheduleService::blocked_tasks(const ProjectId& project) {
    auto snapshot = store_.snapshot(project);
    if (!snapshot) return snapshot.error();

    auto graph = ProjectGraph::build(*snapshot);
    if (!graph) return graph.error();

    std::vector<TaskId> blocked;
    for (const auto* task : graph->tasks()) {
        if (is_blocked(*graph, task->id)) blocked.push_back(task->id);
    }
    return blocked;
}

Result<std::vector<BufferStatus>> ScheduleService::buffer_status(const ProjectId& project) {
    auto snapshot = store_.snapshot(project);
    if (!snapshot) return snapshot.error();

    auto graph = ProjectGraph::build(*snapshot);
    if (!graph) return graph.error();

    auto report = buffer_report(*graph);
    for (const auto& status : report) {
        if (status.consumed_percent >= 100.0) {
            logger_.warn("Buffer exhausted", fields_for(project, status.task_id));
        }
    }
    return report;
}

// ─────────────────────────────────────────────
// Ordering
// ─────────────────────────────────────────────

Result<ReorderResult> ScheduleService::reorder_item(const ProjectId& project, const ItemId& item,
                                                    const std::optional<ItemId>& prev_id,
                                                    const std::optional<ItemId>& next_id) {
    ReorderResult reordered;

    auto committed = store_.transact(project, [&](const GraphSnapshot& snapshot) -> Result<ChangeSet> {
        auto result = sequencer_.reorder(items_from_snapshot(snapshot), item, prev_id, next_id);
        if (!result) return result.error();
        reordered = std::move(*result);

        ChangeSet changes;
        changes.sort_orders.push_back({reordered.item, reordered.sort_order});
        for (const auto& key : reordered.rekeyed) {
            changes.sort_orders.push_back({key.id, key.sort_order});
        }
        return changes;
    });

    LogFields fields{{"project", project}, {"item", item}};
    if (!committed) {
        logger_.warn("Reorder rejected: " + committed.error().message, fields);
        return committed.error();
    }

    if (reordered.renormalized) {
        fields.emplace_back("rekeyed", std::to_string(reordered.rekeyed.size()));
        logger_.info("Sort keys renormalized", fields);
    }
    logger_.debug("Item reordered", fields);
    return reordered;
}

void ScheduleService::log_hammocks(const ProjectId& project,
                                   const std::vector<HammockUpdate>& updates) {
    for (const auto& update : updates) {
        auto fields = fields_for(project, update.task_id);
        fields.emplace_back("start_date", format_date(update.span.start));
        fields.emplace_back("due_date", format_date(update.span.due));
        logger_.info("Hammock dates rederived", fields);
    }
}

}  // namespace gantt_engine
