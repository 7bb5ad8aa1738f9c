/**
 * @file schedule_service.hpp
 * @brief Caller-side dispatch of scheduling operations onto a project store.
 *
 * Every mutation builds a fresh ProjectGraph from the snapshot handed out by
 * IProjectStore::transact and returns the resulting ChangeSet, so the read
 * used for cycle and cascade checks is the one the write is based on. The
 * project's dependency mode decides what a date change writes:
 *
 *   Strict   → the change and its whole cascade in one commit
 *   Flexible → the change alone if nothing cascades, otherwise nothing
 *              (the cascade comes back as a preview for apply_cascade)
 *   Off      → the change alone, plus the task's blocked status
 *
 * Whatever a commit writes, Hammock tasks are rederived from the resulting
 * dates and edges in the same commit.
 */

#pragma once

#include "analysis/buffer_tracker.hpp"
#include "analysis/critical_path.hpp"
#include "cascade/cascade_engine.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "sequencer/sequencer.hpp"
#include "service/project_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gantt_engine {

struct DateUpdateOutcome {
    DependencyMode mode = DependencyMode::Flexible;
    bool applied = false;                ///< Something was written
    bool pending_confirmation = false;   ///< Flexible: cascade awaits apply_cascade
    CascadeResult cascade;
    bool blocked = false;                ///< Off: some FS predecessor is open
    std::vector<HammockUpdate> hammocks; ///< Hammock tasks rederived in the same commit
};

class ScheduleService {
public:
    ScheduleService(IProjectStore& store, EngineConfig config, Logger& logger);

    // ── Dependencies ──────────────────────────
    Result<void> add_dependency(const ProjectId& project, const Dependency& dependency);
    Result<void> remove_dependency(const ProjectId& project, const TaskId& task,
                                   const TaskId& depends_on);
    Result<void> update_dependency(const ProjectId& project, const TaskId& task,
                                   const TaskId& depends_on,
                                   std::optional<DependencyType> type,
                                   std::optional<int32_t> lag_days);

    // ── Groups ────────────────────────────────

    /// Set either group field; a task may not depend on its own group.
    Result<void> update_task_groups(const ProjectId& project, const TaskId& task,
                                    std::optional<std::string> task_group,
                                    std::optional<std::string> depends_on_group);

    // ── Dates ─────────────────────────────────
    Result<DateUpdateOutcome> update_task_dates(const ProjectId& project, const TaskId& task,
                                                std::optional<Date> new_start,
                                                std::optional<Date> new_end);

    /// Read-only; the same inputs give the same result until the project changes.
    Result<CascadeResult> preview_cascade(const ProjectId& project, const TaskId& task,
                                          std::optional<Date> new_start,
                                          std::optional<Date> new_end);

    /**
     * @brief Confirm a Flexible preview.
     *
     * The cascade is recomputed inside the transaction. A match is applied
     * together with the trigger change; a store that already holds the
     * previewed dates is left alone; anything else is StaleCascadePreview.
     */
    Result<CascadeResult> apply_cascade(const ProjectId& project, const TaskId& task,
                                        std::optional<Date> new_start,
                                        std::optional<Date> new_end,
                                        const CascadeResult& preview);

    /// Mark Completed and, unless the mode is Off, pull ready FS successors forward.
    Result<CascadeResult> complete_task(const ProjectId& project, const TaskId& task, Date today);

    // ── Read-only views ───────────────────────
    Result<CriticalPathResult> critical_path(const ProjectId& project);
    Result<std::vector<TaskId>> blocked_tasks(const ProjectId& project);
    Result<std::vector<BufferStatus>> buffer_status(const ProjectId& project);

    // ── Ordering ──────────────────────────────
    Result<ReorderResult> reorder_item(const ProjectId& project, const ItemId& item,
                                       const std::optional<ItemId>& prev_id,
                                       const std::optional<ItemId>& next_id);

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    void log_hammocks(const ProjectId& project, const std::vector<HammockUpdate>& updates);

    IProjectStore& store_;
    EngineConfig config_;
    Logger& logger_;
    Sequencer sequencer_;
};

}  // namespace gantt_engine
