/**
 * @file project_store.hpp
 * @brief Boundary to the collaborator that owns durable project records.
 *
 * The engine reads a GraphSnapshot and hands back a ChangeSet; the store
 * decides how both are made serializable. `transact` runs the body against a
 * snapshot taken under the store's own isolation and commits whatever the
 * body returns all-or-nothing. A body that returns an error commits nothing.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/snapshot.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gantt_engine {

// ─────────────────────────────────────────────
// Change Set
// ─────────────────────────────────────────────

/// New dates for one task; an empty field keeps the stored value.
struct DateUpdate {
    TaskId task;
    std::optional<Date> start_date;
    std::optional<Date> due_date;

    bool operator==(const DateUpdate&) const = default;
};

struct StatusUpdate {
    TaskId task;
    TaskStatus status = TaskStatus::Open;
};

/// Group membership for one task; an empty field keeps the stored value.
struct GroupUpdate {
    TaskId task;
    std::optional<std::string> task_group;
    std::optional<std::string> depends_on_group;
};

struct SortOrderUpdate {
    ItemId item;
    double sort_order = 0.0;
};

struct DependencyKey {
    TaskId task;
    TaskId depends_on;
};

/**
 * @brief The writes of one transaction.
 */
struct ChangeSet {
    std::vector<DateUpdate> dates;
    std::vector<StatusUpdate> statuses;
    std::vector<GroupUpdate> groups;
    std::vector<SortOrderUpdate> sort_orders;
    std::vector<Dependency> added_dependencies;
    std::vector<DependencyKey> removed_dependencies;
    std::vector<Dependency> updated_dependencies;   ///< Matched by (task, depends_on)

    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] size_t size() const noexcept;
};

using TransactionBody = std::function<Result<ChangeSet>(const GraphSnapshot&)>;

/**
 * @brief Apply `changes` to `target` in place.
 *
 * Fails with StoreFailure on an id that does not exist, a duplicate edge, or
 * dates that would end before they start; `target` may then be partly
 * written, so callers apply to a copy.
 */
Result<void> apply_changes(GraphSnapshot& target, const ChangeSet& changes);

// ─────────────────────────────────────────────
// IProjectStore (Virtual)
// ─────────────────────────────────────────────

class IProjectStore {
public:
    virtual ~IProjectStore() = default;

    /// Copy of the current records; may be stale by the time it is used.
    virtual Result<GraphSnapshot> snapshot(const ProjectId& project) const = 0;

    /// Run `body` on a serializable snapshot and commit its ChangeSet.
    virtual Result<void> transact(const ProjectId& project, const TransactionBody& body) = 0;
};

// ─────────────────────────────────────────────
// InMemoryProjectStore
// ─────────────────────────────────────────────

/**
 * @brief Mutex-serialized store over in-memory snapshots.
 *
 * A commit is applied to a copy and swapped in only when every change in the
 * set could be applied, so a failed commit leaves the project untouched.
 */
class InMemoryProjectStore : public IProjectStore {
public:
    InMemoryProjectStore() = default;

    /// Register (or replace) a project.
    void put(GraphSnapshot snapshot);

    Result<GraphSnapshot> snapshot(const ProjectId& project) const override;
    Result<void> transact(const ProjectId& project, const TransactionBody& body) override;

    /// Make the next non-empty commit fail with StoreFailure.
    void fail_next_commit() noexcept;

    /// Number of non-empty commits so far.
    [[nodiscard]] uint64_t commit_count() const noexcept;

private:
    std::map<ProjectId, GraphSnapshot> projects_;
    bool fail_next_ = false;
    uint64_t commits_ = 0;
    mutable std::mutex mutex_;
};

}  // namespace gantt_engine
