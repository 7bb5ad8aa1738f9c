/**
 * @file project_store.cpp
 * @brief In-memory store with copy-then-swap commits.
 */

#include "service/project_store.hpp"

#include <algorithm>

namespace gantt_engine {

bool ChangeSet::empty() const noexcept {
    return size() == 0;
}

size_t ChangeSet::size() const noexcept {
    return dates.size() + statuses.size() + groups.size() + sort_orders.size() +
           added_dependencies.size() + removed_dependencies.size() + updated_dependencies.size();
}

void InMemoryProjectStore::put(GraphSnapshot snapshot) {
    std::lock_guard lock(mutex_);
    auto id = snapshot.project_id;
    projects_.insert_or_assign(std::move(id), std::move(snapshot));
}

Result<GraphSnapshot> InMemoryProjectStore::snapshot(const ProjectId& project) const {
    std::lock_guard lock(mutex_);
    auto it = projects_.find(project);
    if (it == projects_.end()) {
        return make_error<GraphSnapshot>(ErrorCode::UnknownProject, "Project " + project + " not found");
    }
    return it->second;
}

Result<void> InMemoryProjectStore::transact(const ProjectId& project, const TransactionBody& body) {
    std::lock_guard lock(mutex_);
    auto it = projects_.find(project);
    if (it == projects_.end()) {
        return Error{ErrorCode::UnknownProject, "Project " + project + " not found"};
    }

    auto changes = body(it->second);
    if (!changes) return changes.error();
    if (changes->empty()) return {};

    if (fail_next_) {
        fail_next_ = false;
        return Error{ErrorCode::StoreFailure, "Commit rejected by store"};
    }

    GraphSnapshot working = it->second;
    if (auto applied = apply_changes(working, *changes); !applied) {
        return applied.error();
    }

    it->second = std::move(working);
    ++commits_;
    return {};
}

void InMemoryProjectStore::fail_next_commit() noexcept {
    std::lock_guard lock(mutex_);
    fail_next_ = true;
}

uint64_t InMemoryProjectStore::commit_count() const noexcept {
    std::lock_guard lock(mutex_);
    return commits_;
}

Result<void> apply_changes(GraphSnapshot& target, const ChangeSet& changes) {
    auto missing = [](const std::string& what, const std::string& id) {
        return Error{ErrorCode::StoreFailure, what + " " + id + " does not exist"};
    };

    for (const auto& update : changes.dates) {
        auto* task = target.find_task(update.task);
        if (!task) return missing("Task", update.task);
        if (update.start_date) task->start_date = update.start_date;
        if (update.due_date) task->due_date = update.due_date;
        if (task->start_date && task->due_date && *task->start_date > *task->due_date) {
            return Error{ErrorCode::StoreFailure, "Task " + task->id + " would end before it starts"};
        }
    }

    for (const auto& update : changes.statuses) {
        auto* task = target.find_task(update.task);
        if (!task) return missing("Task", update.task);
        task->status = update.status;
    }

    for (const auto& update : changes.groups) {
        auto* task = target.find_task(update.task);
        if (!task) return missing("Task", update.task);
        if (update.task_group) task->task_group = *update.task_group;
        if (update.depends_on_group) task->depends_on_group = *update.depends_on_group;
    }

    for (const auto& update : changes.sort_orders) {
        if (auto* task = target.find_task(update.item)) {
            task->sort_order = update.sort_order;
        } else if (auto* milestone = target.find_milestone(update.item)) {
            milestone->sort_order = update.sort_order;
        } else {
            return missing("Item", update.item);
        }
    }

    auto& deps = target.dependencies;
    for (const auto& key : changes.removed_dependencies) {
        auto removed = std::erase_if(deps, [&](const Dependency& d) {
            return d.task == key.task && d.depends_on == key.depends_on;
        });
        if (removed == 0) return missing("Dependency", key.task + " <- " + key.depends_on);
    }

    for (const auto& update : changes.updated_dependencies) {
        auto it = std::ranges::find_if(deps, [&](const Dependency& d) {
            return d.task == update.task && d.depends_on == update.depends_on;
        });
        if (it == deps.end()) return missing("Dependency", update.task + " <- " + update.depends_on);
        *it = update;
    }

    for (const auto& dep : changes.added_dependencies) {
        if (!target.find_task(dep.task)) return missing("Task", dep.task);
        if (!target.find_task(dep.depends_on)) return missing("Task", dep.depends_on);
        if (target.find_dependency(dep.task, dep.depends_on)) {
            return Error{ErrorCode::StoreFailure, "Dependency " + dep.task + " <- " + dep.depends_on +
                                                      " already stored"};
        }
        deps.push_back(dep);
    }

    return {};
}

}  // namespace gantt_engine
