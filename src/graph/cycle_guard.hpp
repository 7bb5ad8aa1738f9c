/**
 * @file cycle_guard.hpp
 * @brief Insertion-time cycle prevention for dependency edges.
 *
 * Edges are stored as "task depends on depends_on". A candidate edge closes a
 * cycle exactly when `depends_on` already (transitively) depends on `task`,
 * so the search starts at `depends_on` and follows the stored depends-on
 * links. The check must run on the edge set as it exists immediately before
 * the insertion, inside the same store transaction.
 */

#pragma once

#include "core/result.hpp"
#include "graph/project_graph.hpp"
#include "graph/snapshot.hpp"

#include <span>

namespace gantt_engine {

/**
 * @brief Reject `candidate` if adding it to `existing_edges` would close a cycle.
 *
 * A self-loop is rejected without searching. On rejection the error code is
 * CycleDetected and `path` lists the cycle, beginning and ending with
 * `candidate.depends_on` (adding "C depends on A" while A depends on C gives
 * A → C → A).
 */
[[nodiscard]] Result<void> would_create_cycle(const Dependency& candidate,
                                              std::span<const Dependency> existing_edges);

/// Boolean form of would_create_cycle.
[[nodiscard]] bool creates_cycle(const Dependency& candidate,
                                 std::span<const Dependency> existing_edges);

/**
 * @brief Full validation of a new edge against a graph: both endpoints are
 *        tasks, the pair is new, and no cycle is closed.
 */
[[nodiscard]] Result<void> validate_new_dependency(const ProjectGraph& graph,
                                                   const Dependency& candidate);

}  // namespace gantt_engine
