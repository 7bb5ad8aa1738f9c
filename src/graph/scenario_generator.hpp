/**
 * @file scenario_generator.hpp
 * @brief Synthetic project snapshots for testing and benchmarking.
 */

#pragma once

#include "graph/snapshot.hpp"

#include <cstdint>
#include <random>

namespace gantt_engine {

/**
 * @brief Factory for synthetic project snapshots with various topologies.
 *
 * Tasks are laid out back to back so that every generated FS edge is
 * satisfied with no slack to spare. Sort keys follow creation order.
 */
class ScenarioGenerator {
public:
    /// Linear chain: T0 → T1 → ... → Tn-1
    static GraphSnapshot linear_chain(size_t num_tasks, Date start, int64_t duration_days = 5);

    /// Fan-out / fan-in: src → {b0, b1, ...} → sink
    static GraphSnapshot fan_out_fan_in(size_t width, Date start, int64_t duration_days = 5);

    /// Diamond: repeated fan-out/fan-in at each depth level
    static GraphSnapshot diamond(size_t depth, size_t width, Date start, int64_t duration_days = 5);

    /**
     * @brief Random DAG; edges only run from lower to higher index.
     *
     * Each edge gets a random type and a lag in [0, max_lag_days]. Task dates
     * are random and need not satisfy the edges.
     */
    static GraphSnapshot random_dag(size_t num_tasks,
                                    float edge_probability,
                                    Date start,
                                    int64_t max_duration_days,
                                    int32_t max_lag_days,
                                    std::mt19937& rng);
};

}  // namespace gantt_engine
