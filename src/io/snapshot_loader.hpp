/**
 * @file snapshot_loader.hpp
 * @brief TOML project files ⇄ GraphSnapshot, using toml++.
 *
 * File layout:
 *
 *   [project]        id, start_date, dependency_mode
 *   [[tasks]]        id, name, start_date, due_date, status, sort_order
 *   [[milestones]]   id, name, due_date, sort_order
 *   [[dependencies]] task, depends_on, type, lag_days
 *
 * Dates are TOML local dates or "YYYY-MM-DD" strings. Creation order is file
 * order. Structural checks (cycles, unknown ids) are left to ProjectGraph.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "graph/snapshot.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace gantt_engine {

/// Read a snapshot file; a project without dependency_mode takes the configured default.
Result<GraphSnapshot> load_snapshot(const std::filesystem::path& path,
                                    const SchedulingConfig& defaults = {});

Result<GraphSnapshot> parse_snapshot(std::string_view toml_text,
                                     const SchedulingConfig& defaults = {});

[[nodiscard]] std::string format_snapshot(const GraphSnapshot& snapshot);

Result<void> save_snapshot(const GraphSnapshot& snapshot, const std::filesystem::path& path);

}  // namespace gantt_engine
