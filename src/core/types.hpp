/**
 * @file types.hpp
 * @brief Fundamental types used throughout GanttEngine.
 *
 * Defines identifiers, the calendar-day Date type, and the closed enums for
 * task status, dependency type, project dependency mode and task scheduling
 * type, together with their textual forms.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gantt_engine {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;
using ItemId = std::string;      ///< Task or milestone id (shared ordering space)
using ProjectId = std::string;

/// Calendar day, no time component.
using Date = std::chrono::sys_days;

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    Open,
    InProgress,
    Review,
    Completed,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Open:       return "Open";
        case TaskStatus::InProgress: return "In Progress";
        case TaskStatus::Review:     return "Review";
        case TaskStatus::Completed:  return "Completed";
        case TaskStatus::Cancelled:  return "Cancelled";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<TaskStatus> parse_task_status(std::string_view text) noexcept {
    if (text == "Open") return TaskStatus::Open;
    if (text == "In Progress" || text == "InProgress") return TaskStatus::InProgress;
    if (text == "Review") return TaskStatus::Review;
    if (text == "Completed") return TaskStatus::Completed;
    if (text == "Cancelled") return TaskStatus::Cancelled;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Dependency Type
// ─────────────────────────────────────────────

/**
 * @brief The four precedence relations between a task and its predecessor.
 *
 * Handled by exhaustive switches everywhere; adding a value is a compile
 * warning at every dispatch site.
 */
enum class DependencyType : uint8_t {
    FinishToStart,   ///< FS
    StartToStart,    ///< SS
    FinishToFinish,  ///< FF
    StartToFinish    ///< SF
};

/// Two-letter code used by the Gantt chart.
[[nodiscard]] constexpr std::string_view short_code(DependencyType type) noexcept {
    switch (type) {
        case DependencyType::FinishToStart:  return "FS";
        case DependencyType::StartToStart:   return "SS";
        case DependencyType::FinishToFinish: return "FF";
        case DependencyType::StartToFinish:  return "SF";
    }
    return "FS";
}

[[nodiscard]] constexpr std::string_view to_string(DependencyType type) noexcept {
    switch (type) {
        case DependencyType::FinishToStart:  return "Finish to Start";
        case DependencyType::StartToStart:   return "Start to Start";
        case DependencyType::FinishToFinish: return "Finish to Finish";
        case DependencyType::StartToFinish:  return "Start to Finish";
    }
    return "unknown";
}

/// Accepts both the short codes and the long forms.
[[nodiscard]] constexpr std::optional<DependencyType> parse_dependency_type(std::string_view text) noexcept {
    if (text == "FS" || text == "Finish to Start")  return DependencyType::FinishToStart;
    if (text == "SS" || text == "Start to Start")   return DependencyType::StartToStart;
    if (text == "FF" || text == "Finish to Finish") return DependencyType::FinishToFinish;
    if (text == "SF" || text == "Start to Finish")  return DependencyType::StartToFinish;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Project Dependency Mode
// ─────────────────────────────────────────────

enum class DependencyMode : uint8_t {
    Strict,    ///< Cascade applied atomically with the change
    Flexible,  ///< Cascade returned as a preview, applied on confirmation
    Off        ///< No cascading; edges only drive "blocked" indicators
};

[[nodiscard]] constexpr std::string_view to_string(DependencyMode mode) noexcept {
    switch (mode) {
        case DependencyMode::Strict:   return "Strict";
        case DependencyMode::Flexible: return "Flexible";
        case DependencyMode::Off:      return "Off";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<DependencyMode> parse_dependency_mode(std::string_view text) noexcept {
    if (text == "Strict")   return DependencyMode::Strict;
    if (text == "Flexible") return DependencyMode::Flexible;
    if (text == "Off")      return DependencyMode::Off;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Task Scheduling Type
// ─────────────────────────────────────────────

enum class SchedulingType : uint8_t {
    FixedDuration,  ///< Dates are set by hand and moved by cascades
    Hammock,        ///< Dates span the gap between FS predecessors and successors
    Buffer          ///< Absorbs FS predecessor delay up to buffer_size days
};

[[nodiscard]] constexpr std::string_view to_string(SchedulingType type) noexcept {
    switch (type) {
        case SchedulingType::FixedDuration: return "Fixed Duration";
        case SchedulingType::Hammock:       return "Hammock";
        case SchedulingType::Buffer:        return "Buffer";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<SchedulingType> parse_scheduling_type(std::string_view text) noexcept {
    if (text == "Fixed Duration" || text == "FixedDuration") return SchedulingType::FixedDuration;
    if (text == "Hammock") return SchedulingType::Hammock;
    if (text == "Buffer")  return SchedulingType::Buffer;
    return std::nullopt;
}

}  // namespace gantt_engine
