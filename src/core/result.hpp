/**
 * @file result.hpp
 * @brief Monadic error handling type for GanttEngine.
 *
 * Provides Result<T, E> as the error-handling mechanism of every engine
 * operation. Engine errors are typed values (ErrorCode + message + optional
 * task path) and never cross the storage transaction boundary as exceptions.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace gantt_engine {

// ─────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────

enum class ErrorCode : uint8_t {
    Internal,
    CycleDetected,                ///< Edge would close a cycle; path holds it
    UnscheduledPredecessor,       ///< Warning: predecessor without dates
    MissingProjectStart,          ///< Warning: no anchor date for CPM
    StaleCascadePreview,          ///< Flexible apply found a different cascade
    SequencerPrecisionExhausted,  ///< Internal: triggers renormalization
    InvalidNeighbors,
    UnknownProject,
    UnknownTask,
    UnknownItem,
    UnknownDependency,
    DuplicateId,
    DuplicateDependency,
    SelfDependency,
    InvalidDependency,
    InvalidDates,
    DerivedDates,                 ///< Hammock dates cannot be set by hand
    StoreFailure,
    ConfigError,
    ParseError
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Internal:                    return "Internal";
        case ErrorCode::CycleDetected:               return "CycleDetected";
        case ErrorCode::UnscheduledPredecessor:      return "UnscheduledPredecessor";
        case ErrorCode::MissingProjectStart:         return "MissingProjectStart";
        case ErrorCode::StaleCascadePreview:         return "StaleCascadePreview";
        case ErrorCode::SequencerPrecisionExhausted: return "SequencerPrecisionExhausted";
        case ErrorCode::InvalidNeighbors:            return "InvalidNeighbors";
        case ErrorCode::UnknownProject:              return "UnknownProject";
        case ErrorCode::UnknownTask:                 return "UnknownTask";
        case ErrorCode::UnknownItem:                 return "UnknownItem";
        case ErrorCode::UnknownDependency:           return "UnknownDependency";
        case ErrorCode::DuplicateId:                 return "DuplicateId";
        case ErrorCode::DuplicateDependency:         return "DuplicateDependency";
        case ErrorCode::SelfDependency:              return "SelfDependency";
        case ErrorCode::InvalidDependency:           return "InvalidDependency";
        case ErrorCode::InvalidDates:                return "InvalidDates";
        case ErrorCode::DerivedDates:                return "DerivedDates";
        case ErrorCode::StoreFailure:                return "StoreFailure";
        case ErrorCode::ConfigError:                 return "ConfigError";
        case ErrorCode::ParseError:                  return "ParseError";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a code, a descriptive message and, for graph
 *        errors, the task path involved (e.g. the would-be cycle).
 */
struct Error {
    ErrorCode code = ErrorCode::Internal;
    std::string message;
    std::vector<TaskId> path;

    explicit Error(std::string msg) : message(std::move(msg)) {}

    Error(ErrorCode error_code, std::string msg, std::vector<TaskId> task_path = {})
        : code(error_code), message(std::move(msg)), path(std::move(task_path)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    bool operator==(const Error&) const = default;
};

/**
 * @brief Non-fatal condition attached to a successful result
 *        (e.g. an unscheduled predecessor met during date arithmetic).
 */
struct Warning {
    ErrorCode code = ErrorCode::Internal;
    TaskId task_id;
    std::string message;

    bool operator==(const Warning&) const = default;
};

/**
 * @brief Result<T, E>: a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorCode code, std::string message, std::vector<TaskId> path = {}) {
    return Result<T, E>(E{code, std::move(message), std::move(path)});
}

}  // namespace gantt_engine
