/**
 * @file date.hpp
 * @brief Calendar-day helpers: ISO parsing/formatting and day arithmetic.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gantt_engine {

/// Build a Date from year/month/day; nullopt if the triple is not a valid day.
[[nodiscard]] std::optional<Date> make_date(int year, unsigned month, unsigned day) noexcept;

/// Parse "YYYY-MM-DD".
[[nodiscard]] std::optional<Date> parse_date(std::string_view text) noexcept;

/// Format as "YYYY-MM-DD".
[[nodiscard]] std::string format_date(Date date);

/// Format an optional date; empty optional prints as "-".
[[nodiscard]] std::string format_date(const std::optional<Date>& date);

[[nodiscard]] constexpr Date add_days(Date date, int64_t days) noexcept {
    return date + std::chrono::days{days};
}

/// Signed number of days from `from` to `to`.
[[nodiscard]] constexpr int64_t days_between(Date from, Date to) noexcept {
    return (to - from).count();
}

}  // namespace gantt_engine
