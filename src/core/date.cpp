/**
 * @file date.cpp
 * @brief Calendar-day parsing and formatting.
 */

#include "core/date.hpp"

#include <charconv>
#include <cstdio>

namespace gantt_engine {

std::optional<Date> make_date(int year, unsigned month, unsigned day) noexcept {
    std::chrono::year_month_day ymd{std::chrono::year{year},
                                    std::chrono::month{month},
                                    std::chrono::day{day}};
    if (!ymd.ok()) return std::nullopt;
    return std::chrono::sys_days{ymd};
}

std::optional<Date> parse_date(std::string_view text) noexcept {
    // Exactly YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;

    auto parse_part = [&](size_t offset, size_t length, int& out) {
        const char* first = text.data() + offset;
        const char* last = first + length;
        auto [ptr, ec] = std::from_chars(first, last, out);
        return ec == std::errc{} && ptr == last;
    };

    int year = 0;
    int month = 0;
    int day = 0;
    if (!parse_part(0, 4, year) || !parse_part(5, 2, month) || !parse_part(8, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || day < 1) return std::nullopt;

    return make_date(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

std::string format_date(Date date) {
    std::chrono::year_month_day ymd{date};
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()));
    return buf;
}

std::string format_date(const std::optional<Date>& date) {
    return date ? format_date(*date) : std::string{"-"};
}

}  // namespace gantt_engine
