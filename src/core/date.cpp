/// @file src/core/date.cpp
/// @brief Calendar-date helpers.

#include "finplan/date.hpp"

#include <fmt/format.h>

#include <charconv>
#include <ctime>

namespace finplan {

Date today() noexcept {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    return Date{std::chrono::year{local.tm_year + 1900},
                std::chrono::month{static_cast<unsigned>(local.tm_mon + 1)},
                std::chrono::day{static_cast<unsigned>(local.tm_mday)}};
}

std::optional<Date> make_date(int year, unsigned month, unsigned day) noexcept {
    const Date d{std::chrono::year{year}, std::chrono::month{month},
                 std::chrono::day{day}};
    if (!d.ok()) return std::nullopt;
    return d;
}

Date add_days(Date date, int days) noexcept {
    return Date{std::chrono::sys_days{date} + std::chrono::days{days}};
}

int days_between(Date from, Date to) noexcept {
    return static_cast<int>(
        (std::chrono::sys_days{to} - std::chrono::sys_days{from}).count());
}

std::string to_iso(Date date) {
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(date.year()),
                       static_cast<unsigned>(date.month()),
                       static_cast<unsigned>(date.day()));
}

std::optional<Date> parse_iso(std::string_view text) noexcept {
    // Exactly YYYY-MM-DD.
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    auto field = [&](std::size_t pos, std::size_t len, int& out) {
        const char* first = text.data() + pos;
        const char* last  = first + len;
        auto [ptr, ec] = std::from_chars(first, last, out);
        return ec == std::errc{} && ptr == last;
    };

    int y = 0, m = 0, d = 0;
    if (!field(0, 4, y) || !field(5, 2, m) || !field(8, 2, d)) {
        return std::nullopt;
    }
    if (m <= 0 || d <= 0) return std::nullopt;
    return make_date(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
}

}  // namespace finplan
