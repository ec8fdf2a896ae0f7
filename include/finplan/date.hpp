#pragma once

/// @file include/finplan/date.hpp
/// @brief Calendar-date helpers built on `std::chrono::year_month_day`.

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace finplan {

/// A calendar date with no time component.
using Date = std::chrono::year_month_day;

/// Today's date in the local time zone.
[[nodiscard]] Date today() noexcept;

/// Validated construction; `nullopt` for impossible dates (e.g. 2023-02-30).
[[nodiscard]] std::optional<Date> make_date(int year, unsigned month, unsigned day) noexcept;

/// `date` shifted by `days` (negative moves backwards).
[[nodiscard]] Date add_days(Date date, int days) noexcept;

/// Signed number of days from `from` to `to`.
[[nodiscard]] int days_between(Date from, Date to) noexcept;

/// `YYYY-MM-DD`.
[[nodiscard]] std::string to_iso(Date date);

/// Parse strict `YYYY-MM-DD`; `nullopt` on any deviation.
[[nodiscard]] std::optional<Date> parse_iso(std::string_view text) noexcept;

}  // namespace finplan
