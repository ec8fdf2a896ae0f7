#pragma once

/// @file src/core/text.hpp
/// @brief ASCII text helpers shared by the taxonomy, classifier, parser and
///        CSV loader (internal; not installed).
///
/// Bytes outside the ASCII range pass through untouched, so UTF-8 input
/// (e.g. the rupee sign) survives lower-casing and trimming.

#include <string>
#include <string_view>
#include <vector>

namespace finplan::text {

[[nodiscard]] std::string to_lower(std::string_view s);

/// Strip leading/trailing ASCII whitespace.
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

/// Trim and replace every run of ASCII whitespace with one space.
[[nodiscard]] std::string collapse_whitespace(std::string_view s);

/// Whitespace-delimited tokens; empty input gives no tokens.
[[nodiscard]] std::vector<std::string> split_whitespace(std::string_view s);

/// Split on every occurrence of `delimiter` (which must be non-empty).
[[nodiscard]] std::vector<std::string> split(std::string_view s,
                                             std::string_view delimiter);

[[nodiscard]] std::string join(const std::vector<std::string>& parts,
                               std::string_view separator,
                               std::size_t first = 0,
                               std::size_t last  = std::string::npos);

/// True for a non-empty string of ASCII letters only.
[[nodiscard]] bool is_alpha(std::string_view s) noexcept;

/// First letter upper-case, the rest lower-case ("deepak" → "Deepak").
[[nodiscard]] std::string capitalize(std::string_view s);

[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

}  // namespace finplan::text
