#pragma once

/// @file include/finplan/similarity.hpp
/// @brief Approximate string similarity on a 0–100 integer scale.
///
/// # Module: String Similarity
///
/// ## Scores
/// All scorers normalise both inputs first (see `normalize`) and return 0
/// when either normalised input is empty.
///
///   ratio(a, b)            = round(100 · 2·LCS(a, b) / (|a| + |b|))
///
/// which equals the Levenshtein ratio with substitution cost 2.
///
///   partial_ratio          best ratio of the shorter string against every
///                          equal-length window of the longer one
///   token_sort_ratio       ratio of the sorted-token forms
///   token_set_ratio        best ratio among (common), (common + rest of a),
///                          (common + rest of b)
///   weighted_ratio         blend of the above, favouring partial matches
///                          only when the lengths differ by ≥ 1.5×
///
/// ## Guarantees
/// - Pure functions; safe to call concurrently
/// - Symmetric: score(a, b) == score(b, a) for every scorer
/// - score(x, x) == 100 for any x with a non-empty normalised form

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace finplan::similarity {

/// Lower-case, replace every non-alphanumeric ASCII byte with a space,
/// drop non-ASCII bytes, collapse whitespace and trim.
[[nodiscard]] std::string normalize(std::string_view s);

[[nodiscard]] int ratio(std::string_view a, std::string_view b);
[[nodiscard]] int partial_ratio(std::string_view a, std::string_view b);
[[nodiscard]] int token_sort_ratio(std::string_view a, std::string_view b);
[[nodiscard]] int token_set_ratio(std::string_view a, std::string_view b);
[[nodiscard]] int partial_token_sort_ratio(std::string_view a, std::string_view b);
[[nodiscard]] int partial_token_set_ratio(std::string_view a, std::string_view b);
[[nodiscard]] int weighted_ratio(std::string_view a, std::string_view b);

/// Best candidate for `query` under `weighted_ratio`.
struct Match {
    std::size_t index;  ///< Position in the candidate list
    int         score;  ///< 0–100
};

/// Highest-scoring candidate; the earliest one wins ties.
/// `nullopt` only when `candidates` is empty.
[[nodiscard]] std::optional<Match>
best_match(std::string_view query, const std::vector<std::string>& candidates);

}  // namespace finplan::similarity
