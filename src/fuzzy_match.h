// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#ifndef FUZZY_MATCH_H
#define FUZZY_MATCH_H

#include <optional>
#include <string_view>

// ============================================================================
// Fuzzy Matcher
// ============================================================================

namespace Score {
constexpr int Neutral          = 0;
constexpr int Substring        = 1000000;
constexpr int Subsequence      = 500000;
constexpr int WordBoundary     = 5000;
constexpr int ConsecutiveBonus = 50;
constexpr int GapPenalty       = 20;
constexpr int PositionPenalty  = 100;
constexpr int LengthPenalty    = 1;

// Caps keep every subsequence score below every substring score
constexpr int MaxPosition    = 1000;
constexpr int MaxLength      = 10000;
constexpr int MaxGap         = 10000;
constexpr int MaxConsecutive = 1000;
} // namespace Score

namespace Fuzzy {

// Case-insensitive subsequence match of `query` against `label`.
// Returns std::nullopt when some query character cannot be found in order.
// An empty query matches everything with Score::Neutral.
[[nodiscard]] std::optional<int> match(const std::string_view query,
                                       const std::string_view label);

} // namespace Fuzzy

#endif
