// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#include "fuzzy_match.h"
#include "utilities.h"

#include <algorithm>
#include <string>
#include <vector>

// ============================================================================
// Fuzzy Matcher
// ============================================================================

namespace {

[[nodiscard]] bool is_word_boundary(const std::string_view text, const size_t pos)
{
	if (pos == 0) {
		return true;
	}
	switch (text[pos - 1]) {
	case ' ':
	case '-':
	case '_':
	case '/':
	case '.': return true;
	default: return false;
	}
}

[[nodiscard]] int capped(const size_t value, const int cap)
{
	return static_cast<int>(std::min(value, static_cast<size_t>(cap)));
}

[[nodiscard]] int common_adjustments(const std::string_view label, const size_t start)
{
	int result = 0;
	if (is_word_boundary(label, start)) {
		result += Score::WordBoundary;
	}
	result -= Score::PositionPenalty * capped(start, Score::MaxPosition);
	result -= Score::LengthPenalty * capped(label.size(), Score::MaxLength);
	return result;
}

// Matched positions of the tightest window ending at the first complete
// forward match, or empty when the query is not a subsequence.
[[nodiscard]] std::vector<size_t> subsequence_positions(const std::string_view query,
                                                        const std::string_view label)
{
	size_t qi  = 0;
	size_t end = 0;
	for (size_t i = 0; i < label.size() && qi < query.size(); ++i) {
		if (label[i] == query[qi]) {
			++qi;
			end = i;
		}
	}
	if (qi != query.size()) {
		return {};
	}

	std::vector<size_t> positions(query.size());
	size_t remaining = query.size();
	for (size_t i = end + 1; i-- > 0 && remaining > 0;) {
		if (label[i] == query[remaining - 1]) {
			--remaining;
			positions[remaining] = i;
		}
	}
	return positions;
}

} // namespace

namespace Fuzzy {

[[nodiscard]] std::optional<int> match(const std::string_view query,
                                       const std::string_view label)
{
	if (query.empty()) {
		return Score::Neutral;
	}
	if (query.size() > label.size()) {
		return std::nullopt;
	}

	const auto lower_query = Util::to_lower(query);
	const auto lower_label = Util::to_lower(label);

	if (const size_t pos = lower_label.find(lower_query); pos != std::string::npos) {
		return Score::Substring + common_adjustments(lower_label, pos);
	}

	const auto positions = subsequence_positions(lower_query, lower_label);
	if (positions.empty()) {
		return std::nullopt;
	}

	size_t consecutive = 0;
	for (size_t i = 1; i < positions.size(); ++i) {
		if (positions[i] == positions[i - 1] + 1) {
			++consecutive;
		}
	}
	const size_t span = positions.back() - positions.front() + 1;
	const size_t gaps = span - positions.size();

	return Score::Subsequence + common_adjustments(lower_label, positions.front()) +
	       Score::ConsecutiveBonus * capped(consecutive, Score::MaxConsecutive) -
	       Score::GapPenalty * capped(gaps, Score::MaxGap);
}

} // namespace Fuzzy
