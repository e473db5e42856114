// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#include "utilities.h"

#include <algorithm>
#include <cctype>
#include <iterator>

// ============================================================================
// Utilities
// ============================================================================

namespace Util {

[[nodiscard]] bool is_continuation_byte(const unsigned char c)
{
	return (c & 0xC0) == 0x80;
}

namespace {

// Byte offset just past the first `count` code points of `s`
[[nodiscard]] size_t byte_offset(const std::string_view s, const size_t count)
{
	size_t seen = 0;
	for (size_t i = 0; i < s.size(); ++i) {
		if (is_continuation_byte(static_cast<unsigned char>(s[i]))) {
			continue;
		}
		if (seen == count) {
			return i;
		}
		++seen;
	}
	return s.size();
}

} // namespace

[[nodiscard]] std::string to_lower(const std::string_view s)
{
	std::string result = {};
	result.reserve(s.size());
	std::ranges::transform(s, std::back_inserter(result), [](const unsigned char c) {
		return static_cast<char>(std::tolower(c));
	});
	return result;
}

[[nodiscard]] std::string trim(const std::string_view s)
{
	constexpr std::string_view whitespace = " \t\r\n\f\v";

	const size_t first = s.find_first_not_of(whitespace);
	if (first == std::string_view::npos) {
		return {};
	}
	const size_t last = s.find_last_not_of(whitespace);
	return std::string(s.substr(first, last - first + 1));
}

[[nodiscard]] std::vector<std::string> split_lines(const std::string_view text)
{
	std::vector<std::string> lines = {};
	size_t start                   = 0;

	while (start <= text.size()) {
		const size_t end = text.find('\n', start);
		if (end == std::string_view::npos) {
			lines.emplace_back(text.substr(start));
			break;
		}
		lines.emplace_back(text.substr(start, end - start));
		start = end + 1;
	}
	return lines;
}

[[nodiscard]] size_t display_width(const std::string_view s)
{
	return static_cast<size_t>(std::ranges::count_if(s, [](const unsigned char c) {
		return !is_continuation_byte(c);
	}));
}

[[nodiscard]] std::string truncate(const std::string_view s, const size_t max_width)
{
	if (display_width(s) <= max_width) {
		return std::string(s);
	}

	constexpr std::string_view ellipsis = "...";
	if (max_width <= ellipsis.size()) {
		return std::string(s.substr(0, byte_offset(s, max_width)));
	}

	const size_t keep = byte_offset(s, max_width - ellipsis.size());
	return std::string(s.substr(0, keep)) + std::string(ellipsis);
}

[[nodiscard]] std::string tail(const std::string_view s, const size_t max_width)
{
	const size_t width = display_width(s);
	if (width <= max_width) {
		return std::string(s);
	}
	return std::string(s.substr(byte_offset(s, width - max_width)));
}

[[nodiscard]] std::string move_cursor_up(const size_t rows)
{
	if (rows == 0) {
		return "\r";
	}
	return "\033[" + std::to_string(rows) + "A\r";
}

[[nodiscard]] std::string clear_line()
{
	return "\033[2K";
}

[[nodiscard]] std::string clear_to_end_of_screen()
{
	return "\033[J";
}

[[nodiscard]] std::string hide_cursor()
{
	return "\033[?25l";
}

[[nodiscard]] std::string show_cursor()
{
	return "\033[?25h";
}

} // namespace Util
