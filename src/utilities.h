// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#ifndef UTILITIES_H
#define UTILITIES_H

#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Utilities
// ============================================================================

namespace Util {

[[nodiscard]] std::string to_lower(const std::string_view s);

[[nodiscard]] std::string trim(const std::string_view s);

[[nodiscard]] std::vector<std::string> split_lines(const std::string_view text);

// True for the 10xxxxxx bytes that follow a UTF-8 lead byte
[[nodiscard]] bool is_continuation_byte(const unsigned char c);

// Number of terminal columns, counting one per UTF-8 code point
[[nodiscard]] size_t display_width(const std::string_view s);

[[nodiscard]] std::string truncate(const std::string_view s, const size_t max_width);

// Keeps the last `max_width` code points
[[nodiscard]] std::string tail(const std::string_view s, const size_t max_width);

[[nodiscard]] std::string move_cursor_up(const size_t rows);

[[nodiscard]] std::string clear_line();

[[nodiscard]] std::string clear_to_end_of_screen();

[[nodiscard]] std::string hide_cursor();

[[nodiscard]] std::string show_cursor();

} // namespace Util

#endif
