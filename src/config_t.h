// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#ifndef CONFIG_T
#define CONFIG_T

#include "entry_t.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace Display {
constexpr size_t DefaultVisibleRows = 10;
constexpr size_t MinVisibleRows     = 1;
constexpr size_t SeparatorLength    = 60;
constexpr size_t DefaultWidth       = 80;
constexpr size_t DefaultHeight      = 24;
} // namespace Display

// Session configuration, fixed for the lifetime of a picker session.
struct PickerConfig {
	std::optional<std::string> title       = {};
	std::optional<std::string> footer_text = {};
	bool multi_select                      = false;
	size_t visible_window_size             = Display::DefaultVisibleRows;

	// Shown instead of the main list while the query is empty
	std::optional<std::vector<Entry>> empty_query_entries = {};

	// Multi-select only: Enter with nothing marked confirms the cursor row
	bool confirm_cursor_when_unmarked = true;
};

#endif
