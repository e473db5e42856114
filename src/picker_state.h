// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#ifndef PICKER_STATE_H
#define PICKER_STATE_H

#include "command_t.h"
#include "config_t.h"
#include "search_engine.h"

#include <set>
#include <string>
#include <vector>

// ============================================================================
// Picker State
// ============================================================================

// Selection state machine. Browsing until a Confirm or Cancel command moves
// it to a terminal status, after which commands are ignored.
class PickerState {
	PickerConfig config_  = {};
	SearchEngine engine_;
	size_t cursor_        = 0;
	size_t scroll_offset_ = 0;
	size_t window_        = Display::DefaultVisibleRows;

	std::set<std::string> marked_       = {};
	PickStatus status_                  = PickStatus::Browsing;
	std::vector<std::string> confirmed_ = {};

	void reset_cursor();

	void follow_cursor();

	void move_cursor(const long delta);

	void toggle_mark();

	void toggle_all_marks();

	void confirm();

	[[nodiscard]] std::vector<std::string> marked_in_list_order() const;

public:
	PickerState(std::vector<Entry> entries, PickerConfig config);

	void apply(const Command& cmd);

	[[nodiscard]] const PickerConfig& config() const;

	[[nodiscard]] const std::string& query() const;

	[[nodiscard]] const std::vector<SearchResult>& results() const;

	[[nodiscard]] const Entry& entry_at(const size_t view_index) const;

	[[nodiscard]] size_t cursor() const;

	[[nodiscard]] size_t scroll_offset() const;

	[[nodiscard]] size_t window() const;

	[[nodiscard]] bool is_marked(const Entry& entry) const;

	[[nodiscard]] size_t marked_count() const;

	[[nodiscard]] PickStatus status() const;

	[[nodiscard]] bool finished() const;

	[[nodiscard]] PickResult result() const;
};

#endif
