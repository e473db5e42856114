// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#ifndef DISPLAY_MANAGER_H
#define DISPLAY_MANAGER_H

#include "picker_state.h"
#include "terminal_io.h"

#include <string>
#include <vector>

// ============================================================================
// Display Manager
// ============================================================================

// Draws the picker inline below the cursor and redraws it in place.
// compose() is a pure function of the state; render() and clear() track how
// many lines are on screen so the next frame starts at the same origin.
class DisplayManager {
	size_t last_frame_height_ = 0;

	void render_header(std::vector<std::string>& lines, const PickerState& state,
	                   const size_t width) const;

	void render_result(std::vector<std::string>& lines, const PickerState& state,
	                   const size_t view_index, const size_t width) const;

	void render_footer(std::vector<std::string>& lines, const PickerState& state,
	                   const size_t width) const;

public:
	// Lines of the frame that are not list rows
	[[nodiscard]] static size_t chrome_lines(const PickerConfig& config);

	[[nodiscard]] static size_t effective_window(const PickerConfig& config,
	                                             const size_t terminal_rows);

	[[nodiscard]] std::vector<std::string> compose(const PickerState& state,
	                                               const size_t width) const;

	void render(const PickerState& state, TerminalIO& term);

	// Erases the frame and leaves the cursor at its origin
	void clear(TerminalIO& term);
};

#endif
