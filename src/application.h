// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#ifndef APPLICATION_H
#define APPLICATION_H

#include "display_manager.h"
#include "picker_state.h"
#include "terminal_io.h"

#include <vector>

// ============================================================================
// Application
// ============================================================================

class Application {
	PickerState state_;
	DisplayManager display_ = {};

	void fit_window(const TerminalIO& term);

	// Returns true when the state may have changed
	bool handle_key(const Key& key, const TerminalIO& term);

public:
	Application(std::vector<Entry> entries, PickerConfig config);

	// Runs the session until the user confirms or cancels
	[[nodiscard]] PickResult run(TerminalIO& term);

	[[nodiscard]] const PickerState& state() const;
};

#endif
