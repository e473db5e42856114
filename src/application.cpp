// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#include "application.h"
#include "keymap.h"

#include <exception>
#include <utility>

// ============================================================================
// Application
// ============================================================================

void Application::fit_window(const TerminalIO& term)
{
	state_.apply(Resize{DisplayManager::effective_window(state_.config(), term.rows())});
}

bool Application::handle_key(const Key& key, const TerminalIO& term)
{
	if (key.kind == Key::Kind::Resize) {
		fit_window(term);
		return true;
	}

	const auto cmd = Keymap::translate(key, state_.config().multi_select);
	if (!cmd) {
		return false;
	}
	state_.apply(*cmd);
	return true;
}

Application::Application(std::vector<Entry> entries, PickerConfig config)
        : state_(std::move(entries), std::move(config))
{}

[[nodiscard]] PickResult Application::run(TerminalIO& term)
{
	fit_window(term);
	display_.render(state_, term);

	try {
		while (!state_.finished()) {
			if (handle_key(term.read_key(), term) && !state_.finished()) {
				display_.render(state_, term);
			}
		}
	} catch (const std::exception&) {
		// Leave the screen clean before the error reaches the caller
		display_.clear(term);
		throw;
	}

	display_.clear(term);
	return state_.result();
}

[[nodiscard]] const PickerState& Application::state() const
{
	return state_;
}
