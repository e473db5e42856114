// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#include "display_manager.h"
#include "utilities.h"

#include <algorithm>
#include <sstream>
#include <string_view>

// ============================================================================
// ANSI Color Codes
// ============================================================================

namespace Color {

using namespace std::string_view_literals;

constexpr auto Reset      = "\033[0m"sv;
constexpr auto Bold       = "\033[1m"sv;
constexpr auto Dim        = "\033[2m"sv;
constexpr auto Italic     = "\033[3m"sv;
constexpr auto Cyan       = "\033[96m"sv;
constexpr auto Green      = "\033[92m"sv;
constexpr auto Magenta    = "\033[95m"sv;
constexpr auto Gray       = "\033[90m"sv;
constexpr auto SelectedBg = "\033[48;5;24m\033[97m"sv;
} // namespace Color

namespace {

using namespace std::string_view_literals;

constexpr auto SearchLabel    = "Search: "sv;
constexpr auto QueryCursor    = "_"sv;
constexpr auto NoMatches      = "No matches found."sv;
constexpr auto SingleHints    = "↑/↓: Select | PgUp/PgDn: Scroll | Enter: Confirm | Esc: Cancel"sv;
constexpr auto MultiHints     = "↑/↓: Select | Space/→: Mark | ←: Mark all | Enter: Confirm | Esc: Cancel"sv;
constexpr size_t CursorWidth  = 2; // "> "
constexpr size_t MarkerWidth  = 4; // "[x] "
constexpr size_t FixedChrome  = 4; // query, separator, status, hints

} // namespace

// ============================================================================
// Display Manager
// ============================================================================

void DisplayManager::render_header(std::vector<std::string>& lines, const PickerState& state,
                                   const size_t width) const
{
	if (const auto& title = state.config().title) {
		std::ostringstream buf;
		buf << Color::Bold << Color::Magenta << Util::truncate(*title, width) << Color::Reset;
		lines.push_back(buf.str());
	}

	const size_t query_width = width > SearchLabel.size() + QueryCursor.size()
	                                   ? width - SearchLabel.size() - QueryCursor.size()
	                                   : 0;

	std::ostringstream buf;
	buf << Color::Bold << Color::Cyan << SearchLabel << Color::Reset
	    << Util::tail(state.query(), query_width) << Color::Cyan << QueryCursor << Color::Reset;
	lines.push_back(buf.str());

	lines.push_back(std::string(Color::Gray) +
	                std::string(std::min(Display::SeparatorLength, width), '=') +
	                std::string(Color::Reset));
}

void DisplayManager::render_result(std::vector<std::string>& lines, const PickerState& state,
                                   const size_t view_index, const size_t width) const
{
	const auto& entry    = state.entry_at(view_index);
	const bool selected  = view_index == state.cursor();
	const bool multi     = state.config().multi_select;
	const size_t prefix  = CursorWidth + (multi ? MarkerWidth : 0);
	const size_t label_w = width > prefix ? width - prefix : 0;

	std::ostringstream buf;
	if (selected) {
		buf << Color::SelectedBg << Color::Bold;
	}

	buf << (selected ? "> "sv : "  "sv);

	if (multi) {
		if (state.is_marked(entry)) {
			buf << Color::Green << "[x] "sv;
		} else {
			buf << "[ ] "sv;
		}
		if (selected) {
			buf << Color::SelectedBg;
		} else {
			buf << Color::Reset;
		}
	}

	buf << Util::truncate(entry.name, label_w) << Color::Reset;
	lines.push_back(buf.str());
}

void DisplayManager::render_footer(std::vector<std::string>& lines, const PickerState& state,
                                   const size_t width) const
{
	const size_t total = state.results().size();
	const size_t shown = std::min(state.window(), total - std::min(state.scroll_offset(), total));

	std::ostringstream status;
	if (total == 0) {
		status << "No results";
	} else {
		status << "Showing " << (state.scroll_offset() + 1) << "-"
		       << (state.scroll_offset() + shown) << " of " << total << " results";
	}
	if (state.config().multi_select) {
		status << " | " << state.marked_count() << " selected";
	}
	lines.push_back(std::string(Color::Bold) + std::string(Color::Cyan) +
	                Util::truncate(status.str(), width) + std::string(Color::Reset));

	const auto hints = state.config().multi_select ? MultiHints : SingleHints;
	lines.push_back(std::string(Color::Dim) + Util::truncate(hints, width) +
	                std::string(Color::Reset));

	if (const auto& footer = state.config().footer_text) {
		for (const auto& line : Util::split_lines(*footer)) {
			lines.push_back(std::string(Color::Cyan) + std::string(Color::Italic) +
			                Util::truncate(line, width) + std::string(Color::Reset));
		}
	}
}

[[nodiscard]] size_t DisplayManager::chrome_lines(const PickerConfig& config)
{
	size_t count = FixedChrome;
	if (config.title) {
		++count;
	}
	if (config.footer_text) {
		count += Util::split_lines(*config.footer_text).size();
	}
	return count;
}

[[nodiscard]] size_t DisplayManager::effective_window(const PickerConfig& config,
                                                      const size_t terminal_rows)
{
	const size_t chrome    = chrome_lines(config);
	const size_t available = terminal_rows > chrome ? terminal_rows - chrome
	                                                : Display::MinVisibleRows;

	return std::clamp(config.visible_window_size,
	                  Display::MinVisibleRows,
	                  std::max(available, Display::MinVisibleRows));
}

[[nodiscard]] std::vector<std::string> DisplayManager::compose(const PickerState& state,
                                                               const size_t width) const
{
	std::vector<std::string> lines = {};

	render_header(lines, state, width);

	const size_t total = state.results().size();
	for (size_t row = 0; row < state.window(); ++row) {
		const size_t idx = state.scroll_offset() + row;
		if (idx < total) {
			render_result(lines, state, idx, width);
		} else if (row == 0 && !state.query().empty()) {
			lines.push_back(std::string(Color::Dim) +
			                Util::truncate(NoMatches, width) +
			                std::string(Color::Reset));
		} else {
			lines.emplace_back();
		}
	}

	render_footer(lines, state, width);
	return lines;
}

void DisplayManager::render(const PickerState& state, TerminalIO& term)
{
	const auto lines = compose(state, term.cols());

	std::string buf = {};
	if (last_frame_height_ > 0) {
		buf += Util::move_cursor_up(last_frame_height_ - 1);
	} else {
		buf += Util::hide_cursor();
		buf += '\r';
	}

	for (size_t i = 0; i < lines.size(); ++i) {
		buf += Util::clear_line();
		buf += lines[i];
		if (i + 1 < lines.size()) {
			buf += "\r\n";
		}
	}
	buf += Util::clear_to_end_of_screen();

	term.write(buf);
	last_frame_height_ = lines.size();
}

void DisplayManager::clear(TerminalIO& term)
{
	if (last_frame_height_ == 0) {
		return;
	}

	term.write(Util::move_cursor_up(last_frame_height_ - 1) +
	           Util::clear_to_end_of_screen() + Util::show_cursor());
	last_frame_height_ = 0;
}
