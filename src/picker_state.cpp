// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#include "picker_state.h"

#include <algorithm>
#include <type_traits>
#include <variant>

// ============================================================================
// Picker State
// ============================================================================

namespace {

[[nodiscard]] PickerConfig without_entries(PickerConfig config)
{
	config.empty_query_entries.reset();
	return config;
}

} // namespace

PickerState::PickerState(std::vector<Entry> entries, PickerConfig config)
        : config_(without_entries(config)),
          engine_(std::move(entries), std::move(config.empty_query_entries)),
          window_(std::max(config.visible_window_size, Display::MinVisibleRows))
{}

void PickerState::reset_cursor()
{
	cursor_        = 0;
	scroll_offset_ = 0;
}

void PickerState::follow_cursor()
{
	if (cursor_ < scroll_offset_) {
		scroll_offset_ = cursor_;
	} else if (cursor_ >= scroll_offset_ + window_) {
		scroll_offset_ = cursor_ - window_ + 1;
	}
}

void PickerState::move_cursor(const long delta)
{
	const auto count = static_cast<long>(engine_.get_results().size());
	if (count == 0) {
		return;
	}

	cursor_ = static_cast<size_t>(
	        std::clamp(static_cast<long>(cursor_) + delta, 0L, count - 1));
	follow_cursor();
}

void PickerState::toggle_mark()
{
	const auto& results = engine_.get_results();
	if (!config_.multi_select || results.empty()) {
		return;
	}

	const auto& id = engine_.get_entry(results[cursor_]).id;
	if (!marked_.erase(id)) {
		marked_.insert(id);
	}
}

void PickerState::toggle_all_marks()
{
	const auto& results = engine_.get_results();
	if (!config_.multi_select || results.empty()) {
		return;
	}

	const bool any_marked = std::ranges::any_of(results, [this](const auto& r) {
		return marked_.contains(engine_.get_entry(r).id);
	});

	for (const auto& r : results) {
		const auto& id = engine_.get_entry(r).id;
		if (any_marked) {
			marked_.erase(id);
		} else {
			marked_.insert(id);
		}
	}
}

void PickerState::confirm()
{
	const auto& results = engine_.get_results();
	if (results.empty()) {
		return;
	}

	if (config_.multi_select && !marked_.empty()) {
		confirmed_ = marked_in_list_order();
	} else if (!config_.multi_select || config_.confirm_cursor_when_unmarked) {
		confirmed_ = {engine_.get_entry(results[cursor_]).id};
	} else {
		return;
	}
	status_ = PickStatus::Confirmed;
}

[[nodiscard]] std::vector<std::string> PickerState::marked_in_list_order() const
{
	std::vector<std::string> ids = {};
	std::set<std::string> emitted = {};

	const auto collect = [&](const std::vector<Entry>& list) {
		for (const auto& entry : list) {
			if (marked_.contains(entry.id) && emitted.insert(entry.id).second) {
				ids.push_back(entry.id);
			}
		}
	};

	collect(engine_.get_entries());
	if (const auto& extra = engine_.get_empty_query_entries()) {
		collect(*extra);
	}
	return ids;
}

void PickerState::apply(const Command& cmd)
{
	if (finished()) {
		return;
	}

	std::visit(
	        [this](auto&& arg) {
		        using T = std::decay_t<decltype(arg)>;

		        if constexpr (std::is_same_v<T, AppendChar>) {
			        engine_.append(arg.ch);
			        reset_cursor();
		        } else if constexpr (std::is_same_v<T, Backspace>) {
			        engine_.erase_last();
			        reset_cursor();
		        } else if constexpr (std::is_same_v<T, MoveSelection>) {
			        move_cursor(arg.delta);
		        } else if constexpr (std::is_same_v<T, PageScroll>) {
			        const auto page = static_cast<long>(
			                std::max<size_t>(1, window_ - 1));
			        move_cursor(arg.up ? -page : page);
		        } else if constexpr (std::is_same_v<T, ToggleMark>) {
			        toggle_mark();
		        } else if constexpr (std::is_same_v<T, ToggleAllMarks>) {
			        toggle_all_marks();
		        } else if constexpr (std::is_same_v<T, Confirm>) {
			        confirm();
		        } else if constexpr (std::is_same_v<T, Cancel>) {
			        marked_.clear();
			        confirmed_.clear();
			        status_ = PickStatus::Cancelled;
		        } else if constexpr (std::is_same_v<T, Resize>) {
			        window_ = std::max(arg.window, Display::MinVisibleRows);
			        follow_cursor();
		        }
	        },
	        cmd);
}

[[nodiscard]] const PickerConfig& PickerState::config() const
{
	return config_;
}

[[nodiscard]] const std::string& PickerState::query() const
{
	return engine_.get_query();
}

[[nodiscard]] const std::vector<SearchResult>& PickerState::results() const
{
	return engine_.get_results();
}

[[nodiscard]] const Entry& PickerState::entry_at(const size_t view_index) const
{
	return engine_.get_entry(engine_.get_results().at(view_index));
}

[[nodiscard]] size_t PickerState::cursor() const
{
	return cursor_;
}

[[nodiscard]] size_t PickerState::scroll_offset() const
{
	return scroll_offset_;
}

[[nodiscard]] size_t PickerState::window() const
{
	return window_;
}

[[nodiscard]] bool PickerState::is_marked(const Entry& entry) const
{
	return marked_.contains(entry.id);
}

[[nodiscard]] size_t PickerState::marked_count() const
{
	return marked_.size();
}

[[nodiscard]] PickStatus PickerState::status() const
{
	return status_;
}

[[nodiscard]] bool PickerState::finished() const
{
	return status_ != PickStatus::Browsing;
}

[[nodiscard]] PickResult PickerState::result() const
{
	return {status_, status_ == PickStatus::Confirmed ? confirmed_ : std::vector<std::string>{}};
}
