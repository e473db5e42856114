// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#ifndef COMMAND_T
#define COMMAND_T

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

struct AppendChar {
	char ch = {};
};
struct Backspace {};
struct MoveSelection {
	int delta = {};
};
struct PageScroll {
	bool up = {};
};
struct ToggleMark {};
struct ToggleAllMarks {};
struct Confirm {};
struct Cancel {};
struct Resize {
	size_t window = {};
};

using Command = std::variant<AppendChar, Backspace, MoveSelection, PageScroll,
                             ToggleMark, ToggleAllMarks, Confirm, Cancel,
                             Resize>;

enum class PickStatus { Browsing, Confirmed, Cancelled };

struct PickResult {
	PickStatus status            = PickStatus::Cancelled;
	std::vector<std::string> ids = {};

	[[nodiscard]] bool confirmed() const
	{
		return status == PickStatus::Confirmed;
	}
};

#endif
