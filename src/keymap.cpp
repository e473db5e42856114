// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#include "keymap.h"

// ============================================================================
// Keymap
// ============================================================================

namespace Keymap {

[[nodiscard]] std::optional<Command> translate(const Key& key, const bool multi_select)
{
	using Kind = Key::Kind;

	switch (key.kind) {
	case Kind::Char:
		if (multi_select && key.ch == ' ') {
			return ToggleMark{};
		}
		return AppendChar{key.ch};
	case Kind::Backspace: return Backspace{};
	case Kind::Up: return MoveSelection{-1};
	case Kind::Down: return MoveSelection{1};
	case Kind::PageUp: return PageScroll{true};
	case Kind::PageDown: return PageScroll{false};
	case Kind::Right:
		if (multi_select) {
			return ToggleMark{};
		}
		break;
	case Kind::Left:
		if (multi_select) {
			return ToggleAllMarks{};
		}
		break;
	case Kind::Enter: return Confirm{};
	case Kind::Escape:
	case Kind::CtrlC: return Cancel{};
	case Kind::None:
	case Kind::Resize: break;
	}
	return std::nullopt;
}

} // namespace Keymap
