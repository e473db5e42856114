// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#ifndef KEY_T
#define KEY_T

// ============================================================================
// Input Events
// ============================================================================

struct Key {
	enum class Kind {
		None,
		Char,
		Enter,
		Backspace,
		Escape,
		CtrlC,
		Up,
		Down,
		Left,
		Right,
		PageUp,
		PageDown,
		Resize,
	};

	Kind kind = Kind::None;
	char ch   = {};

	[[nodiscard]] bool operator==(const Key&) const = default;
};

#endif
