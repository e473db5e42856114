// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#ifndef TERMINAL_IO_H
#define TERMINAL_IO_H

#include "key_t.h"

#include <cstddef>
#include <string_view>

// ============================================================================
// Terminal I/O
// ============================================================================

class TerminalIO {
public:
	virtual ~TerminalIO() = default;

	// Blocks until the next key or resize event
	[[nodiscard]] virtual Key read_key() = 0;

	virtual void write(const std::string_view text) = 0;

	[[nodiscard]] virtual size_t rows() const = 0;

	[[nodiscard]] virtual size_t cols() const = 0;
};

#endif
