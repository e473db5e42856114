// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#ifndef KEYMAP_H
#define KEYMAP_H

#include "command_t.h"
#include "key_t.h"

#include <optional>

// ============================================================================
// Keymap
// ============================================================================

namespace Keymap {

// Resize carries no window size and is left to the caller
[[nodiscard]] std::optional<Command> translate(const Key& key, const bool multi_select);

} // namespace Keymap

#endif
