// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#ifndef TIMING_T
#define TIMING_T

#include <chrono>

namespace Timing {

using namespace std::chrono_literals;

// How long to wait for the rest of an escape sequence before treating
// ESC as a standalone key
constexpr auto EscapeTimeout = 25ms;
} // namespace Timing

#endif
