// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#ifndef EXIT_CODES_T
#define EXIT_CODES_T

constexpr int ExitSuccess   = 0;
constexpr int ExitCancelled = 1;
constexpr int ExitError     = 2;

#endif
