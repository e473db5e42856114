// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#ifndef ENTRY_T
#define ENTRY_T

#include <string>

struct Entry {
	std::string id   = {};
	std::string name = {};
};

#endif
