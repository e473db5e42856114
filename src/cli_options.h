// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#ifndef CLI_OPTIONS_H
#define CLI_OPTIONS_H

#include "config_t.h"

#include <optional>
#include <ostream>
#include <string_view>

// ============================================================================
// Command Line Options
// ============================================================================

struct CliOptions {
	static constexpr std::string_view DefaultTitle = "fzpick";
	static constexpr std::string_view Version      = "1.0.0";

	PickerConfig config = {};
	bool verbose        = false;
	bool show_help      = false;
	bool show_version   = false;

	// Usage errors are reported on `err`
	[[nodiscard]] static std::optional<CliOptions> parse(const int argc,
	                                                     const char* const argv[],
	                                                     std::ostream& err);

	static void print_help(std::ostream& out, const std::string_view program);

	static void print_version(std::ostream& out);
};

#endif
