// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#ifndef LINE_PARSER_H
#define LINE_PARSER_H

#include "entry_t.h"

#include <istream>
#include <optional>
#include <string_view>
#include <vector>

// ============================================================================
// Line Parser
// ============================================================================

// Reads candidates in the `ID @ NAME` line format. A line without the
// separator is used as both id and name.
class LineParser {
public:
	static constexpr std::string_view Separator = " @ ";

	// std::nullopt for blank lines
	[[nodiscard]] static std::optional<Entry> parse_line(std::string_view line);

	// std::nullopt when the stream fails before end of input
	[[nodiscard]] static std::optional<std::vector<Entry>> parse(std::istream& in);
};

#endif
