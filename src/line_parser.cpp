// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#include "line_parser.h"
#include "utilities.h"

#include <iostream>
#include <string>
#include <utility>

// ============================================================================
// Line Parser
// ============================================================================

[[nodiscard]] std::optional<Entry> LineParser::parse_line(std::string_view line)
{
	if (line.ends_with('\r')) {
		line.remove_suffix(1);
	}

	if (const size_t sep = line.find(Separator); sep != std::string_view::npos) {
		return Entry{.id   = Util::trim(line.substr(0, sep)),
		             .name = std::string(line.substr(sep + Separator.size()))};
	}

	auto id = Util::trim(line);
	if (id.empty()) {
		return std::nullopt;
	}
	auto name = id;
	return Entry{.id = std::move(id), .name = std::move(name)};
}

[[nodiscard]] std::optional<std::vector<Entry>> LineParser::parse(std::istream& in)
{
	std::vector<Entry> entries = {};

	for (std::string line = {}; std::getline(in, line);) {
		if (auto entry = parse_line(line)) {
			entries.emplace_back(std::move(*entry));
		}
	}

	if (in.bad()) {
		std::cerr << "Error: cannot read entries from standard input\n";
		return std::nullopt;
	}
	return entries;
}
