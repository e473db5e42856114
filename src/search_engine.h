// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#ifndef SEARCH_ENGINE_H
#define SEARCH_ENGINE_H

#include "entry_t.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Search Engine
// ============================================================================

struct SearchResult {
	size_t index = {};
	int score    = {};
};

// Owns the candidate list and keeps the filtered view in sync with the
// query. Results index into get_source(), which is the alternate list while
// it is being shown for an empty query and the main list otherwise.
class SearchEngine {
	std::vector<Entry> entries_                            = {};
	std::optional<std::vector<Entry>> empty_query_entries_ = {};
	std::string query_                                     = {};
	std::vector<SearchResult> results_                     = {};

	void refresh();

public:
	explicit SearchEngine(std::vector<Entry> entries,
	                      std::optional<std::vector<Entry>> empty_query_entries = std::nullopt);

	void update_query(const std::string_view q);

	void append(const char c);

	// Removes the last character, which may span several UTF-8 bytes.
	// Returns false when the query was already empty
	bool erase_last();

	[[nodiscard]] const std::string& get_query() const;

	[[nodiscard]] bool showing_empty_query_entries() const;

	[[nodiscard]] const std::vector<Entry>& get_source() const;

	[[nodiscard]] const std::vector<Entry>& get_entries() const;

	[[nodiscard]] const std::optional<std::vector<Entry>>& get_empty_query_entries() const;

	[[nodiscard]] const std::vector<SearchResult>& get_results() const;

	[[nodiscard]] const Entry& get_entry(const SearchResult& result) const;

	[[nodiscard]] size_t get_entry_count() const;
};

#endif
