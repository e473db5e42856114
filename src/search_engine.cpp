// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#include "search_engine.h"
#include "fuzzy_match.h"
#include "utilities.h"

#include <algorithm>
#include <utility>

// ============================================================================
// Search Engine
// ============================================================================

void SearchEngine::refresh()
{
	results_.clear();

	const auto& source = get_source();
	results_.reserve(source.size());

	for (size_t i = 0; i < source.size(); ++i) {
		if (const auto s = Fuzzy::match(query_, source[i].name)) {
			results_.push_back({i, *s});
		}
	}

	// Stable so equal scores keep source order
	std::ranges::stable_sort(results_, [](const auto& a, const auto& b) {
		return a.score > b.score;
	});
}

SearchEngine::SearchEngine(std::vector<Entry> entries,
                           std::optional<std::vector<Entry>> empty_query_entries)
        : entries_(std::move(entries)),
          empty_query_entries_(std::move(empty_query_entries))
{
	refresh();
}

void SearchEngine::update_query(const std::string_view q)
{
	query_ = q;
	refresh();
}

void SearchEngine::append(const char c)
{
	query_.push_back(c);
	refresh();
}

bool SearchEngine::erase_last()
{
	const bool erased = !query_.empty();

	// Drop a whole UTF-8 sequence: its continuation bytes, then the lead byte
	while (!query_.empty() && Util::is_continuation_byte(static_cast<unsigned char>(query_.back()))) {
		query_.pop_back();
	}
	if (!query_.empty()) {
		query_.pop_back();
	}
	refresh();
	return erased;
}

[[nodiscard]] const std::string& SearchEngine::get_query() const
{
	return query_;
}

[[nodiscard]] bool SearchEngine::showing_empty_query_entries() const
{
	return query_.empty() && empty_query_entries_.has_value();
}

[[nodiscard]] const std::vector<Entry>& SearchEngine::get_source() const
{
	return showing_empty_query_entries() ? *empty_query_entries_ : entries_;
}

[[nodiscard]] const std::vector<Entry>& SearchEngine::get_entries() const
{
	return entries_;
}

[[nodiscard]] const std::optional<std::vector<Entry>>& SearchEngine::get_empty_query_entries() const
{
	return empty_query_entries_;
}

[[nodiscard]] const std::vector<SearchResult>& SearchEngine::get_results() const
{
	return results_;
}

[[nodiscard]] const Entry& SearchEngine::get_entry(const SearchResult& result) const
{
	return get_source()[result.index];
}

[[nodiscard]] size_t SearchEngine::get_entry_count() const
{
	return get_source().size();
}
