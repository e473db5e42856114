// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#include <gtest/gtest.h>
#include "utilities.h"

#include <string>
#include <vector>

TEST(UtilitiesTest, ToLower) {
	EXPECT_EQ(Util::to_lower("MiXeD Case 42"), "mixed case 42");
	EXPECT_EQ(Util::to_lower(""), "");
}

TEST(UtilitiesTest, Trim) {
	EXPECT_EQ(Util::trim("  padded\t\r\n"), "padded");
	EXPECT_EQ(Util::trim("inner  space"), "inner  space");
	EXPECT_EQ(Util::trim(" \t "), "");
	EXPECT_EQ(Util::trim(""), "");
}

TEST(UtilitiesTest, SplitLines) {
	EXPECT_EQ(Util::split_lines("one"), (std::vector<std::string>{"one"}));
	EXPECT_EQ(Util::split_lines("one\ntwo"), (std::vector<std::string>{"one", "two"}));
	EXPECT_EQ(Util::split_lines("one\n\nthree"),
	          (std::vector<std::string>{"one", "", "three"}));
}

TEST(UtilitiesTest, DisplayWidthCountsCodePoints) {
	EXPECT_EQ(Util::display_width("abc"), 3u);
	EXPECT_EQ(Util::display_width("caf\xC3\xA9"), 4u);
	EXPECT_EQ(Util::display_width("\xE2\x86\x91/\xE2\x86\x93"), 3u);
}

TEST(UtilitiesTest, TruncateAddsEllipsis) {
	EXPECT_EQ(Util::truncate("short", 10), "short");
	EXPECT_EQ(Util::truncate("exactly", 7), "exactly");
	EXPECT_EQ(Util::truncate("much too long", 8), "much ...");
	EXPECT_EQ(Util::truncate("abcdef", 2), "ab");
	EXPECT_EQ(Util::truncate("abcdef", 0), "");
}

TEST(UtilitiesTest, TruncateKeepsCodePointsWhole) {
	const std::string text = "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9";
	EXPECT_EQ(Util::truncate(text, 4), "\xC3\xA9...");
	EXPECT_EQ(Util::display_width(Util::truncate(text, 4)), 4u);
}

TEST(UtilitiesTest, TailKeepsEnd) {
	EXPECT_EQ(Util::tail("query", 10), "query");
	EXPECT_EQ(Util::tail("long query", 5), "query");
	EXPECT_EQ(Util::tail("x\xC3\xA9y", 2), "\xC3\xA9y");
}

TEST(UtilitiesTest, CursorMovement) {
	EXPECT_EQ(Util::move_cursor_up(0), "\r");
	EXPECT_EQ(Util::move_cursor_up(13), "\033[13A\r");
}

TEST(UtilitiesTest, ContinuationBytes) {
	EXPECT_FALSE(Util::is_continuation_byte('a'));
	EXPECT_FALSE(Util::is_continuation_byte(0xC3));
	EXPECT_TRUE(Util::is_continuation_byte(0xA9));
	EXPECT_TRUE(Util::is_continuation_byte(0x80));
	EXPECT_FALSE(Util::is_continuation_byte(0xE2));
}
