// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#include <gtest/gtest.h>
#include "line_parser.h"

#include <sstream>

TEST(LineParserTest, SplitsIdAndName) {
	const auto entry = LineParser::parse_line("1 @ Build");
	ASSERT_TRUE(entry.has_value());
	EXPECT_EQ(entry->id, "1");
	EXPECT_EQ(entry->name, "Build");
}

TEST(LineParserTest, SplitsAtFirstSeparator) {
	const auto entry = LineParser::parse_line("host @ ssh @ example.org");
	ASSERT_TRUE(entry.has_value());
	EXPECT_EQ(entry->id, "host");
	EXPECT_EQ(entry->name, "ssh @ example.org");
}

TEST(LineParserTest, TrimsIdButKeepsName) {
	const auto entry = LineParser::parse_line("  42\t @  spaced name ");
	ASSERT_TRUE(entry.has_value());
	EXPECT_EQ(entry->id, "42");
	EXPECT_EQ(entry->name, " spaced name ");
}

TEST(LineParserTest, LineWithoutSeparatorIsBothIdAndName) {
	const auto entry = LineParser::parse_line("  plain line  ");
	ASSERT_TRUE(entry.has_value());
	EXPECT_EQ(entry->id, "plain line");
	EXPECT_EQ(entry->name, "plain line");
}

TEST(LineParserTest, AtSignWithoutSpacesIsNotASeparator) {
	const auto entry = LineParser::parse_line("user@host");
	ASSERT_TRUE(entry.has_value());
	EXPECT_EQ(entry->id, "user@host");
	EXPECT_EQ(entry->name, "user@host");
}

TEST(LineParserTest, StripsCarriageReturn) {
	const auto entry = LineParser::parse_line("7 @ Seven\r");
	ASSERT_TRUE(entry.has_value());
	EXPECT_EQ(entry->name, "Seven");
}

TEST(LineParserTest, BlankLinesAreSkipped) {
	EXPECT_FALSE(LineParser::parse_line("").has_value());
	EXPECT_FALSE(LineParser::parse_line("   \t").has_value());
	EXPECT_FALSE(LineParser::parse_line("\r").has_value());
}

TEST(LineParserTest, ParsesStreamInOrder) {
	std::istringstream in("1 @ Build\n\n2 @ Test\r\nBake");
	const auto entries = LineParser::parse(in);

	ASSERT_TRUE(entries.has_value());
	ASSERT_EQ(entries->size(), 3u);
	EXPECT_EQ((*entries)[0].id, "1");
	EXPECT_EQ((*entries)[1].name, "Test");
	EXPECT_EQ((*entries)[2].id, "Bake");
	EXPECT_EQ((*entries)[2].name, "Bake");
}

TEST(LineParserTest, EmptyStreamYieldsNoEntries) {
	std::istringstream in("");
	const auto entries = LineParser::parse(in);
	ASSERT_TRUE(entries.has_value());
	EXPECT_TRUE(entries->empty());
}

TEST(LineParserTest, BrokenStreamIsAnError) {
	std::istringstream in("1 @ Build\n");
	in.setstate(std::ios::badbit);
	EXPECT_FALSE(LineParser::parse(in).has_value());
}

TEST(LineParserTest, ProtocolExamples) {
	const auto restart = LineParser::parse_line("7 @ Restart service");
	ASSERT_TRUE(restart.has_value());
	EXPECT_EQ(restart->id, "7");
	EXPECT_EQ(restart->name, "Restart service");

	const auto standalone = LineParser::parse_line("standalone-line");
	ASSERT_TRUE(standalone.has_value());
	EXPECT_EQ(standalone->id, "standalone-line");
	EXPECT_EQ(standalone->name, "standalone-line");
}
