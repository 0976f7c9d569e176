// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "lib/pcre/Grapheme.hxx"
#include "lib/pcre/Error.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

/* a, e + COMBINING ACUTE ACCENT, INFINITY, MUSICAL SYMBOL G CLEF */
static constexpr std::string_view mixed = "ae\u0301\u221E\U0001D11E"sv;

TEST(Grapheme, Ascii)
{
	EXPECT_EQ(NextGraphemeCluster("abc"sv, 0), 1U);
	EXPECT_EQ(NextGraphemeCluster("abc"sv, 1), 2U);
	EXPECT_EQ(NextGraphemeCluster("abc"sv, 2), 3U);
}

TEST(Grapheme, Mixed)
{
	ASSERT_EQ(mixed.size(), 11U);

	EXPECT_EQ(NextGraphemeCluster(mixed, 0), 1U);

	/* the combining accent belongs to the preceding letter */
	EXPECT_EQ(NextGraphemeCluster(mixed, 1), 4U);
	EXPECT_EQ(NextGraphemeCluster(mixed, 4, true), 7U);

	/* outside the basic multilingual plane */
	EXPECT_EQ(NextGraphemeCluster(mixed, 7, true), 11U);
}

TEST(Grapheme, CRLF)
{
	EXPECT_EQ(NextGraphemeCluster("\r\nx"sv, 0), 2U);
	EXPECT_EQ(NextGraphemeCluster("\n\rx"sv, 0), 1U);
}

TEST(Grapheme, Malformed)
{
	EXPECT_THROW(NextGraphemeCluster("a\xff"sv, 0), Pcre::MatchError);
}

TEST(Grapheme, NextCodePoint)
{
	EXPECT_EQ(NextCodePoint(mixed, 0), 1U);
	EXPECT_EQ(NextCodePoint(mixed, 1), 2U);
	EXPECT_EQ(NextCodePoint(mixed, 2), 4U);
	EXPECT_EQ(NextCodePoint(mixed, 4), 7U);
	EXPECT_EQ(NextCodePoint(mixed, 7), 11U);
}
