// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "lib/pcre/UniqueRegex.hxx"

#include <gtest/gtest.h>

#include <string.h>

TEST(RegexTest, Match1)
{
	UniqueRegex r;
	ASSERT_FALSE(r.IsDefined());
	r.Compile(".", PCRE2_UTF);
	ASSERT_TRUE(r.IsDefined());
	ASSERT_TRUE(r.Match("a"));
	ASSERT_TRUE(r.Match("abc"));
}

TEST(RegexTest, Match2)
{
	UniqueRegex r = UniqueRegex();
	ASSERT_FALSE(r.IsDefined());
	r.Compile("..", PCRE2_UTF);
	ASSERT_TRUE(r.IsDefined());
	ASSERT_FALSE(r.Match("a"));
	ASSERT_TRUE(r.Match("abc"));

	/* one code point, two bytes */
	ASSERT_FALSE(r.Match("\u00e9"));
}

TEST(RegexTest, NotAnchored)
{
	const UniqueRegex r{"/foo/", 0};
	ASSERT_TRUE(r.IsDefined());
	ASSERT_TRUE(r.Match("/foo/"));
	ASSERT_TRUE(r.Match("/foo/bar"));
	ASSERT_TRUE(r.Match("foo/foo/"));
}

TEST(RegexTest, Anchored)
{
	const UniqueRegex r{"/foo/", PCRE2_ANCHORED};
	ASSERT_TRUE(r.IsDefined());
	ASSERT_TRUE(r.Match("/foo/"));
	ASSERT_TRUE(r.Match("/foo/bar"));
	ASSERT_FALSE(r.Match("foo/foo/"));
}

TEST(RegexTest, StartOffset)
{
	const UniqueRegex r{"foo", 0};

	const auto m = r.Match("foo foo", 1);
	ASSERT_TRUE(m);
	ASSERT_EQ(m.GetCaptureStart(0), 4U);
	ASSERT_EQ(m.GetCaptureEnd(0), 7U);

	ASSERT_FALSE(r.Match("foo foo", 5));
}

TEST(RegexTest, Capture)
{
	const UniqueRegex r{"/foo/(.*)", PCRE2_ANCHORED};
	ASSERT_TRUE(r.IsDefined());
	ASSERT_EQ(r.GetCaptureCount(), 1U);

	{
		static constexpr auto s = "/foo/";
		const auto m = r.Match(s);
		ASSERT_TRUE(m);
		ASSERT_EQ(m[0].data(), s);
		ASSERT_EQ(m[0].size(), strlen(s));
		ASSERT_EQ(m[1].data(), s + 5);
		ASSERT_EQ(m[1].size(), 0U);
	}

	{
		static constexpr auto s = "/foo/bar";
		const auto m = r.Match(s);
		ASSERT_TRUE(m);
		ASSERT_EQ(m[0].data(), s);
		ASSERT_EQ(m[0].size(), strlen(s));
		ASSERT_EQ(m[1].data(), s + 5);
		ASSERT_EQ(m[1].size(), strlen(s + 5));
	}
}

TEST(RegexTest, CaptureOptional2)
{
	const UniqueRegex r{"/fo(o)?/(.+)?", PCRE2_ANCHORED};
	ASSERT_TRUE(r.IsDefined());
	ASSERT_EQ(r.GetCaptureCount(), 2U);

	{
		static constexpr auto s = "/fo/bar";
		const auto m = r.Match(s);
		ASSERT_TRUE(m);
		ASSERT_EQ(m.size(), 3U);
		ASSERT_EQ(m[1].data(), nullptr);
		ASSERT_EQ(m.GetCaptureStart(1), MatchData::npos);
		ASSERT_EQ(m.GetCaptureEnd(1), MatchData::npos);
		ASSERT_EQ(m[2].data(), s + 4);
		ASSERT_EQ(m.GetCaptureStart(2), 4U);
		ASSERT_EQ(m.GetCaptureEnd(2), strlen(s));
	}

	{
		/* PCRE2 omits the trailing unset group from its
		   return value; MatchData must still report it */
		static constexpr auto s = "/foo/";
		const auto m = r.Match(s);
		ASSERT_TRUE(m);
		ASSERT_EQ(m.size(), 3U);
		ASSERT_EQ(m[1].data(), s + 3);
		ASSERT_EQ(m[1].size(), 1U);
		ASSERT_EQ(m[2].data(), nullptr);
		ASSERT_EQ(m.GetCaptureStart(2), MatchData::npos);
	}
}

TEST(RegexTest, MoveAssign)
{
	UniqueRegex a{"(a)(b)", 0};
	UniqueRegex b;

	b = std::move(a);
	ASSERT_TRUE(b.IsDefined());
	ASSERT_EQ(b.GetCaptureCount(), 2U);
	ASSERT_TRUE(b.Match("ab"));
}

TEST(RegexTest, CompileError)
{
	UniqueRegex r;

	try {
		r.Compile("(abc", PCRE2_UTF);
		FAIL();
	} catch (const Pcre::CompileError &e) {
		EXPECT_EQ(e.GetOffset(), 4U);
		EXPECT_EQ(e.code().category(), Pcre::error_category);
		EXPECT_STREQ(e.code().category().name(), "pcre2");
		EXPECT_FALSE(e.code().message().empty());
	}

	ASSERT_FALSE(r.IsDefined());

	ASSERT_THROW(r.Compile("*invalid*", PCRE2_UTF), Pcre::CompileError);
	ASSERT_FALSE(r.IsDefined());
}

TEST(RegexTest, MalformedSubject)
{
	const UniqueRegex r{"a", PCRE2_UTF};

	try {
		(void)r.Match("a\xff");
		FAIL();
	} catch (const Pcre::MatchError &e) {
		EXPECT_LT(e.code().value(), 0);
		EXPECT_EQ(e.code().category(), Pcre::error_category);
	}

	/* without PCRE2_UTF, any byte sequence is acceptable */
	const UniqueRegex raw{"\\xff", 0};
	ASSERT_TRUE(raw.Match("a\xff"));
}
