// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Options.hxx"
#include "Match.hxx"
#include "Executor.hxx"
#include "RangeTranslator.hxx"
#include "lib/pcre/UniqueRegex.hxx"

#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

class MatchSequence;

/**
 * A compiled regular expression.  Subjects and patterns are UTF-8;
 * all positions reported by this class are counted in user-perceived
 * characters.
 *
 * Instances are immutable after construction and may be used by
 * several threads concurrently.
 */
class Pattern {
	std::string pattern;

	RegexOptions options;

	UniqueRegex regex;

public:
	/**
	 * Compile the given pattern.
	 *
	 * Throws Pcre::CompileError on error.
	 */
	explicit Pattern(std::string_view _pattern,
			 RegexOptions _options=RegexOptions{});

	/**
	 * Same as the constructor.
	 *
	 * Throws Pcre::CompileError on error.
	 */
	static Pattern Compile(std::string_view pattern,
			       RegexOptions options=RegexOptions{}) {
		return Pattern{pattern, options};
	}

	Pattern(Pattern &&) noexcept = default;
	Pattern &operator=(Pattern &&) noexcept = default;

	const std::string &GetPattern() const noexcept {
		return pattern;
	}

	RegexOptions GetOptions() const noexcept {
		return options;
	}

	/**
	 * The number of capture groups declared in the pattern.
	 */
	std::size_t GetCaptureCount() const noexcept {
		return regex.GetCaptureCount();
	}

	const RegexPointer &GetRegex() const noexcept {
		return regex;
	}

	/**
	 * Does the pattern match anywhere in the subject?
	 *
	 * Throws Pcre::MatchError on engine failure.
	 */
	bool Matches(std::string_view subject) const {
		return regex.Match(subject);
	}

	/**
	 * Find the leftmost match.
	 *
	 * Throws Pcre::MatchError on engine failure.
	 */
	std::optional<Match> FirstMatch(std::string_view subject) const;

	/**
	 * Obtain a lazy sequence of all non-overlapping matches, from
	 * left to right.  Matches which would overlap the previous one
	 * after being widened to whole characters are skipped.  The
	 * subject is copied, but this #Pattern must outlive the
	 * returned object (therefore this cannot be called on a
	 * temporary).
	 */
	MatchSequence AllMatches(std::string_view subject) const &;
	MatchSequence AllMatches(std::string_view subject) const && = delete;

	/**
	 * Like AllMatches(), but returns the raw byte ranges.  Both
	 * this #Pattern and the subject must outlive the returned
	 * object.
	 */
	RawMatchSequence AllRawMatches(std::string_view subject) const & noexcept {
		return {regex, subject};
	}

	RawMatchSequence AllRawMatches(std::string_view subject) const && = delete;
};

/**
 * The return value of Pattern::AllMatches().  Every begin() call
 * starts a new search.
 */
class MatchSequence {
	const RegexPointer &regex;

	std::shared_ptr<const std::string> subject;

public:
	class Iterator {
		std::shared_ptr<const std::string> subject;
		RawMatchScanner scanner;
		CharacterCursor cursor;
		std::optional<Match> current;

	public:
		using iterator_category = std::input_iterator_tag;
		using difference_type = std::ptrdiff_t;
		using value_type = Match;
		using pointer = const Match *;
		using reference = const Match &;

		Iterator(const RegexPointer &regex,
			 std::shared_ptr<const std::string> _subject);

		reference operator*() const noexcept {
			return *current;
		}

		pointer operator->() const noexcept {
			return &*current;
		}

		Iterator &operator++();

		bool operator==(std::default_sentinel_t) const noexcept {
			return !current;
		}

	private:
		void Next();
	};

	MatchSequence(const RegexPointer &_regex,
		      std::shared_ptr<const std::string> _subject) noexcept
		:regex(_regex), subject(std::move(_subject)) {}

	Iterator begin() const {
		return {regex, subject};
	}

	std::default_sentinel_t end() const noexcept {
		return {};
	}
};
