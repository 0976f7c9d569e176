// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Running a compiled pattern against a subject string.  All ranges
 * produced here are byte ranges; see RangeTranslator.hxx for
 * converting them to character ranges.
 */

#pragma once

#include "RawMatch.hxx"

#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>

class RegexPointer;

/**
 * Find the first (leftmost) match.
 *
 * Throws Pcre::MatchError on engine failure.
 *
 * @return std::nullopt if there is no match
 */
std::optional<RawMatch>
FindFirstMatch(const RegexPointer &regex, std::string_view subject,
	       std::size_t start_offset=0);

/**
 * Finds successive non-overlapping matches from left to right.  The
 * next search resumes at the end of the previous match.  After an
 * empty match, a non-empty match at the same position is attempted
 * first; if there is none, the search advances by one grapheme
 * cluster, so this always terminates.
 *
 * The #RegexPointer and the subject must remain valid while this
 * object is in use.
 */
class RawMatchScanner {
	const RegexPointer &regex;
	const std::string_view subject;

	std::size_t offset = 0;

	/**
	 * Was the previous match empty (at #offset)?
	 */
	bool previous_empty = false;

	/**
	 * Has PCRE2 already checked the subject for valid UTF-8?
	 * If yes, subsequent calls skip this (expensive) check.
	 */
	bool validated = false;

	bool finished = false;

public:
	RawMatchScanner(const RegexPointer &_regex,
			std::string_view _subject) noexcept
		:regex(_regex), subject(_subject) {}

	std::string_view GetSubject() const noexcept {
		return subject;
	}

	/**
	 * Find the next match.
	 *
	 * Throws Pcre::MatchError on engine failure.
	 *
	 * @return std::nullopt if there are no more matches
	 */
	std::optional<RawMatch> Next();

private:
	RawMatch Accept(const MatchData &md);
};

/**
 * A lazy sequence of all matches, to be used in a range-based "for"
 * loop.  Each begin() call starts a new search from the beginning.
 */
class RawMatchSequence {
	const RegexPointer &regex;
	const std::string_view subject;

public:
	class Iterator {
		RawMatchScanner scanner;
		std::optional<RawMatch> current;

	public:
		using iterator_category = std::input_iterator_tag;
		using difference_type = std::ptrdiff_t;
		using value_type = RawMatch;
		using pointer = const RawMatch *;
		using reference = const RawMatch &;

		Iterator(const RegexPointer &regex, std::string_view subject)
			:scanner(regex, subject), current(scanner.Next()) {}

		reference operator*() const noexcept {
			return *current;
		}

		pointer operator->() const noexcept {
			return &*current;
		}

		Iterator &operator++() {
			current = scanner.Next();
			return *this;
		}

		bool operator==(std::default_sentinel_t) const noexcept {
			return !current;
		}
	};

	RawMatchSequence(const RegexPointer &_regex,
			 std::string_view _subject) noexcept
		:regex(_regex), subject(_subject) {}

	Iterator begin() const {
		return {regex, subject};
	}

	std::default_sentinel_t end() const noexcept {
		return {};
	}
};
