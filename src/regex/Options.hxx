// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * A set of flags which alter the behavior of a #Pattern.  The flags
 * are independent of each other; the default is the empty set.
 */
class RegexOptions {
	using value_type = uint_least8_t;

	static constexpr value_type IGNORE_CASE = 0x1;
	static constexpr value_type IGNORE_METACHARACTERS = 0x2;
	static constexpr value_type ANCHORS_MATCH_LINES = 0x4;

	static constexpr value_type ALL = IGNORE_CASE|IGNORE_METACHARACTERS|
		ANCHORS_MATCH_LINES;

	value_type value = 0;

	constexpr explicit RegexOptions(value_type _value) noexcept
		:value(_value) {}

public:
	constexpr RegexOptions() noexcept = default;

	static constexpr RegexOptions None() noexcept {
		return RegexOptions{};
	}

	/**
	 * Letters match regardless of their case.
	 */
	static constexpr RegexOptions IgnoreCase() noexcept {
		return RegexOptions{IGNORE_CASE};
	}

	/**
	 * Treat every character of the pattern as a literal.
	 */
	static constexpr RegexOptions IgnoreMetacharacters() noexcept {
		return RegexOptions{IGNORE_METACHARACTERS};
	}

	/**
	 * "^" and "$" match at the beginning and end of each line
	 * instead of only at the beginning and end of the subject.
	 */
	static constexpr RegexOptions AnchorsMatchLines() noexcept {
		return RegexOptions{ANCHORS_MATCH_LINES};
	}

	/**
	 * Construct from a raw bit mask; unknown bits are discarded.
	 */
	static constexpr RegexOptions FromRaw(unsigned raw) noexcept {
		return RegexOptions(value_type(raw & ALL));
	}

	constexpr unsigned GetRaw() const noexcept {
		return value;
	}

	constexpr bool empty() const noexcept {
		return value == 0;
	}

	/**
	 * Are all flags of the given set also in this one?
	 */
	constexpr bool Contains(RegexOptions other) const noexcept {
		return (value & other.value) == other.value;
	}

	constexpr RegexOptions operator|(RegexOptions other) const noexcept {
		return RegexOptions(value_type(value | other.value));
	}

	constexpr RegexOptions operator&(RegexOptions other) const noexcept {
		return RegexOptions(value_type(value & other.value));
	}

	constexpr RegexOptions &operator|=(RegexOptions other) noexcept {
		value |= other.value;
		return *this;
	}

	constexpr bool operator==(const RegexOptions &) const noexcept = default;
};

/**
 * Parse a comma-separated list of option names ("ignore_case",
 * "ignore_metacharacters", "anchors_match_lines" or the short forms
 * "i", "literal", "m").  Whitespace around names is ignored.
 *
 * Throws std::runtime_error on error.
 */
RegexOptions
ParseRegexOptions(std::string_view s);

/**
 * The inverse of ParseRegexOptions(), using the long names.
 */
std::string
FormatRegexOptions(RegexOptions options);
