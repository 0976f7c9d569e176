// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "CharacterRange.hxx"

#include <cassert>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct CharacterMatch;

/**
 * One match of a #Pattern in a subject string.  All positions are
 * counted in user-perceived characters; substrings are sliced from
 * the subject on demand.
 *
 * The subject is shared by all #Match instances obtained from the
 * same search, therefore a #Match remains usable after the caller's
 * original string has been freed.
 */
class Match {
	std::shared_ptr<const std::string> subject;

	CharacterRange range;

	/**
	 * One item for each capture group, in the order of their
	 * opening parentheses; std::nullopt if the group did not
	 * participate in the match.
	 */
	std::vector<std::optional<CharacterRange>> capture_ranges;

public:
	Match(std::shared_ptr<const std::string> _subject,
	      CharacterMatch &&m) noexcept;

	const std::string &GetSubject() const noexcept {
		return *subject;
	}

	const CharacterRange &GetRange() const noexcept {
		return range;
	}

	const auto &GetCaptureRanges() const noexcept {
		return capture_ranges;
	}

	std::size_t GetCaptureCount() const noexcept {
		return capture_ranges.size();
	}

	const std::optional<CharacterRange> &GetCaptureRange(std::size_t i) const noexcept {
		assert(i < capture_ranges.size());

		return capture_ranges[i];
	}

	/**
	 * The substring matched by the whole pattern.
	 */
	std::string_view GetMatchedString() const;

	/**
	 * The substring matched by the given capture group (0 is the
	 * first group), or std::nullopt if the group did not
	 * participate in the match.
	 */
	std::optional<std::string_view> GetCapture(std::size_t i) const;

	/**
	 * All capture substrings, index-aligned with
	 * GetCaptureRanges().
	 */
	std::vector<std::optional<std::string_view>> GetCaptures() const;
};
