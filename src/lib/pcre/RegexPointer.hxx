// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "MatchData.hxx"
#include "Error.hxx"

#include <pcre2.h>

#include <cstdint>
#include <string_view>

/**
 * A non-owning pointer to a compiled PCRE2 pattern.  PCRE2 does not
 * modify compiled code while matching, so one instance may be used
 * by several threads at the same time.
 */
class RegexPointer {
protected:
	pcre2_code_8 *re = nullptr;

	unsigned n_capture = 0;

public:
	constexpr bool IsDefined() const noexcept {
		return re != nullptr;
	}

	/**
	 * The number of capture groups declared in the pattern.
	 */
	constexpr unsigned GetCaptureCount() const noexcept {
		return n_capture;
	}

	/**
	 * Search the subject, beginning at the given byte offset.
	 *
	 * Throws Pcre::MatchError if PCRE2 fails for any reason
	 * other than "no match".
	 *
	 * @param options a combination of PCRE2 match options,
	 * e.g. PCRE2_NOTEMPTY_ATSTART
	 * @return an empty #MatchData if there was no match
	 */
	MatchData Match(std::string_view s, std::size_t start_offset=0,
			uint32_t options=0) const {
		MatchData match_data{
			pcre2_match_data_create_from_pattern_8(re, nullptr),
			s.data(),
		};

		if (match_data.match_data == nullptr)
			throw Pcre::MatchError(PCRE2_ERROR_NOMEMORY);

		int n = pcre2_match_8(re, (PCRE2_SPTR8)s.data(), s.size(),
				      start_offset, options,
				      match_data.match_data, nullptr);
		if (n == PCRE2_ERROR_NOMATCH)
			return {};

		if (n < 0)
			throw Pcre::MatchError(n);

		match_data.n = n;

		if (n_capture >= match_data.n)
			/* in its return value, PCRE omits mismatching
			   optional captures if (and only if) they are
			   the last capture; this kludge works around
			   this */
			match_data.n = n_capture + 1;

		return match_data;
	}
};
