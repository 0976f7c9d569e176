// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <pcre2.h>

#include <cassert>
#include <cstddef>
#include <string_view>
#include <utility>

/**
 * The result of RegexPointer::Match().  Owns the PCRE2 match data;
 * all offsets are in bytes, relative to the beginning of the
 * subject.  Index 0 is the whole match, index 1 the first capture
 * group.
 */
class MatchData {
	friend class RegexPointer;

	pcre2_match_data_8 *match_data = nullptr;
	const char *s = nullptr;
	PCRE2_SIZE *ovector = nullptr;
	std::size_t n = 0;

	explicit MatchData(pcre2_match_data_8 *_md, const char *_s) noexcept
		:match_data(_md), s(_s),
		 ovector(pcre2_get_ovector_pointer_8(match_data))
	{
	}

public:
	MatchData() = default;

	MatchData(MatchData &&src) noexcept
		:match_data(std::exchange(src.match_data, nullptr)),
		 s(src.s), ovector(src.ovector), n(src.n) {}

	~MatchData() noexcept {
		if (match_data != nullptr)
			pcre2_match_data_free_8(match_data);
	}

	MatchData &operator=(MatchData &&src) noexcept {
		using std::swap;
		swap(match_data, src.match_data);
		swap(s, src.s);
		swap(ovector, src.ovector);
		swap(n, src.n);
		return *this;
	}

	/**
	 * Was there a match?
	 */
	constexpr operator bool() const noexcept {
		return n > 0;
	}

	/**
	 * The number of ovector pairs, i.e. the number of capture
	 * groups plus one.
	 */
	constexpr std::size_t size() const noexcept {
		assert(*this);

		return n;
	}

	[[gnu::pure]]
	std::string_view operator[](std::size_t i) const noexcept {
		assert(*this);
		assert(i < size());

		const auto start = ovector[2 * i];
		if (start == PCRE2_UNSET)
			return {};

		const auto end = ovector[2 * i + 1];
		assert(end >= start);

		return { s + start, std::size_t(end - start) };
	}

	static constexpr std::size_t npos = ~std::size_t{};

	[[gnu::pure]]
	std::size_t GetCaptureStart(std::size_t i) const noexcept {
		assert(*this);
		assert(i < size());

		const auto start = ovector[2 * i];
		if (start == PCRE2_UNSET)
			return npos;

		return std::size_t(start);
	}

	[[gnu::pure]]
	std::size_t GetCaptureEnd(std::size_t i) const noexcept {
		assert(*this);
		assert(i < size());

		const auto end = ovector[2 * i + 1];
		if (end == PCRE2_UNSET)
			return npos;

		return std::size_t(end);
	}
};
