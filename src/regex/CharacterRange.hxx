// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>

/**
 * A half-open range of byte offsets within an UTF-8 string, as
 * reported by PCRE2.
 */
struct ByteRange {
	std::size_t start, end;

	constexpr std::size_t size() const noexcept {
		return end - start;
	}

	constexpr bool empty() const noexcept {
		return start == end;
	}

	constexpr bool operator==(const ByteRange &) const noexcept = default;
};

/**
 * A half-open range of user-perceived characters (extended grapheme
 * clusters) within one specific string.  A #CharacterRange is only
 * meaningful together with the string it was obtained from.
 */
struct CharacterRange {
	std::size_t start, end;

	constexpr std::size_t size() const noexcept {
		return end - start;
	}

	constexpr bool empty() const noexcept {
		return start == end;
	}

	constexpr bool operator==(const CharacterRange &) const noexcept = default;
};
