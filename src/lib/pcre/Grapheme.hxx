// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <string_view>

/**
 * Find the end of the extended grapheme cluster (one user-perceived
 * character) which begins at the given byte offset of an UTF-8
 * string.
 *
 * Throws Pcre::MatchError if the string is not valid UTF-8 or if
 * the offset is not at a character boundary.
 *
 * @param offset the start of the cluster; must be less than the
 * string's size
 * @param validated true if the caller has already verified that the
 * string is valid UTF-8 (skips PCRE2's check, which is expensive)
 * @return the byte offset just after the cluster
 */
std::size_t
NextGraphemeCluster(std::string_view s, std::size_t offset,
		    bool validated=false);

/**
 * Find the end of the UTF-8 code point which begins at the given
 * byte offset.  The string is assumed to be valid UTF-8.
 */
constexpr std::size_t
NextCodePoint(std::string_view s, std::size_t offset) noexcept
{
	++offset;
	while (offset < s.size() && (s[offset] & 0xc0) == 0x80)
		++offset;
	return offset;
}
