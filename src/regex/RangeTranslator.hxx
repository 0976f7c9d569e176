// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Conversion between the byte offsets reported by PCRE2 and
 * positions counted in user-perceived characters (extended grapheme
 * clusters).
 */

#pragma once

#include "CharacterRange.hxx"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

struct RawMatch;

/**
 * A #RawMatch with all locations converted to character ranges.
 */
struct CharacterMatch {
	CharacterRange range;

	std::vector<std::optional<CharacterRange>> captures;
};

/**
 * Walks the grapheme clusters of one string.  The current position
 * is remembered, so a series of lookups in ascending order costs
 * linear time in total; looking up an earlier position restarts from
 * the beginning of the string.
 *
 * The string must remain valid while this object is in use.
 */
class CharacterCursor {
	const std::string_view subject;

	/**
	 * The byte offset where character number #index begins.
	 */
	std::size_t offset = 0;

	std::size_t index = 0;

	bool validated;

public:
	/**
	 * @param _validated true if the string is known to be valid
	 * UTF-8 (e.g. because PCRE2 has already matched it)
	 */
	explicit CharacterCursor(std::string_view _subject,
				 bool _validated=false) noexcept
		:subject(_subject), validated(_validated) {}

	/**
	 * Convert a byte range to a character range.  If a boundary
	 * lies inside a grapheme cluster, the range is widened to
	 * include the whole cluster; an empty range stays empty.
	 *
	 * Throws std::out_of_range if the range exceeds the string.
	 */
	CharacterRange Translate(ByteRange r);

	/**
	 * Translate all locations of a match.  Captures which did not
	 * participate remain std::nullopt.
	 *
	 * Throws std::out_of_range if the match does not fit in the
	 * string, i.e. it was obtained from a different string.
	 */
	CharacterMatch Translate(const RawMatch &m);

	/**
	 * Convert a character range back to a byte range.
	 *
	 * Throws std::out_of_range if the range exceeds the string.
	 */
	ByteRange ToByteRange(CharacterRange r);

private:
	/**
	 * The character positions corresponding to a byte offset: if
	 * the offset lies inside a grapheme cluster, "ceil" is one
	 * more than "floor".
	 */
	struct Position {
		std::size_t floor, ceil;
	};

	void Rewind() noexcept {
		offset = index = 0;
	}

	/**
	 * Returns the end of the grapheme cluster starting at
	 * #offset.
	 */
	std::size_t NextCluster();

	Position SeekByte(std::size_t byte_offset);
	std::size_t SeekCharacter(std::size_t character_index);
};

/**
 * Extract the portion of the string described by a character range.
 *
 * Throws std::out_of_range if the range exceeds the string.
 */
std::string_view
SliceCharacters(std::string_view s, CharacterRange r,
		bool validated=false);

/**
 * Count the user-perceived characters in the string.
 *
 * Throws Pcre::MatchError if the string is not valid UTF-8.
 */
std::size_t
CountCharacters(std::string_view s, bool validated=false);
