// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "RangeTranslator.hxx"
#include "RawMatch.hxx"
#include "lib/pcre/Grapheme.hxx"
#include "lib/fmt/ToBuffer.hxx"

#include <algorithm>
#include <iterator>
#include <stdexcept>

inline std::size_t
CharacterCursor::NextCluster()
{
	const std::size_t end = NextGraphemeCluster(subject, offset, validated);

	/* the first call (at offset 0) has let PCRE2 check the whole
	   string */
	validated = true;

	return end;
}

CharacterCursor::Position
CharacterCursor::SeekByte(std::size_t byte_offset)
{
	if (byte_offset > subject.size())
		throw std::out_of_range(FmtBuffer<128>("Byte offset {} is beyond the end of the string ({})",
						      byte_offset, subject.size()).c_str());

	if (byte_offset < offset)
		Rewind();

	while (offset < byte_offset) {
		const std::size_t next = NextCluster();
		if (next > byte_offset)
			/* inside this cluster */
			return {index, index + 1};

		offset = next;
		++index;
	}

	return {index, index};
}

std::size_t
CharacterCursor::SeekCharacter(std::size_t character_index)
{
	if (character_index < index)
		Rewind();

	while (index < character_index) {
		if (offset >= subject.size())
			throw std::out_of_range(FmtBuffer<128>("Character position {} is beyond the end of the string ({})",
							      character_index, index).c_str());

		offset = NextCluster();
		++index;
	}

	return offset;
}

CharacterRange
CharacterCursor::Translate(ByteRange r)
{
	if (r.end < r.start)
		throw std::out_of_range("Malformed byte range");

	const std::size_t start = SeekByte(r.start).floor;
	if (r.empty())
		return {start, start};

	return {start, SeekByte(r.end).ceil};
}

CharacterMatch
CharacterCursor::Translate(const RawMatch &m)
{
	/* visit all boundaries in ascending order, so the cursor
	   never needs to rewind within one match */
	std::vector<std::size_t> offsets;
	offsets.reserve(2 + 2 * m.captures.size());

	const auto add = [&offsets](ByteRange r){
		if (r.end < r.start)
			throw std::out_of_range("Malformed byte range");

		offsets.push_back(r.start);
		offsets.push_back(r.end);
	};

	add(m.range);
	for (const auto &i : m.captures)
		if (i)
			add(*i);

	std::sort(offsets.begin(), offsets.end());
	offsets.erase(std::unique(offsets.begin(), offsets.end()),
		      offsets.end());

	std::vector<Position> positions;
	positions.reserve(offsets.size());
	for (const std::size_t i : offsets)
		positions.push_back(SeekByte(i));

	const auto lookup = [&offsets, &positions](std::size_t byte_offset){
		const auto i = std::lower_bound(offsets.begin(), offsets.end(),
						byte_offset);
		return positions[std::distance(offsets.begin(), i)];
	};

	const auto translate = [&lookup](ByteRange r){
		const std::size_t start = lookup(r.start).floor;
		if (r.empty())
			return CharacterRange{start, start};

		return CharacterRange{start, lookup(r.end).ceil};
	};

	CharacterMatch result{translate(m.range), {}};
	result.captures.reserve(m.captures.size());
	for (const auto &i : m.captures) {
		if (i)
			result.captures.emplace_back(translate(*i));
		else
			result.captures.emplace_back(std::nullopt);
	}

	return result;
}

ByteRange
CharacterCursor::ToByteRange(CharacterRange r)
{
	if (r.end < r.start)
		throw std::out_of_range("Malformed character range");

	const std::size_t start = SeekCharacter(r.start);
	return {start, SeekCharacter(r.end)};
}

std::string_view
SliceCharacters(std::string_view s, CharacterRange r, bool validated)
{
	CharacterCursor cursor{s, validated};
	const auto b = cursor.ToByteRange(r);
	return s.substr(b.start, b.size());
}

std::size_t
CountCharacters(std::string_view s, bool validated)
{
	std::size_t n = 0;
	for (std::size_t offset = 0; offset < s.size(); ++n) {
		offset = NextGraphemeCluster(s, offset, validated);
		validated = true;
	}

	return n;
}
