// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Executor.hxx"
#include "lib/pcre/RegexPointer.hxx"
#include "lib/pcre/Grapheme.hxx"

RawMatch::RawMatch(const MatchData &md)
	:range{md.GetCaptureStart(0), md.GetCaptureEnd(0)}
{
	captures.reserve(md.size() - 1);

	for (std::size_t i = 1; i < md.size(); ++i) {
		const std::size_t start = md.GetCaptureStart(i);
		if (start == MatchData::npos)
			captures.emplace_back(std::nullopt);
		else
			captures.emplace_back(ByteRange{start, md.GetCaptureEnd(i)});
	}
}

std::optional<RawMatch>
FindFirstMatch(const RegexPointer &regex, std::string_view subject,
	       std::size_t start_offset)
{
	const auto md = regex.Match(subject, start_offset);
	if (!md)
		return std::nullopt;

	return RawMatch{md};
}

inline RawMatch
RawMatchScanner::Accept(const MatchData &md)
{
	RawMatch m{md};
	offset = m.range.end;
	previous_empty = m.range.empty();
	return m;
}

std::optional<RawMatch>
RawMatchScanner::Next()
{
	if (finished)
		return std::nullopt;

	const uint32_t options = validated ? PCRE2_NO_UTF_CHECK : 0;

	if (previous_empty) {
		/* don't report the same empty match again: look for a
		   non-empty match at this position first, and if
		   there is none, skip to the end of the grapheme
		   cluster */

		auto md = regex.Match(subject, offset,
				      options|PCRE2_NOTEMPTY_ATSTART|PCRE2_ANCHORED);
		if (md)
			return Accept(md);

		if (offset >= subject.size()) {
			finished = true;
			return std::nullopt;
		}

		offset = NextGraphemeCluster(subject, offset, validated);
	}

	auto md = regex.Match(subject, offset, options);
	validated = true;

	if (!md) {
		finished = true;
		return std::nullopt;
	}

	return Accept(md);
}
