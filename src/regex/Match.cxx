// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Match.hxx"
#include "RangeTranslator.hxx"

Match::Match(std::shared_ptr<const std::string> _subject,
	     CharacterMatch &&m) noexcept
	:subject(std::move(_subject)),
	 range(m.range),
	 capture_ranges(std::move(m.captures)) {}

std::string_view
Match::GetMatchedString() const
{
	/* the subject has been matched by PCRE2, which means it has
	   already been checked for valid UTF-8 */
	return SliceCharacters(*subject, range, true);
}

std::optional<std::string_view>
Match::GetCapture(std::size_t i) const
{
	const auto &r = GetCaptureRange(i);
	if (!r)
		return std::nullopt;

	return SliceCharacters(*subject, *r, true);
}

std::vector<std::optional<std::string_view>>
Match::GetCaptures() const
{
	std::vector<std::optional<std::string_view>> result;
	result.reserve(capture_ranges.size());

	for (const auto &r : capture_ranges) {
		if (r)
			result.emplace_back(SliceCharacters(*subject, *r, true));
		else
			result.emplace_back(std::nullopt);
	}

	return result;
}
