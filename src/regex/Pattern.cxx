// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Pattern.hxx"

[[gnu::const]]
static uint32_t
ToPcreOptions(RegexOptions options) noexcept
{
	uint32_t result = PCRE2_UTF;

	if (options.Contains(RegexOptions::IgnoreCase()))
		result |= PCRE2_CASELESS;

	if (options.Contains(RegexOptions::IgnoreMetacharacters()))
		/* PCRE2 rejects most other options in combination
		   with PCRE2_LITERAL; a literal pattern has no
		   anchors, so PCRE2_MULTILINE is pointless anyway */
		return result | PCRE2_LITERAL;

	/* PCRE2_NEVER_BACKSLASH_C guarantees that all offsets are at
	   code point boundaries */
	result |= PCRE2_UCP | PCRE2_NEVER_BACKSLASH_C;

	if (options.Contains(RegexOptions::AnchorsMatchLines()))
		result |= PCRE2_MULTILINE;

	return result;
}

Pattern::Pattern(std::string_view _pattern, RegexOptions _options)
	:pattern(_pattern), options(_options),
	 regex(pattern, ToPcreOptions(options))
{
}

std::optional<Match>
Pattern::FirstMatch(std::string_view subject) const
{
	auto m = FindFirstMatch(regex, subject);
	if (!m)
		return std::nullopt;

	auto s = std::make_shared<const std::string>(subject);
	auto translated = CharacterCursor{*s, true}.Translate(*m);
	return Match{std::move(s), std::move(translated)};
}

MatchSequence
Pattern::AllMatches(std::string_view subject) const &
{
	return {regex, std::make_shared<const std::string>(subject)};
}

MatchSequence::Iterator::Iterator(const RegexPointer &regex,
				  std::shared_ptr<const std::string> _subject)
	:subject(std::move(_subject)),
	 scanner(regex, *subject),
	 cursor(*subject, true)
{
	Next();
}

/**
 * Does the character range #r collide with the one reported before
 * it?  Two byte ranges which do not overlap may still do so after
 * both have been widened to whole grapheme clusters.
 */
static constexpr bool
Overlaps(const CharacterRange &previous, const CharacterRange &r) noexcept
{
	if (r.start < previous.end)
		return true;

	/* a second empty match at the same character position */
	return r.empty() && previous.empty() && r.start == previous.start;
}

inline void
MatchSequence::Iterator::Next()
{
	while (auto m = scanner.Next()) {
		auto translated = cursor.Translate(*m);
		if (current && Overlaps(current->GetRange(), translated.range))
			continue;

		current.emplace(subject, std::move(translated));
		return;
	}

	current.reset();
}

MatchSequence::Iterator &
MatchSequence::Iterator::operator++()
{
	Next();
	return *this;
}
