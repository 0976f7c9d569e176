// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Grapheme.hxx"
#include "UniqueRegex.hxx"

#include <cassert>

static const UniqueRegex &
GetGraphemeRegex()
{
	/* PCRE2 compiled code is read-only, therefore this instance
	   is shared by all threads */
	static const UniqueRegex re{"\\X", PCRE2_UTF|PCRE2_UCP|PCRE2_ANCHORED};
	return re;
}

std::size_t
NextGraphemeCluster(std::string_view s, std::size_t offset, bool validated)
{
	assert(offset < s.size());

	const auto m = GetGraphemeRegex().Match(s, offset,
						validated ? PCRE2_NO_UTF_CHECK : 0);
	if (!m || m.GetCaptureEnd(0) <= offset)
		/* "\X" matches at least one code point everywhere
		   except at the end, but don't loop forever if
		   PCRE2 says otherwise */
		return NextCodePoint(s, offset);

	return m.GetCaptureEnd(0);
}
