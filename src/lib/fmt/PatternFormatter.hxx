// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "regex/Pattern.hxx"

#include <fmt/format.h>

/**
 * Formats a #Pattern in the "/pattern/flags" notation, where the
 * flags are "i" (ignore case), "q" (ignore metacharacters) and "m"
 * (anchors match lines).
 */
template<>
struct fmt::formatter<Pattern> : formatter<string_view>
{
	template<typename FormatContext>
	auto format(const Pattern &pattern, FormatContext &ctx) const {
		const auto options = pattern.GetOptions();

		std::string s;
		s.reserve(pattern.GetPattern().size() + 5);
		s.push_back('/');
		s.append(pattern.GetPattern());
		s.push_back('/');

		if (options.Contains(RegexOptions::IgnoreCase()))
			s.push_back('i');
		if (options.Contains(RegexOptions::IgnoreMetacharacters()))
			s.push_back('q');
		if (options.Contains(RegexOptions::AnchorsMatchLines()))
			s.push_back('m');

		return formatter<string_view>::format(s, ctx);
	}
};
