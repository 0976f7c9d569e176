// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Options.hxx"
#include "util/IterableSplitString.hxx"
#include "util/StringStrip.hxx"

#include <fmt/core.h>

#include <stdexcept>

using std::string_view_literals::operator""sv;

static RegexOptions
ParseRegexOption(std::string_view name)
{
	if (name == "ignore_case"sv || name == "i"sv)
		return RegexOptions::IgnoreCase();
	else if (name == "ignore_metacharacters"sv || name == "literal"sv)
		return RegexOptions::IgnoreMetacharacters();
	else if (name == "anchors_match_lines"sv || name == "m"sv)
		return RegexOptions::AnchorsMatchLines();
	else
		throw std::runtime_error(fmt::format("Unknown regex option: '{}'",
						     name));
}

RegexOptions
ParseRegexOptions(std::string_view s)
{
	RegexOptions options;

	if (Strip(s).empty())
		return options;

	for (const std::string_view i : IterableSplitString(s, ',')) {
		const auto name = Strip(i);
		if (name.empty())
			throw std::runtime_error("Empty regex option name");

		options |= ParseRegexOption(name);
	}

	return options;
}

std::string
FormatRegexOptions(RegexOptions options)
{
	std::string result;

	const auto append = [&result](std::string_view name){
		if (!result.empty())
			result.push_back(',');
		result.append(name);
	};

	if (options.Contains(RegexOptions::IgnoreCase()))
		append("ignore_case"sv);

	if (options.Contains(RegexOptions::IgnoreMetacharacters()))
		append("ignore_metacharacters"sv);

	if (options.Contains(RegexOptions::AnchorsMatchLines()))
		append("anchors_match_lines"sv);

	return result;
}
