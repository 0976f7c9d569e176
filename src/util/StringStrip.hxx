// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <string_view>

[[gnu::pure]]
constexpr bool
IsWhitespaceOrNull(char ch) noexcept
{
	return static_cast<unsigned char>(ch) <= 0x20;
}

/**
 * Skips whitespace at the beginning of the string.
 */
[[gnu::pure]]
constexpr std::string_view
StripLeft(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespaceOrNull(s.front()))
		s.remove_prefix(1);
	return s;
}

/**
 * Skips whitespace at the end of the string.
 */
[[gnu::pure]]
constexpr std::string_view
StripRight(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespaceOrNull(s.back()))
		s.remove_suffix(1);
	return s;
}

/**
 * Skips whitespace at the beginning and the end of the string.
 */
[[gnu::pure]]
constexpr std::string_view
Strip(std::string_view s) noexcept
{
	return StripRight(StripLeft(s));
}
