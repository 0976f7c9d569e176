// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "CharacterRange.hxx"

#include <optional>
#include <utility>
#include <vector>

class MatchData;

/**
 * A match as reported by the engine, in byte offsets.  There is one
 * capture slot for each group declared in the pattern; groups which
 * did not participate in the match are std::nullopt.
 */
struct RawMatch {
	ByteRange range;

	std::vector<std::optional<ByteRange>> captures;

	RawMatch(ByteRange _range,
		 std::vector<std::optional<ByteRange>> &&_captures) noexcept
		:range(_range), captures(std::move(_captures)) {}

	explicit RawMatch(const MatchData &md);
};
