// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Convenience functions which remember the outcome of the most
 * recent call in per-thread storage, for call sites which prefer a
 * simple predicate over handling exceptions and #Match objects.
 * Each thread sees only its own results.
 */

#pragma once

#include "Pattern.hxx"

#include <exception>
#include <optional>
#include <string_view>

/**
 * Compile a pattern without throwing.  On failure, the error is
 * stored as the calling thread's "last error"; on success, that slot
 * is cleared.  Running out of memory is fatal.
 *
 * @return std::nullopt if the pattern could not be compiled
 */
std::optional<Pattern>
MakePattern(std::string_view pattern,
	    RegexOptions options=RegexOptions{}) noexcept;

/**
 * The error of the calling thread's most recent failed
 * MakePattern() call, or nullptr if the most recent call succeeded
 * (or there was none).
 */
std::exception_ptr
GetLastPatternError() noexcept;

/**
 * Does the pattern match the subject?  The match is stored as the
 * calling thread's "last match"; if there is none, that slot is
 * cleared.
 *
 * Throws Pcre::MatchError on engine failure.
 */
bool
PatternMatches(const Pattern &pattern, std::string_view subject);

/**
 * Same as PatternMatches(const Pattern &, std::string_view), with
 * the arguments swapped.
 */
inline bool
PatternMatches(std::string_view subject, const Pattern &pattern)
{
	return PatternMatches(pattern, subject);
}

/**
 * The match found by the calling thread's most recent successful
 * PatternMatches() call, or nullptr if the most recent call did not
 * match (or there was none).  The pointer is invalidated by the
 * next PatternMatches() call in this thread.
 */
const Match *
GetLastMatch() noexcept;
