// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "LastResult.hxx"
#include "thread/ThreadLocal.hxx"
#include "lib/pcre/Error.hxx"
#include "io/Logger.hxx"

static const ThreadLocal<std::exception_ptr> last_error{"regex.last_error"};
static const ThreadLocal<Match> last_match{"regex.last_match"};

static const LLogger logger{"regex"};

std::optional<Pattern>
MakePattern(std::string_view pattern, RegexOptions options) noexcept
{
	try {
		std::optional<Pattern> result{std::in_place, pattern, options};
		last_error.Reset();
		return result;
	} catch (const Pcre::CompileError &) {
		const auto error = std::current_exception();
		logger(4, "Failed to compile regex '", pattern, "': ", error);
		last_error.Set(error);
		return std::nullopt;
	}
}

std::exception_ptr
GetLastPatternError() noexcept
{
	const auto *error = last_error.Get();
	return error != nullptr ? *error : std::exception_ptr{};
}

bool
PatternMatches(const Pattern &pattern, std::string_view subject)
{
	auto m = pattern.FirstMatch(subject);
	if (!m) {
		last_match.Reset();
		return false;
	}

	last_match.Set(std::move(*m));
	return true;
}

const Match *
GetLastMatch() noexcept
{
	return last_match.Get();
}
