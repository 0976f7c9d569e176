// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * PCRE2 error reporting.
 */

#pragma once

#include <cstddef>
#include <string>
#include <system_error>

namespace Pcre {

class ErrorCategory final : public std::error_category {
public:
	const char *name() const noexcept override {
		return "pcre2";
	}

	std::string message(int condition) const override;
};

extern ErrorCategory error_category;

/**
 * A pattern could not be compiled.  The error code is the PCRE2
 * error number, and GetOffset() returns the position in the pattern
 * (in bytes) where PCRE2 gave up.
 */
class CompileError : public std::system_error {
	std::size_t offset;

public:
	CompileError(int error, std::size_t _offset);

	std::size_t GetOffset() const noexcept {
		return offset;
	}
};

/**
 * The PCRE2 matcher failed for a reason other than "no match",
 * e.g. the subject is not valid UTF-8 or a resource limit was
 * exceeded.
 */
class MatchError : public std::system_error {
public:
	explicit MatchError(int error);
};

} // namespace Pcre
