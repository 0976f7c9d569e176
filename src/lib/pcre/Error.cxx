// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Error.hxx"
#include "lib/fmt/ToBuffer.hxx"

#include <pcre2.h>

#include <iterator> // for std::size()

namespace Pcre {

ErrorCategory error_category;

std::string
ErrorCategory::message(int condition) const
{
	PCRE2_UCHAR8 buffer[256];
	if (pcre2_get_error_message_8(condition, buffer,
				      std::size(buffer)) < 0)
		return "Unknown PCRE2 error";

	return std::string{(const char *)buffer};
}

CompileError::CompileError(int error, std::size_t _offset)
	:std::system_error(error, error_category,
			   FmtBuffer<64>("Error in regex at offset {}",
					 _offset).c_str()),
	 offset(_offset) {}

MatchError::MatchError(int error)
	:std::system_error(error, error_category, "Regex match failed") {}

} // namespace Pcre
