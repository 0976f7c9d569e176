// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "UniqueRegex.hxx"
#include "Error.hxx"

void
UniqueRegex::Compile(std::string_view pattern, const uint32_t options)
{
	int error_number;
	PCRE2_SIZE error_offset;
	pcre2_code_8 *new_re = pcre2_compile_8(PCRE2_SPTR8(pattern.data()),
					       pattern.size(), options,
					       &error_number, &error_offset,
					       nullptr);
	if (new_re == nullptr)
		throw Pcre::CompileError(error_number, error_offset);

	if (re != nullptr)
		pcre2_code_free_8(re);
	re = new_re;

	/* JIT is optional; the interpreter is used if it fails */
	pcre2_jit_compile_8(re, PCRE2_JIT_COMPLETE);

	if (uint32_t n; (options & PCRE2_NO_AUTO_CAPTURE) == 0 &&
	    pcre2_pattern_info_8(re, PCRE2_INFO_CAPTURECOUNT, &n) == 0)
		n_capture = n;
	else
		n_capture = 0;
}
