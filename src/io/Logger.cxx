// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Logger.hxx"
#include "lib/fmt/ToBuffer.hxx"
#include "util/Exception.hxx"

#include <array>

#include <sys/uio.h>
#include <unistd.h>

unsigned LoggerDetail::max_level = 1;

LoggerDetail::ParamWrapper<std::exception_ptr>::ParamWrapper(std::exception_ptr ep) noexcept
	:ParamWrapper<std::string>(GetFullMessage(std::move(ep))) {}

static constexpr struct iovec
MakeIovec(std::string_view s) noexcept
{
	return { const_cast<char *>(s.data()), s.size() };
}

void
LoggerDetail::WriteV(std::string_view domain,
		     std::span<const std::string_view> buffers) noexcept
{
	std::array<struct iovec, 64> v;
	std::size_t n = 0;

	if (!domain.empty()) {
		v[n++] = MakeIovec("[");
		v[n++] = MakeIovec(domain);
		v[n++] = MakeIovec("] ");
	}

	for (const auto i : buffers) {
		if (n >= v.size() - 1)
			break;

		v[n++] = MakeIovec(i);
	}

	v[n++] = MakeIovec("\n");

	ssize_t nbytes = writev(STDERR_FILENO, v.data(), n);
	(void)nbytes;
}

void
LoggerDetail::Fmt(unsigned level, std::string_view domain,
		  fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (!CheckLevel(level))
		return;

	const auto msg = VFmtBuffer<1024>(format_str, args);

	std::string_view s[]{msg.c_str()};
	WriteV(domain, s);
}
