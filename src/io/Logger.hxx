// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <fmt/core.h>

#include <array>
#include <cstddef>
#include <exception>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

namespace LoggerDetail {

template<typename T>
struct ParamWrapper;

template<>
struct ParamWrapper<std::string_view> {
	std::string_view value;

	constexpr explicit ParamWrapper(std::string_view _value) noexcept
		:value(_value) {}

	constexpr std::string_view GetValue() const noexcept {
		return value;
	}
};

template<>
struct ParamWrapper<const char *> : ParamWrapper<std::string_view> {
	using ParamWrapper<std::string_view>::ParamWrapper;
};

template<>
struct ParamWrapper<char *> : ParamWrapper<std::string_view> {
	using ParamWrapper<std::string_view>::ParamWrapper;
};

template<>
struct ParamWrapper<std::string> {
	std::string value;

	template<typename S>
	explicit ParamWrapper(S &&_value) noexcept
		:value(std::forward<S>(_value)) {}

	[[gnu::pure]]
	std::string_view GetValue() const noexcept {
		return value;
	}
};

template<>
struct ParamWrapper<std::exception_ptr> : ParamWrapper<std::string> {
	explicit ParamWrapper(std::exception_ptr ep) noexcept;
};

template<typename... Params>
class ParamArray {
	std::tuple<ParamWrapper<Params>...> wrappers;

public:
	static constexpr size_t count = sizeof...(Params);
	std::array<std::string_view, count> values;

	explicit ParamArray(Params... params) noexcept
		:wrappers(params...)
	{
		std::apply([this](const auto &...w){
			auto *i = values.data();
			((*i++ = w.GetValue()), ...);
		}, wrappers);
	}
};

extern unsigned max_level;

inline bool
CheckLevel(unsigned level) noexcept
{
	return level <= max_level;
}

void
WriteV(std::string_view domain, std::span<const std::string_view> buffers) noexcept;

template<typename... Params>
void
LogConcat(unsigned level, std::string_view domain, Params... _params) noexcept
{
	if (!CheckLevel(level))
		return;

	const ParamArray<Params...> params(_params...);
	WriteV(domain, params.values);
}

void
Fmt(unsigned level, std::string_view domain,
    fmt::string_view format_str, fmt::format_args args) noexcept;

} /* namespace LoggerDetail */

inline void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::max_level = level;
}

template<typename S, typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       const S &format_str, Args&&... args) noexcept
{
	LoggerDetail::Fmt(level, domain, format_str,
			  fmt::make_format_args(args...));
}

template<typename Domain>
class BasicLogger : public Domain {
public:
	BasicLogger() = default;

	template<typename D>
	explicit BasicLogger(D &&_domain)
		:Domain(std::forward<D>(_domain)) {}

	template<typename... Params>
	void operator()(unsigned level, Params... params) const noexcept {
		LoggerDetail::LogConcat(level, GetDomain(),
					std::forward<Params>(params)...);
	}

	std::string_view GetDomain() const noexcept {
		return Domain::GetDomain();
	}
};

/**
 * A logger domain which is a string literal, e.g. the name of a
 * library module.
 */
class LiteralLoggerDomain {
	std::string_view domain;

public:
	constexpr explicit LiteralLoggerDomain(std::string_view _domain={}) noexcept
		:domain(_domain) {}

	constexpr std::string_view GetDomain() const noexcept {
		return domain;
	}
};

/**
 * A #BasicLogger which uses a literal string as its domain.  Log
 * lines are prefixed with "[domain] ".
 */
class LLogger : public BasicLogger<LiteralLoggerDomain> {
public:
	LLogger() = default;

	template<typename D>
	explicit LLogger(D &&_domain) noexcept
		:BasicLogger(std::forward<D>(_domain)) {}
};
