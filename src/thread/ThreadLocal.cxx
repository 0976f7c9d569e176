// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ThreadLocal.hxx"

#include <functional> // for std::less
#include <map>

namespace ThreadLocalDetail {

using Map = std::map<std::string, std::any, std::less<>>;

static Map &
GetMap() noexcept
{
	static thread_local Map map;
	return map;
}

std::any *
Find(std::string_view key) noexcept
{
	auto &map = GetMap();
	auto i = map.find(key);
	if (i == map.end())
		return nullptr;

	return &i->second;
}

void
Store(std::string_view key, std::any &&value)
{
	auto &map = GetMap();
	if (auto i = map.find(key); i != map.end())
		i->second = std::move(value);
	else
		map.emplace(key, std::move(value));
}

void
Erase(std::string_view key) noexcept
{
	auto &map = GetMap();
	if (auto i = map.find(key); i != map.end())
		map.erase(i);
}

} // namespace ThreadLocalDetail
