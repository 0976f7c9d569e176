// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <any>
#include <string>
#include <string_view>
#include <utility>

namespace ThreadLocalDetail {

/**
 * Look up a value in the calling thread's storage.
 *
 * @return nullptr if there is no value for this key
 */
std::any *
Find(std::string_view key) noexcept;

void
Store(std::string_view key, std::any &&value);

void
Erase(std::string_view key) noexcept;

} // namespace ThreadLocalDetail

/**
 * A slot in per-thread storage, identified by a string key.  Each
 * thread sees only the value it has stored itself; the values are
 * destroyed when their thread exits.
 *
 * This object holds only the key and may be shared by all threads.
 * Two instances with the same key refer to the same slot.
 *
 * @param T the value type; must be copy-constructible
 */
template<typename T>
class ThreadLocal {
	const std::string key;

public:
	explicit ThreadLocal(std::string _key) noexcept
		:key(std::move(_key)) {}

	const std::string &GetKey() const noexcept {
		return key;
	}

	/**
	 * @return a pointer to the calling thread's value or nullptr
	 * if it has none (or if it holds a value of a different type)
	 */
	T *Get() const noexcept {
		return std::any_cast<T>(ThreadLocalDetail::Find(key));
	}

	bool IsSet() const noexcept {
		return Get() != nullptr;
	}

	void Set(T value) const {
		ThreadLocalDetail::Store(key, std::any{std::move(value)});
	}

	/**
	 * Remove the calling thread's value.
	 */
	void Reset() const noexcept {
		ThreadLocalDetail::Erase(key);
	}
};
