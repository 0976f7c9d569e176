// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <array>
#include <cstddef>
#include <string_view>

/**
 * A statically allocated string buffer.
 */
template<std::size_t CAPACITY>
class StringBuffer {
public:
	using value_type = char;
	using size_type = std::size_t;
	using pointer = value_type *;
	using const_pointer = const value_type *;
	using iterator = pointer;
	using const_iterator = const_pointer;

	static constexpr value_type SENTINEL = '\0';

private:
	std::array<value_type, CAPACITY> the_data;

public:
	constexpr size_type capacity() const noexcept {
		return CAPACITY;
	}

	constexpr bool empty() const noexcept {
		return front() == SENTINEL;
	}

	constexpr void clear() noexcept {
		the_data[0] = SENTINEL;
	}

	constexpr const_pointer c_str() const noexcept {
		return the_data.data();
	}

	constexpr pointer data() noexcept {
		return the_data.data();
	}

	constexpr value_type front() const noexcept {
		return c_str()[0];
	}

	constexpr operator std::string_view() const noexcept {
		return c_str();
	}

	constexpr iterator begin() noexcept {
		return data();
	}

	constexpr const_iterator begin() const noexcept {
		return c_str();
	}
};
