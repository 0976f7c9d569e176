// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <iterator>
#include <string_view>

/**
 * Split a string at a certain separator character into sub strings
 * and allow iterating over the segments.
 *
 * Two consecutive separator characters result in an empty string.
 *
 * An empty input string returns one empty string.
 */
class IterableSplitString {
	std::string_view s;
	char separator;

public:
	constexpr IterableSplitString(std::string_view _s,
				      char _separator) noexcept
		:s(_s), separator(_separator) {}

	class Iterator final {
		friend class IterableSplitString;

		std::string_view current, rest;

		char separator;

		/**
		 * Are we past the last segment?
		 */
		bool done = false;

		constexpr Iterator(std::string_view _rest,
				   char _separator) noexcept
			:rest(_rest), separator(_separator)
		{
			Next();
		}

		constexpr Iterator(std::nullptr_t) noexcept
			:separator(0), done(true) {}

		constexpr void Next() noexcept {
			if (rest.data() == nullptr) {
				done = true;
				return;
			}

			const auto i = rest.find(separator);
			if (i == rest.npos) {
				current = rest;
				rest = {};
			} else {
				current = rest.substr(0, i);
				rest = rest.substr(i + 1);
			}
		}

	public:
		using iterator_category = std::forward_iterator_tag;
		using difference_type = std::ptrdiff_t;
		using value_type = std::string_view;
		using reference = value_type;
		using pointer = const value_type *;

		constexpr Iterator &operator++() noexcept {
			Next();
			return *this;
		}

		constexpr bool operator==(const Iterator &other) const noexcept {
			if (done || other.done)
				return done == other.done;

			return current.data() == other.current.data() &&
				current.size() == other.current.size();
		}

		constexpr reference operator*() const noexcept {
			return current;
		}

		constexpr pointer operator->() const noexcept {
			return &current;
		}
	};

	using iterator = Iterator;
	using const_iterator = Iterator;

	constexpr const_iterator begin() const noexcept {
		return {s.data() != nullptr ? s : std::string_view{"", 0}, separator};
	}

	constexpr const_iterator end() const noexcept {
		return {nullptr};
	}
};
