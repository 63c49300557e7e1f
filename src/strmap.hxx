// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <concepts>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * An ordered multi-map of HTTP header names to values.  Keys are
 * stored in lower case; insertion order is preserved and duplicate
 * keys are allowed (e.g. for headers which may repeat).
 */
class StringMap {
	struct Item {
		std::string key, value;
	};

	using List = std::vector<Item>;

	List items;

public:
	using const_iterator = List::const_iterator;

	StringMap() = default;

	StringMap(std::initializer_list<std::pair<std::string_view, std::string_view>> init) {
		for (const auto &i : init)
			Add(i.first, i.second);
	}

	StringMap(const StringMap &) = default;
	StringMap(StringMap &&) noexcept = default;
	StringMap &operator=(const StringMap &) = default;
	StringMap &operator=(StringMap &&) noexcept = default;

	const_iterator begin() const noexcept {
		return items.begin();
	}

	const_iterator end() const noexcept {
		return items.end();
	}

	[[gnu::pure]]
	bool IsEmpty() const noexcept {
		return items.empty();
	}

	std::size_t size() const noexcept {
		return items.size();
	}

	void Clear() noexcept {
		items.clear();
	}

	void Add(std::string_view key, std::string_view value);

	/**
	 * Remove all existing values with the specified key and add
	 * the new value at the position of the first removed one
	 * (or at the end if there was none).
	 */
	void Set(std::string_view key, std::string_view value);

	/**
	 * Remove all values with the specified key.
	 *
	 * @return true if at least one item was removed
	 */
	bool Remove(std::string_view key) noexcept;

	/**
	 * @return the first value with the specified key or nullptr
	 */
	[[gnu::pure]]
	const char *Get(std::string_view key) const noexcept;

	[[gnu::pure]]
	bool Contains(std::string_view key) const noexcept {
		return Get(key) != nullptr;
	}

	void ForEach(std::string_view key,
		     std::invocable<std::string_view> auto f) const {
		for (const auto &i : items)
			if (KeyEquals(i.key, key))
				f(std::string_view{i.value});
	}

	/**
	 * Join all values of the specified key with ", " (RFC 7230
	 * 3.2.2).
	 *
	 * @return an empty string if there is no such key
	 */
	std::string GetJoined(std::string_view key) const;

	/**
	 * Copy all values of the specified key from another map,
	 * replacing existing values.
	 */
	void CopyFrom(const StringMap &src, std::string_view key);

private:
	[[gnu::pure]]
	static bool KeyEquals(std::string_view stored,
			      std::string_view key) noexcept;
};
