// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "strmap.hxx"
#include "strutil.hxx"

#include <algorithm>

bool
StringMap::KeyEquals(std::string_view stored, std::string_view key) noexcept
{
	/* stored keys are always lower case */
	return stored.size() == key.size() &&
		std::equal(stored.begin(), stored.end(), key.begin(),
			   [](char a, char b){
				   return a == ToLowerASCII(b);
			   });
}

void
StringMap::Add(std::string_view key, std::string_view value)
{
	items.push_back({ToLower(key), std::string{value}});
}

void
StringMap::Set(std::string_view key, std::string_view value)
{
	auto i = std::find_if(items.begin(), items.end(),
			      [key](const Item &item){
				      return KeyEquals(item.key, key);
			      });
	if (i == items.end()) {
		Add(key, value);
		return;
	}

	i->value = value;

	/* erase all following duplicates */
	items.erase(std::remove_if(std::next(i), items.end(),
				   [key](const Item &item){
					   return KeyEquals(item.key, key);
				   }),
		    items.end());
}

bool
StringMap::Remove(std::string_view key) noexcept
{
	const auto n = std::erase_if(items, [key](const Item &item){
		return KeyEquals(item.key, key);
	});

	return n > 0;
}

const char *
StringMap::Get(std::string_view key) const noexcept
{
	for (const auto &i : items)
		if (KeyEquals(i.key, key))
			return i.value.c_str();

	return nullptr;
}

std::string
StringMap::GetJoined(std::string_view key) const
{
	std::string result;
	bool first = true;

	ForEach(key, [&result, &first](std::string_view value){
		if (!first)
			result += ", ";
		first = false;
		result += value;
	});

	return result;
}

void
StringMap::CopyFrom(const StringMap &src, std::string_view key)
{
	Remove(key);

	src.ForEach(key, [this, key](std::string_view value){
		Add(key, value);
	});
}
