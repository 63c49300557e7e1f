// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "List.hxx"
#include "strutil.hxx"

/**
 * Find the next comma which is not inside a quoted string.
 *
 * @return the position or std::string_view::npos
 */
[[gnu::pure]]
static std::size_t
FindListSeparator(std::string_view list) noexcept
{
	bool quoted = false;

	for (std::size_t i = 0; i < list.size(); ++i) {
		const char ch = list[i];
		if (quoted) {
			if (ch == '\\')
				/* skip the quoted-pair */
				++i;
			else if (ch == '"')
				quoted = false;
		} else if (ch == '"')
			quoted = true;
		else if (ch == ',')
			return i;
	}

	return std::string_view::npos;
}

template<typename F>
static bool
ForEachListItem(std::string_view list, F &&f) noexcept(noexcept(f(list)))
{
	while (!list.empty()) {
		const auto comma = FindListSeparator(list);
		const auto item = Strip(list.substr(0, comma));

		if (!item.empty() && f(item))
			return true;

		if (comma == std::string_view::npos)
			/* this was the last element */
			break;

		/* continue after the comma */
		list = list.substr(comma + 1);
	}

	return false;
}

std::vector<std::string_view>
http_list_split_raw(std::string_view list)
{
	std::vector<std::string_view> result;

	ForEachListItem(list, [&result](std::string_view item){
		result.push_back(item);
		return false;
	});

	return result;
}

std::vector<std::string>
http_list_split(std::string_view list)
{
	std::vector<std::string> result;

	ForEachListItem(list, [&result](std::string_view item){
		result.push_back(ToLower(item));
		return false;
	});

	return result;
}

bool
http_list_contains(std::string_view list, std::string_view item) noexcept
{
	return ForEachListItem(list, [item](std::string_view i) noexcept {
		return i == item;
	});
}

bool
http_list_contains_i(std::string_view list, std::string_view item) noexcept
{
	return ForEachListItem(list, [item](std::string_view i) noexcept {
		return StringIsEqualIgnoreCase(i, item);
	});
}
