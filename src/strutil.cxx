// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "strutil.hxx"

#include <algorithm>
#include <iterator>

std::string_view
StripLeft(std::string_view s) noexcept
{
	auto i = std::find_if_not(s.begin(), s.end(), IsWhitespaceOrNull);
	return s.substr(std::distance(s.begin(), i));
}

std::string_view
StripRight(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespaceOrNull(s.back()))
		s.remove_suffix(1);
	return s;
}

std::string
ToLower(std::string_view s)
{
	std::string result;
	result.reserve(s.size());
	std::transform(s.begin(), s.end(), std::back_inserter(result),
		       ToLowerASCII);
	return result;
}

bool
StringIsEqualIgnoreCase(std::string_view a, std::string_view b) noexcept
{
	return a.size() == b.size() &&
		std::equal(a.begin(), a.end(), b.begin(),
			   [](char x, char y){
				   return ToLowerASCII(x) == ToLowerASCII(y);
			   });
}

std::pair<std::string_view, std::string_view>
Split(std::string_view s, char separator) noexcept
{
	const auto i = s.find(separator);
	if (i == s.npos)
		return {s, {}};

	return {s.substr(0, i), s.substr(i + 1)};
}

std::optional<uint_least64_t>
ParseDecimal(std::string_view s, uint_least64_t max_value) noexcept
{
	if (s.empty())
		return std::nullopt;

	uint_least64_t value = 0;
	for (char ch : s) {
		if (!IsDigitASCII(ch))
			return std::nullopt;

		const unsigned digit = ch - '0';
		if (value > (max_value - digit) / 10)
			/* overflow: clamp, but keep validating the
			   remaining characters */
			value = max_value;
		else
			value = value * 10 + digit;
	}

	return value;
}
