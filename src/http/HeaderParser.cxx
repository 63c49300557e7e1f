// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HeaderParser.hxx"
#include "Chars.hxx"
#include "strmap.hxx"
#include "strutil.hxx"

#include <algorithm>

static constexpr bool
IsValidHeaderValueChar(char ch) noexcept
{
	return ch != '\0' && ch != '\n' && ch != '\r';
}

[[gnu::pure]]
static bool
IsValidHeaderValue(std::string_view value) noexcept
{
	return std::all_of(value.begin(), value.end(),
			   IsValidHeaderValueChar);
}

[[gnu::pure]]
static bool
IsValidHeaderName(std::string_view name) noexcept
{
	return !name.empty() &&
		std::all_of(name.begin(), name.end(), char_is_http_token);
}

bool
header_parse_line(StringMap &headers, std::string_view line)
{
	auto [name, value] = Split(line, ':');

	if (value.data() == nullptr ||
	    !IsValidHeaderName(name) ||
	    !IsValidHeaderValue(value)) [[unlikely]]
		return false;

	headers.Add(name, Strip(value));
	return true;
}

void
header_parse_buffer(StringMap &headers, std::string_view buffer)
{
	while (!buffer.empty()) {
		auto [line, rest] = Split(buffer, '\n');
		buffer = rest;

		while (!line.empty() && line.back() == '\r')
			line.remove_suffix(1);

		line = StripLeft(line);
		if (!line.empty())
			header_parse_line(headers, line);
	}
}
