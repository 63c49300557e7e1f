// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Small string helpers shared by the HTTP and URI code.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

constexpr bool
IsWhitespaceOrNull(char ch) noexcept
{
	return (unsigned char)ch <= 0x20;
}

constexpr bool
IsWhitespaceNotNull(char ch) noexcept
{
	return ch > 0 && ch <= 0x20;
}

constexpr bool
IsDigitASCII(char ch) noexcept
{
	return ch >= '0' && ch <= '9';
}

constexpr bool
IsUpperAlphaASCII(char ch) noexcept
{
	return ch >= 'A' && ch <= 'Z';
}

constexpr bool
IsLowerAlphaASCII(char ch) noexcept
{
	return ch >= 'a' && ch <= 'z';
}

constexpr bool
IsAlphaASCII(char ch) noexcept
{
	return IsUpperAlphaASCII(ch) || IsLowerAlphaASCII(ch);
}

constexpr bool
IsAlphaNumericASCII(char ch) noexcept
{
	return IsAlphaASCII(ch) || IsDigitASCII(ch);
}

constexpr char
ToLowerASCII(char ch) noexcept
{
	return IsUpperAlphaASCII(ch)
		? char(ch - 'A' + 'a')
		: ch;
}

constexpr char
ToUpperASCII(char ch) noexcept
{
	return IsLowerAlphaASCII(ch)
		? char(ch - 'a' + 'A')
		: ch;
}

[[gnu::pure]]
std::string_view
StripLeft(std::string_view s) noexcept;

[[gnu::pure]]
std::string_view
StripRight(std::string_view s) noexcept;

[[gnu::pure]]
inline std::string_view
Strip(std::string_view s) noexcept
{
	return StripRight(StripLeft(s));
}

std::string
ToLower(std::string_view s);

[[gnu::pure]]
bool
StringIsEqualIgnoreCase(std::string_view a, std::string_view b) noexcept;

/**
 * Split the string at the first occurrence of the separator.  If
 * the separator was not found, the second element has a nullptr
 * data pointer.
 */
[[gnu::pure]]
std::pair<std::string_view, std::string_view>
Split(std::string_view s, char separator) noexcept;

/**
 * Parse a non-negative decimal integer.  The whole string must
 * consist of digits.  Values which do not fit are clamped to
 * #max_value.
 *
 * @return std::nullopt if the string is empty or contains a
 * non-digit
 */
[[gnu::pure]]
std::optional<uint_least64_t>
ParseDecimal(std::string_view s,
	     uint_least64_t max_value=UINT64_MAX) noexcept;
