// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Character classes according to RFC 3986 2.
 */

#pragma once

#include "strutil.hxx"

constexpr bool
IsUriGenDelim(char ch) noexcept
{
	return ch == ':' || ch == '/' || ch == '?' || ch == '#' ||
		ch == '[' || ch == ']' || ch == '@';
}

constexpr bool
IsUriSubDelim(char ch) noexcept
{
	return ch == '!' || ch == '$' || ch == '&' || ch == '\'' ||
		ch == '(' || ch == ')' || ch == '*' || ch == '+' ||
		ch == ',' || ch == ';' || ch == '=';
}

constexpr bool
IsUriUnreserved(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) ||
		ch == '-' || ch == '.' || ch == '_' || ch == '~';
}

/**
 * Is this character allowed anywhere in a URI (possibly as part of
 * a percent-encoded triplet)?
 */
constexpr bool
IsUriChar(char ch) noexcept
{
	return IsUriUnreserved(ch) || IsUriGenDelim(ch) ||
		IsUriSubDelim(ch) || ch == '%';
}

/**
 * RFC 3986 3.3 "pchar" without the percent sign.
 */
constexpr bool
IsUriPchar(char ch) noexcept
{
	return IsUriUnreserved(ch) || IsUriSubDelim(ch) ||
		ch == ':' || ch == '@';
}

constexpr bool
IsHexDigit(char ch) noexcept
{
	return IsDigitASCII(ch) ||
		(ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
}
