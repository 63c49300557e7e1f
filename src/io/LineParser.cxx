// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LineParser.hxx"

#include <string>

#include <stdlib.h>
#include <string.h>

LineParser::LineParser(char *_p) noexcept
	:p(_p)
{
	Strip();

	/* strip trailing whitespace (including the newline) */
	char *end = p + strlen(p);
	while (end > p && IsWhitespaceOrNull(end[-1]))
		--end;
	*end = 0;
}

void
LineParser::ExpectEnd()
{
	if (!IsEnd())
		throw Error(std::string("Unexpected tokens at end of line: ") + p);
}

bool
LineParser::SkipWord(const char *word) noexcept
{
	const std::size_t length = strlen(word);
	if (strncmp(p, word, length) != 0)
		return false;

	if (p[length] == 0) {
		p += length;
		return true;
	}

	if (IsWhitespaceNotNull(p[length])) {
		p += length + 1;
		Strip();
		return true;
	}

	return false;
}

const char *
LineParser::NextWord() noexcept
{
	if (!IsWordChar(front()))
		return nullptr;

	const char *result = p;
	do {
		++p;
	} while (IsWordChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return result;
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	if (!IsUnquotedChar(front()))
		return nullptr;

	char *result = p;
	do {
		++p;
	} while (IsUnquotedChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return result;
}

inline char *
LineParser::NextQuotedValue(const char stop) noexcept
{
	char *const value = p;
	char *q = strchr(p, stop);
	if (q == nullptr)
		return nullptr;

	*q++ = 0;
	p = q;
	Strip();
	return value;
}

char *
LineParser::NextValue() noexcept
{
	const char ch = front();
	if (IsQuote(ch)) {
		++p;
		return NextQuotedValue(ch);
	} else
		return NextUnquotedValue();
}

char *
LineParser::NextUnescape() noexcept
{
	const char stop = front();
	if (!IsQuote(stop))
		return nullptr;

	char *dest = ++p;
	char *const value = dest;

	while (true) {
		char ch = *p++;

		if (ch == 0)
			return nullptr;
		else if (ch == stop) {
			*dest = 0;
			Strip();
			return value;
		} else if (ch == '\\') {
			ch = *p++;

			switch (ch) {
			case 'r':
				*dest++ = '\r';
				break;

			case 'n':
				*dest++ = '\n';
				break;

			case '\\':
			case '\'':
			case '\"':
				*dest++ = ch;
				break;

			default:
				return nullptr;
			}
		} else
			*dest++ = ch;
	}
}

bool
LineParser::NextBool()
{
	const char *value = NextValue();
	if (value == nullptr)
		throw Error("yes/no expected");

	if (strcmp(value, "yes") == 0)
		return true;
	else if (strcmp(value, "no") == 0)
		return false;
	else
		throw Error("yes/no expected");
}

/**
 * Split a value into its number and an optional one-character
 * suffix.
 */
static uint_least64_t
ParseNumberWithSuffix(const char *s, char &suffix)
{
	std::string_view value{s};
	suffix = 0;
	if (!value.empty() && !IsDigitASCII(value.back())) {
		suffix = value.back();
		value.remove_suffix(1);
	}

	const auto number = ParseDecimal(value);
	if (!number)
		throw LineParser::Error(std::string("Not a valid number: ") + s);

	return *number;
}

uint_least64_t
LineParser::NextSize()
{
	const char *s = NextValue();
	if (s == nullptr)
		throw Error("Size expected");

	char suffix;
	auto value = ParseNumberWithSuffix(s, suffix);

	switch (suffix) {
	case 0:
		return value;

	case 'k':
		return value << 10;

	case 'M':
		return value << 20;

	case 'G':
		return value << 30;

	default:
		throw Error(std::string("Unknown size suffix: ") + s);
	}
}

unsigned
LineParser::NextPositiveInteger()
{
	const char *s = NextValue();
	if (s == nullptr)
		throw Error("Number expected");

	const auto value = ParseDecimal(s, 0xffffffff);
	if (!value || *value == 0)
		throw Error(std::string("Not a positive number: ") + s);

	return unsigned(*value);
}

double
LineParser::NextDouble()
{
	const char *s = NextValue();
	if (s == nullptr)
		throw Error("Number expected");

	char *endptr;
	const double value = strtod(s, &endptr);
	if (endptr == s || *endptr != 0 || !(value >= 0))
		throw Error(std::string("Not a valid number: ") + s);

	return value;
}

std::chrono::seconds
LineParser::NextDuration()
{
	const char *s = NextValue();
	if (s == nullptr)
		throw Error("Duration expected");

	char suffix;
	const std::chrono::seconds value(ParseNumberWithSuffix(s, suffix));

	switch (suffix) {
	case 0:
	case 's':
		return value;

	case 'm':
		return value * 60;

	case 'h':
		return value * 3600;

	case 'd':
		return value * 86400;

	default:
		throw Error(std::string("Unknown duration suffix: ") + s);
	}
}

char *
LineParser::ExpectValue()
{
	char *value = NextValue();
	if (value == nullptr || *value == 0)
		throw Error("Value expected");

	return value;
}

char *
LineParser::ExpectValueAndEnd()
{
	char *value = ExpectValue();
	ExpectEnd();
	return value;
}
