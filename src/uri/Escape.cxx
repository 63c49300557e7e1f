// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Escape.hxx"
#include "Chars.hxx"

static constexpr char hex_digits[] = "0123456789ABCDEF";

static constexpr bool
IsFormUnreserved(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) ||
		ch == '.' || ch == '-' || ch == '*' || ch == '_';
}

std::string
uri_form_escape(std::string_view src)
{
	std::string dest;
	dest.reserve(src.size());

	for (const char ch : src) {
		if (IsFormUnreserved(ch))
			dest.push_back(ch);
		else if (ch == ' ')
			dest.push_back('+');
		else {
			const auto byte = static_cast<unsigned char>(ch);
			dest.push_back('%');
			dest.push_back(hex_digits[byte >> 4]);
			dest.push_back(hex_digits[byte & 0xf]);
		}
	}

	return dest;
}

std::optional<std::string>
uri_normalize_escapes(std::string_view src)
{
	std::string dest;
	dest.reserve(src.size());

	for (std::size_t i = 0; i < src.size(); ++i) {
		const char ch = src[i];
		if (ch != '%') {
			dest.push_back(ch);
			continue;
		}

		if (src.size() - i < 3)
			/* percent sign at the end of string */
			return std::nullopt;

		if (!IsHexDigit(src[i + 1]) || !IsHexDigit(src[i + 2]))
			/* invalid hex digits */
			return std::nullopt;

		dest.push_back('%');
		dest.push_back(ToUpperASCII(src[i + 1]));
		dest.push_back(ToUpperASCII(src[i + 2]));
		i += 2;
	}

	return dest;
}
