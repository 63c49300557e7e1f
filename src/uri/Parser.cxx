// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Parser.hxx"
#include "Chars.hxx"
#include "strutil.hxx"

#include <algorithm>
#include <stdexcept>

static constexpr bool
IsSchemeChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) ||
		ch == '+' || ch == '-' || ch == '.';
}

/**
 * Check for forbidden characters and malformed percent-encoded
 * triplets.
 */
[[gnu::pure]]
static bool
VerifyUriChars(std::string_view s) noexcept
{
	for (std::size_t i = 0; i < s.size(); ++i) {
		const char ch = s[i];
		if (!IsUriChar(ch))
			return false;

		if (ch == '%') {
			if (s.size() - i < 3 ||
			    !IsHexDigit(s[i + 1]) || !IsHexDigit(s[i + 2]))
				return false;

			i += 2;
		}
	}

	return true;
}

[[gnu::pure]]
static bool
VerifyRegName(std::string_view host) noexcept
{
	return std::all_of(host.begin(), host.end(), [](char ch){
		return IsUriUnreserved(ch) || IsUriSubDelim(ch) || ch == '%';
	});
}

[[gnu::pure]]
static bool
VerifyIpLiteral(std::string_view host) noexcept
{
	/* including the square brackets */
	if (host.size() < 3 || host.front() != '[' || host.back() != ']')
		return false;

	host = host.substr(1, host.size() - 2);
	return std::all_of(host.begin(), host.end(), [](char ch){
		return IsUriUnreserved(ch) || IsUriSubDelim(ch) || ch == ':';
	});
}

[[gnu::pure]]
static bool
VerifyPort(std::string_view port) noexcept
{
	if (port.empty())
		return true;

	const auto value = ParseDecimal(port);
	return value && *value <= 65535;
}

/**
 * Parse the authority component ("userinfo@host:port").
 */
static bool
ParseAuthority(UriParts &uri, std::string_view authority) noexcept
{
	const auto at = authority.rfind('@');
	if (at != authority.npos) {
		uri.has_userinfo = true;
		uri.userinfo = authority.substr(0, at);
		authority = authority.substr(at + 1);
	}

	if (!authority.empty() && authority.front() == '[') {
		const auto bracket = authority.find(']');
		if (bracket == authority.npos)
			return false;

		uri.host = authority.substr(0, bracket + 1);
		authority = authority.substr(bracket + 1);

		if (!VerifyIpLiteral(uri.host))
			return false;

		if (!authority.empty()) {
			if (authority.front() != ':')
				return false;

			uri.port = authority.substr(1);
		}
	} else {
		const auto colon = authority.rfind(':');
		if (colon != authority.npos) {
			uri.host = authority.substr(0, colon);
			uri.port = authority.substr(colon + 1);
		} else
			uri.host = authority;

		if (!VerifyRegName(uri.host))
			return false;
	}

	return VerifyPort(uri.port);
}

bool
UriParts::Parse(std::string_view src) noexcept
{
	*this = {};

	if (!VerifyUriChars(src))
		return false;

	/* fragment */

	if (const auto hash = src.find('#'); hash != src.npos) {
		has_fragment = true;
		fragment = src.substr(hash + 1);
		src = src.substr(0, hash);

		if (fragment.find('#') != fragment.npos)
			return false;
	}

	/* scheme */

	if (!src.empty() && IsAlphaASCII(src.front())) {
		const auto end = std::find_if_not(src.begin(), src.end(),
						  IsSchemeChar);
		if (end != src.end() && *end == ':') {
			const std::size_t n = std::distance(src.begin(), end);
			scheme = src.substr(0, n);
			src = src.substr(n + 1);
		}
	}

	/* query */

	if (const auto qmark = src.find('?'); qmark != src.npos) {
		has_query = true;
		query = src.substr(qmark + 1);
		src = src.substr(0, qmark);
	}

	/* authority */

	if (src.starts_with("//")) {
		src = src.substr(2);
		has_authority = true;

		const auto slash = src.find('/');
		if (!ParseAuthority(*this, src.substr(0, slash)))
			return false;

		src = slash == src.npos ? std::string_view{} : src.substr(slash);
	}

	path = src;

	/* RFC 3986 3.3: a path without authority must not begin
	   with "//", and a relative path without scheme must not
	   have a colon in its first segment */
	if (!has_authority && path.starts_with("//"))
		return false;

	if (!IsAbsolute() && !has_authority) {
		const auto first_segment = path.substr(0, path.find('/'));
		if (first_segment.find(':') != first_segment.npos)
			return false;
	}

	return true;
}

int
UriParts::GetPort() const noexcept
{
	if (port.empty())
		return -1;

	const auto value = ParseDecimal(port);
	return value ? int(*value) : -1;
}

std::string
UriParts::ToString() const
{
	std::string result;

	if (!scheme.empty()) {
		result.append(scheme);
		result.push_back(':');
	}

	if (has_authority) {
		result.append("//");

		if (has_userinfo) {
			result.append(userinfo);
			result.push_back('@');
		}

		result.append(host);

		if (!port.empty()) {
			result.push_back(':');
			result.append(port);
		}
	}

	result.append(path);

	if (has_query) {
		result.push_back('?');
		result.append(query);
	}

	if (has_fragment) {
		result.push_back('#');
		result.append(fragment);
	}

	return result;
}

/**
 * Remove the last segment (and its preceding slash) from the output
 * buffer.
 */
static void
RemoveLastSegment(std::string &output) noexcept
{
	const auto slash = output.rfind('/');
	output.erase(slash == output.npos ? 0 : slash);
}

std::string
uri_remove_dot_segments(std::string_view input)
{
	std::string output;
	output.reserve(input.size());

	while (!input.empty()) {
		if (input.starts_with("../"))
			input.remove_prefix(3);
		else if (input.starts_with("./"))
			input.remove_prefix(2);
		else if (input.starts_with("/./"))
			input.remove_prefix(2);
		else if (input == "/.")
			input = "/";
		else if (input.starts_with("/../")) {
			input.remove_prefix(3);
			RemoveLastSegment(output);
		} else if (input == "/..") {
			input = "/";
			RemoveLastSegment(output);
		} else if (input == "." || input == "..")
			input = {};
		else {
			/* move the first path segment (including its
			   leading slash, but not the next one) to the
			   output */
			const auto next = input.find('/', 1);
			const auto segment = input.substr(0, next);
			output.append(segment);
			input.remove_prefix(segment.size());
		}
	}

	return output;
}

/**
 * Merge a relative path with the base path (RFC 3986 5.2.3).
 */
static std::string
MergePaths(const UriParts &base, std::string_view path)
{
	if (base.has_authority && base.path.empty())
		return "/" + std::string{path};

	const auto slash = base.path.rfind('/');
	if (slash == base.path.npos)
		return std::string{path};

	std::string result{base.path.substr(0, slash + 1)};
	result.append(path);
	return result;
}

std::string
uri_resolve(std::string_view base_string, std::string_view reference_string)
{
	UriParts base, reference;
	if (!base.Parse(base_string) || !base.IsAbsolute())
		throw std::invalid_argument("Malformed base URI");

	if (!reference.Parse(reference_string))
		throw std::invalid_argument("Malformed URI reference");

	UriParts target;
	std::string path;

	if (reference.IsAbsolute()) {
		target = reference;
		path = uri_remove_dot_segments(reference.path);
	} else {
		target.scheme = base.scheme;

		if (reference.has_authority) {
			target.has_authority = true;
			target.has_userinfo = reference.has_userinfo;
			target.userinfo = reference.userinfo;
			target.host = reference.host;
			target.port = reference.port;
			path = uri_remove_dot_segments(reference.path);
			target.has_query = reference.has_query;
			target.query = reference.query;
		} else {
			target.has_authority = base.has_authority;
			target.has_userinfo = base.has_userinfo;
			target.userinfo = base.userinfo;
			target.host = base.host;
			target.port = base.port;

			if (reference.path.empty()) {
				path = base.path;

				if (reference.has_query) {
					target.has_query = true;
					target.query = reference.query;
				} else {
					target.has_query = base.has_query;
					target.query = base.query;
				}
			} else {
				if (reference.path.front() == '/')
					path = uri_remove_dot_segments(reference.path);
				else
					path = uri_remove_dot_segments(MergePaths(base, reference.path));

				target.has_query = reference.has_query;
				target.query = reference.query;
			}
		}
	}

	target.path = path;
	target.has_fragment = reference.has_fragment;
	target.fragment = reference.fragment;
	return target.ToString();
}
