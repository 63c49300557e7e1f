// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string_view>

enum class HttpMethod : uint_least8_t {
	INVALID,
	HEAD,
	GET,
	POST,
	PUT,
	DELETE,
	OPTIONS,
	TRACE,
	PATCH,
	CONNECT,
};

/**
 * @return the method name, or nullptr if the value is not valid
 */
[[gnu::const]]
const char *
http_method_to_string(HttpMethod method) noexcept;

/**
 * Parse a (case sensitive) method name.
 *
 * @return HttpMethod::INVALID if the name is not known
 */
[[gnu::pure]]
HttpMethod
http_method_parse(std::string_view name) noexcept;

/**
 * Is this a "safe" method according to RFC 7231 4.2.1?  Safe
 * methods do not change state on the origin server and thus do not
 * invalidate cached responses.
 */
constexpr bool
http_method_is_safe(HttpMethod method) noexcept
{
	return method == HttpMethod::GET || method == HttpMethod::HEAD ||
		method == HttpMethod::OPTIONS || method == HttpMethod::TRACE;
}
