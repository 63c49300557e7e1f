// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

enum class HttpStatus : uint_least16_t {
	UNDEFINED = 0,

	CONTINUE = 100,
	SWITCHING_PROTOCOLS = 101,

	OK = 200,
	CREATED = 201,
	ACCEPTED = 202,
	NON_AUTHORITATIVE_INFORMATION = 203,
	NO_CONTENT = 204,
	RESET_CONTENT = 205,
	PARTIAL_CONTENT = 206,

	MULTIPLE_CHOICES = 300,
	MOVED_PERMANENTLY = 301,
	FOUND = 302,
	SEE_OTHER = 303,
	NOT_MODIFIED = 304,
	TEMPORARY_REDIRECT = 307,
	PERMANENT_REDIRECT = 308,

	BAD_REQUEST = 400,
	UNAUTHORIZED = 401,
	FORBIDDEN = 403,
	NOT_FOUND = 404,
	METHOD_NOT_ALLOWED = 405,
	NOT_ACCEPTABLE = 406,
	CONFLICT = 409,
	GONE = 410,
	PRECONDITION_FAILED = 412,
	REQUEST_URI_TOO_LONG = 414,
	TOO_MANY_REQUESTS = 429,

	INTERNAL_SERVER_ERROR = 500,
	NOT_IMPLEMENTED = 501,
	BAD_GATEWAY = 502,
	SERVICE_UNAVAILABLE = 503,
	GATEWAY_TIMEOUT = 504,
};

constexpr bool
http_status_is_valid(HttpStatus status) noexcept
{
	return (unsigned)status >= 100 && (unsigned)status < 600;
}

constexpr bool
http_status_is_informational(HttpStatus status) noexcept
{
	return (unsigned)status >= 100 && (unsigned)status < 200;
}

constexpr bool
http_status_is_success(HttpStatus status) noexcept
{
	return (unsigned)status >= 200 && (unsigned)status < 300;
}

constexpr bool
http_status_is_redirect(HttpStatus status) noexcept
{
	return (unsigned)status >= 300 && (unsigned)status < 400;
}

constexpr bool
http_status_is_error(HttpStatus status) noexcept
{
	return (unsigned)status >= 400;
}

constexpr bool
http_status_is_server_error(HttpStatus status) noexcept
{
	return (unsigned)status >= 500 && (unsigned)status < 600;
}
