// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <optional>
#include <string_view>

class StringMap;

/**
 * The parsed "Cache-Control" directives of a request or a response
 * (RFC 7234 5.2, RFC 5861).  Unknown directives are ignored;
 * directives with an invalid argument are treated as absent.
 */
struct HttpCacheControl {
	using Duration = std::chrono::seconds;

	bool no_store = false;

	/**
	 * "no-cache", either in "Cache-Control" or (for requests) as
	 * "Pragma: no-cache".  A qualified response "no-cache" (with
	 * a list of header names) is treated like the unqualified
	 * form.
	 */
	bool no_cache = false;

	bool must_revalidate = false, proxy_revalidate = false;

	bool is_public = false, is_private = false;

	bool only_if_cached = false;

	/**
	 * "max-stale" without an argument: the client accepts a stale
	 * response of any age.
	 */
	bool max_stale_any = false;

	std::optional<Duration> max_age, s_maxage;
	std::optional<Duration> stale_while_revalidate, stale_if_error;
	std::optional<Duration> max_stale, min_fresh;

	/**
	 * Parse the "Cache-Control" (and "Pragma") header(s) from the
	 * given header map.  Multiple header lines are combined.
	 */
	static HttpCacheControl Parse(const StringMap &headers);

	/**
	 * Parse a single "Cache-Control" header value.
	 */
	void ParseValue(std::string_view value);

	bool HasExplicitFreshness() const noexcept {
		return max_age || s_maxage;
	}
};

/**
 * Parse a delta-seconds value (RFC 7234 1.2.1).  Values which
 * overflow are clamped to 2^31 seconds.
 */
[[gnu::pure]]
std::optional<std::chrono::seconds>
http_parse_delta_seconds(std::string_view s) noexcept;
