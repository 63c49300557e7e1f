// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Freshness and age calculations (RFC 7234 4.2, RFC 5861).
 */

#pragma once

#include <chrono>

struct HttpCacheConfig;
struct HttpCacheControl;
struct HttpCacheDocument;

/**
 * Calculate how long the document may be served without
 * revalidation: "s-maxage" (in a shared cache), "max-age",
 * "Expires" minus "Date", or a heuristic value.
 */
[[gnu::pure]]
std::chrono::seconds
http_cache_freshness_lifetime(const HttpCacheConfig &config,
			      const HttpCacheDocument &document) noexcept;

/**
 * Calculate the current age of the document (RFC 7234 4.2.3).
 */
[[gnu::pure]]
std::chrono::seconds
http_cache_current_age(const HttpCacheDocument &document,
		       std::chrono::system_clock::time_point now) noexcept;

[[gnu::pure]]
bool
http_cache_is_fresh(const HttpCacheConfig &config,
		    const HttpCacheDocument &document,
		    std::chrono::system_clock::time_point now) noexcept;

/**
 * How long has the document been stale?  Returns zero if it is
 * still fresh.
 */
[[gnu::pure]]
std::chrono::seconds
http_cache_staleness(const HttpCacheConfig &config,
		     const HttpCacheDocument &document,
		     std::chrono::system_clock::time_point now) noexcept;

/**
 * Does the document forbid serving it stale ("must-revalidate",
 * "proxy-revalidate" in a shared cache, "no-cache")?
 */
[[gnu::pure]]
bool
http_cache_stale_forbidden(const HttpCacheConfig &config,
			   const HttpCacheDocument &document) noexcept;

/**
 * May the stale document be served while it is being revalidated in
 * the background (RFC 5861 3)?
 */
[[gnu::pure]]
bool
http_cache_may_stale_while_revalidate(const HttpCacheConfig &config,
				      const HttpCacheDocument &document,
				      std::chrono::system_clock::time_point now) noexcept;

/**
 * May the stale document be served because revalidation has failed
 * (RFC 5861 4)?  Both the response's and the request's
 * "stale-if-error" directive are considered.
 *
 * @param request_cache_control the request's directives or nullptr
 */
[[gnu::pure]]
bool
http_cache_may_stale_if_error(const HttpCacheConfig &config,
			      const HttpCacheDocument &document,
			      std::chrono::system_clock::time_point now,
			      const HttpCacheControl *request_cache_control=nullptr) noexcept;
