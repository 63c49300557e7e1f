// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/Method.hxx"

#include <boost/filesystem/path.hpp>

#include <chrono>
#include <cstddef>
#include <string_view>
#include <vector>

/**
 * What to do with a "304 Not Modified" response whose ETag does not
 * match the one which was sent in "If-None-Match"?
 */
enum class HttpCacheEtagMismatchPolicy {
	/**
	 * Remove the cache entry and repeat the request without
	 * conditions.
	 */
	DISCARD,

	/**
	 * Merge the response into the cache entry anyway.
	 */
	TRUST,
};

struct HttpCacheConfig {
	/**
	 * Behave like a shared cache (RFC 7234 1)?  A shared cache
	 * honours "s-maxage" and "proxy-revalidate" and does not
	 * store "private" responses or responses to authorized
	 * requests.
	 */
	bool shared_cache = true;

	/**
	 * Calculate a heuristic freshness lifetime for responses
	 * without explicit expiration time (RFC 7234 4.2.2)?
	 */
	bool heuristic_caching = false;

	/**
	 * The fraction of the time since "Last-Modified" which is
	 * used as heuristic freshness lifetime.
	 */
	double heuristic_coefficient = 0.1;

	/**
	 * The heuristic freshness lifetime for responses without
	 * "Last-Modified".
	 */
	std::chrono::seconds heuristic_default_lifetime{};

	/**
	 * Responses with a larger body are not stored.
	 */
	std::size_t max_object_size = 256 * 1024;

	/**
	 * Limits for the in-memory storage.
	 */
	std::size_t max_entries = 4096;
	std::size_t max_size = 64 * 1024 * 1024;

	std::vector<HttpMethod> cacheable_methods{HttpMethod::GET, HttpMethod::HEAD};

	HttpCacheEtagMismatchPolicy etag_mismatch_policy = HttpCacheEtagMismatchPolicy::DISCARD;

	/**
	 * Honour the "stale-while-revalidate" and "stale-if-error"
	 * directives (RFC 5861)?
	 */
	bool stale_while_revalidate = true;
	bool stale_if_error = true;

	/**
	 * The number of threads which revalidate stale entries in
	 * the background.  0 disables background revalidation.
	 */
	unsigned worker_threads = 1;

	/**
	 * Requests with a longer cache key are not cached; they
	 * probably contain lots of unique parameters, and that's not
	 * worth the cache space anyway.
	 */
	std::size_t max_key_length = 8192;

	/**
	 * Honour the request's "no-cache" directive (and "Pragma:
	 * no-cache")?  If false, a client cannot force revalidation.
	 */
	bool obey_no_cache = true;

	[[gnu::pure]]
	bool IsCacheableMethod(HttpMethod method) const noexcept;

	/**
	 * Set one option by its name (as used in the configuration
	 * file).
	 *
	 * Throws std::runtime_error on error.
	 */
	void HandleSet(std::string_view name, const char *value);

	/**
	 * Verify the consistency of this configuration.
	 *
	 * Throws std::runtime_error on error.
	 */
	void Check() const;
};

/**
 * Load the configuration from a file, overriding the values which
 * are specified there.
 *
 * Throws on error.
 */
void
LoadConfigFile(HttpCacheConfig &config, const boost::filesystem::path &path);
