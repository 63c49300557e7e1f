// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Public definitions describing how the cache produced a response.
 */

#pragma once

#include <cstdint>

namespace Hcache {

enum class CacheResponseStatus : uint8_t {
	/**
	 * The response was not found in the cache and was fetched
	 * from the origin server.
	 */
	CACHE_MISS,

	/**
	 * The response was served from the cache without contacting
	 * the origin server.
	 */
	CACHE_HIT,

	/**
	 * The cached response was revalidated with the origin server
	 * and then served from the cache.
	 */
	VALIDATED,

	/**
	 * The response was generated by the cache itself, e.g. "504
	 * Gateway Timeout" for "only-if-cached" or "304 Not
	 * Modified" for a conditional request.
	 */
	CACHE_MODULE_RESPONSE,

	/**
	 * The request has failed.
	 */
	FAILURE,
};

constexpr const char *
ToString(CacheResponseStatus status) noexcept
{
	switch (status) {
	case CacheResponseStatus::CACHE_MISS:
		return "CACHE_MISS";

	case CacheResponseStatus::CACHE_HIT:
		return "CACHE_HIT";

	case CacheResponseStatus::VALIDATED:
		return "VALIDATED";

	case CacheResponseStatus::CACHE_MODULE_RESPONSE:
		return "CACHE_MODULE_RESPONSE";

	case CacheResponseStatus::FAILURE:
		return "FAILURE";
	}

	return "?";
}

} // namespace Hcache
