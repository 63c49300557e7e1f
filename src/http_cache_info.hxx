// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/CacheControl.hxx"

/**
 * Information about a request which was gathered by
 * http_cache_request_evaluate().
 */
struct HttpCacheRequestInfo {
	/**
	 * The request's "Cache-Control" directives (with "Pragma:
	 * no-cache" folded into no_cache).
	 */
	HttpCacheControl cache_control;

	/** does the request URI have a query string?  This information is
	    important for RFC 2616 13.9 */
	bool has_query_string = false;

	/**
	 * Does the request carry an "Authorization" header?
	 */
	bool has_authorization = false;

	/**
	 * The conditional request headers sent by the caller.  These
	 * point into the request's header map.
	 */
	const char *if_match = nullptr, *if_none_match = nullptr;
	const char *if_modified_since = nullptr, *if_unmodified_since = nullptr;

	bool IsConditional() const noexcept {
		return if_match != nullptr || if_none_match != nullptr ||
			if_modified_since != nullptr ||
			if_unmodified_since != nullptr;
	}
};
