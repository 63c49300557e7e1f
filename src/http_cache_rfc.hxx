// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Caching HTTP responses.  Implementation for the rules described in
 * RFC 7234.
 */

#pragma once

#include "http/Method.hxx"
#include "http/Status.hxx"

struct HttpCacheConfig;
struct HttpCacheRequestInfo;
struct HttpRequest;
struct HttpResponse;

/**
 * Check whether the request could produce a cacheable response
 * (i.e. whether the cache shall be consulted at all), and gather
 * information about it.
 */
bool
http_cache_request_evaluate(HttpCacheRequestInfo &info,
			    const HttpCacheConfig &config,
			    const HttpRequest &request);

/**
 * Check whether the HTTP response should be put into the cache.
 */
bool
http_cache_response_evaluate(const HttpCacheConfig &config,
			     const HttpCacheRequestInfo &request_info,
			     const HttpRequest &request,
			     const HttpResponse &response);

/**
 * Convenience wrapper for http_cache_request_evaluate() and
 * http_cache_response_evaluate().
 */
bool
http_cache_is_cacheable(const HttpCacheConfig &config,
			const HttpRequest &request,
			const HttpResponse &response);

/**
 * Check whether the request should invalidate the existing cache
 * (RFC 7234 4.4).
 */
constexpr bool
http_cache_request_invalidate(HttpMethod method) noexcept
{
	return !http_method_is_safe(method) && method != HttpMethod::INVALID;
}

/**
 * Is this status cacheable by default, i.e. without explicit
 * freshness information (RFC 7231 6.1)?
 */
constexpr bool
http_status_cacheable(HttpStatus status) noexcept
{
	return status == HttpStatus::OK ||
		status == HttpStatus::NON_AUTHORITATIVE_INFORMATION ||
		status == HttpStatus::MULTIPLE_CHOICES ||
		status == HttpStatus::MOVED_PERMANENTLY ||
		status == HttpStatus::NOT_FOUND ||
		status == HttpStatus::METHOD_NOT_ALLOWED ||
		status == HttpStatus::GONE ||
		status == HttpStatus::REQUEST_URI_TOO_LONG ||
		status == HttpStatus::NOT_IMPLEMENTED;
}
