// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Calculating the keys of cached responses.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

class StringMap;
struct HttpHost;
struct HttpRequest;
struct HttpCacheDocument;

/**
 * Calculate the cache key for a request.  A relative request target
 * is resolved against the host first.  The URI is normalized, so
 * that equivalent URIs produce the same key: scheme and host are
 * converted to lower case, the default port is made explicit, an
 * empty path becomes "/", dot segments are removed, percent-encoded
 * hex digits are converted to upper case, and user information and
 * fragment are dropped.
 *
 * If the URI is malformed, the raw request target is returned.
 */
std::string
http_cache_key(const HttpHost &host, const HttpRequest &request);

/**
 * Calculate the cache key for an absolute URL.
 *
 * If the URL is malformed, it is returned unmodified.
 */
std::string
http_cache_key(std::string_view url);

/**
 * Calculate the variant key from the values of the request headers
 * listed in "Vary", e.g. "{accept-language=en&user-agent=foo}".
 *
 * @param vary the sorted list of lower-case header names
 */
std::string
http_cache_variant_key(const StringMap &request_headers,
		       const std::vector<std::string> &vary);

/**
 * Calculate the variant key of a request for the "Vary" header of
 * the given document.
 */
std::string
http_cache_variant_key(const HttpRequest &request,
		       const HttpCacheDocument &document);

/**
 * Calculate the key of the variant of the given document which
 * matches the request.  Without "Vary", this is the plain cache
 * key; otherwise the variant key is prepended to it.
 */
std::string
http_cache_variant_uri(const HttpHost &host, const HttpRequest &request,
		       const HttpCacheDocument &document);
