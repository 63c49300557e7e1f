// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Building requests which revalidate cached responses.
 */

#pragma once

struct HttpRequest;
struct HttpCacheDocument;

/**
 * Build a request which revalidates the given document (RFC 7234
 * 4.3.1).  All headers of the original request are preserved;
 * conditions specified by the caller are merged, never removed.
 */
HttpRequest
http_cache_build_conditional(const HttpRequest &request,
			     const HttpCacheDocument &document);

/**
 * Build a request which bypasses all caches: all conditional
 * headers are removed and "no-cache" is added.
 */
HttpRequest
http_cache_build_unconditional(const HttpRequest &request);
