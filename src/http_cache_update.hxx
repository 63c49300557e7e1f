// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Updating cache entries after revalidation.
 */

#pragma once

#include "http_cache_document.hxx"

/**
 * Merge a "304 Not Modified" response into a document (RFC 7234
 * 4.3.4) and return the new document.  The old document is returned
 * unchanged if the response is older than the stored one.
 */
HttpCacheDocumentPtr
http_cache_update_document(const HttpCacheDocumentPtr &old_document,
			   const HttpResponse &response);

/**
 * Build the document which replaces an old one after the server
 * sent a full response.
 */
HttpCacheDocumentPtr
http_cache_replace_document(const HttpRequest &request,
			    const HttpResponse &response,
			    std::string &&variant_key={});

/**
 * Does the "304 Not Modified" response carry a strong ETag which is
 * different from the document's one?
 */
[[gnu::pure]]
bool
http_cache_etag_mismatch(const HttpCacheDocument &document,
			 const HttpResponse &response) noexcept;
