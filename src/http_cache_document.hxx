// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/CacheControl.hxx"
#include "http/Method.hxx"
#include "http/Status.hxx"
#include "strmap.hxx"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct HttpRequest;
struct HttpResponse;

/**
 * One cached response.  Instances are immutable; they are shared
 * with std::shared_ptr<const HttpCacheDocument>, and each update
 * constructs a new instance.
 */
struct HttpCacheDocument {
	using time_point = std::chrono::system_clock::time_point;

	/**
	 * Maps a variant key to the storage key of the variant.
	 */
	using VariantMap = std::map<std::string, std::string, std::less<>>;

	/**
	 * The method of the request which produced this document.
	 */
	HttpMethod method;

	time_point request_time, response_time;

	HttpStatus status;

	StringMap response_headers;

	/**
	 * The response body, or nullptr if there is none.
	 */
	std::shared_ptr<const std::string> body;

	/**
	 * The parsed "Cache-Control" response header.
	 */
	HttpCacheControl cache_control;

	/**
	 * The header names listed in the "Vary" response header:
	 * lower case, sorted, without duplicates.
	 */
	std::vector<std::string> vary;

	/**
	 * The variant key of the request which produced this
	 * document; empty if there is no "Vary" header.
	 */
	std::string variant_key;

	/**
	 * For the root document of a resource with variants: all
	 * known variants.
	 */
	VariantMap variants;

	/**
	 * Throws std::invalid_argument if the response timestamp is
	 * older than the request timestamp, or if the body length
	 * contradicts the "Content-Length" header.
	 */
	HttpCacheDocument(HttpMethod _method,
			  time_point _request_time, time_point _response_time,
			  HttpStatus _status, StringMap &&_response_headers,
			  std::shared_ptr<const std::string> _body,
			  std::string &&_variant_key={},
			  VariantMap &&_variants={});

	/**
	 * Copy a document, replacing its variant map.
	 */
	HttpCacheDocument(const HttpCacheDocument &src, VariantMap &&_variants);

	HttpCacheDocument(const HttpCacheDocument &) = delete;
	HttpCacheDocument &operator=(const HttpCacheDocument &) = delete;

	bool HasVary() const noexcept {
		return !vary.empty();
	}

	bool HasVariants() const noexcept {
		return !variants.empty();
	}

	bool HasBody() const noexcept {
		return body != nullptr;
	}

	const char *GetETag() const noexcept {
		return response_headers.Get("etag");
	}

	const char *GetLastModified() const noexcept {
		return response_headers.Get("last-modified");
	}

	/**
	 * Parse the "Date" response header.
	 */
	[[gnu::pure]]
	std::optional<time_point> GetDate() const noexcept;

	/**
	 * Estimate the memory occupied by this document.
	 */
	[[gnu::pure]]
	std::size_t GetSize() const noexcept;
};

using HttpCacheDocumentPtr = std::shared_ptr<const HttpCacheDocument>;

/**
 * Parse all "Vary" headers into a sorted list of lower-case header
 * names without duplicates.
 */
std::vector<std::string>
http_cache_parse_vary(const StringMap &headers);

/**
 * Create a new document from a (cacheable) response.  A "Date"
 * header is synthesized from the response timestamp if the server
 * did not send one (RFC 7231 7.1.1.2).
 *
 * Throws std::invalid_argument if the response is inconsistent.
 */
HttpCacheDocumentPtr
http_cache_new_document(const HttpRequest &request,
			const HttpResponse &response,
			std::string &&variant_key={});
