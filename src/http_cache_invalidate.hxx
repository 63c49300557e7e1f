// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Invalidating cache entries after unsafe requests (RFC 7234 4.4).
 */

#pragma once

#include "Logger.hxx"

#include <string>

class HttpCacheStorage;
struct HttpHost;
struct HttpRequest;
struct HttpResponse;

class HttpCacheInvalidator {
	const Logger logger{"HttpCache"};

	HttpCacheStorage &storage;

public:
	explicit HttpCacheInvalidator(HttpCacheStorage &_storage) noexcept
		:storage(_storage) {}

	/**
	 * To be called before the request is sent.  An unsafe request
	 * removes the entry of its target URI (including all
	 * variants).
	 */
	void OnRequest(const HttpHost &host,
		       const HttpRequest &request) noexcept;

	/**
	 * To be called after the response has been received.  A
	 * successful response with "Location" or "Content-Location"
	 * pointing to another URI on the same authority removes the
	 * entry of that URI.
	 */
	void OnResponse(const HttpHost &host, const HttpRequest &request,
			const HttpResponse &response) noexcept;

	/**
	 * Remove the entry with the specified key and all of its
	 * variants.
	 *
	 * Throws on storage error.
	 */
	void Remove(const std::string &key);

private:
	void InvalidateLocation(const std::string &request_key,
				const HttpResponse &response,
				const char *location,
				bool check_content_location);
};
