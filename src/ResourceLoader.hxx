// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct HttpHost;
struct HttpRequest;
struct HttpResponse;

/**
 * Sends requests to the origin server.  This is the transport which
 * #HttpCache forwards requests to.
 */
class ResourceLoader {
public:
	virtual ~ResourceLoader() noexcept = default;

	/**
	 * Send a request and wait for the complete response.  The
	 * caller fills in the response's timestamps.  This method may
	 * be called from several threads at the same time.
	 *
	 * Throws on error (e.g. connection failure).
	 */
	virtual HttpResponse SendRequest(const HttpHost &host,
					 const HttpRequest &request) = 0;
};
