// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

/**
 * The target host of a request: the origin server a relative
 * request target is resolved against.
 */
struct HttpHost {
	/**
	 * "http" or "https"; an empty string means "http".
	 */
	std::string scheme;

	std::string hostname;

	/**
	 * The port number or -1 for the scheme's default port.
	 */
	int port = -1;

	HttpHost() = default;

	HttpHost(std::string_view _hostname, int _port=-1,
		 std::string_view _scheme="http")
		:scheme(_scheme), hostname(_hostname), port(_port) {}

	/**
	 * Format this object as an absolute URI prefix (without a
	 * trailing slash), e.g. "http://example.com:8080".
	 */
	std::string ToURI() const;
};
