// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Method.hxx"
#include "strmap.hxx"

#include <memory>
#include <string>

/**
 * An outgoing HTTP request.
 */
struct HttpRequest {
	HttpMethod method = HttpMethod::GET;

	/**
	 * The request target: either an absolute URI or the
	 * origin-form ("/path?query").
	 */
	std::string uri;

	StringMap headers;

	/**
	 * The request body or nullptr if there is none.
	 */
	std::shared_ptr<const std::string> body;

	HttpRequest() = default;

	HttpRequest(HttpMethod _method, std::string_view _uri,
		    StringMap &&_headers={})
		:method(_method), uri(_uri), headers(std::move(_headers)) {}

	bool HasBody() const noexcept {
		return body != nullptr;
	}
};
