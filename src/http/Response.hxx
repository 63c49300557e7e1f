// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Status.hxx"
#include "strmap.hxx"

#include <chrono>
#include <memory>
#include <string>

/**
 * A HTTP response, either received from the origin server or
 * synthesized from a cache entry.
 */
struct HttpResponse {
	HttpStatus status = HttpStatus::UNDEFINED;

	StringMap headers;

	/**
	 * The response body or nullptr if there is none.  The body is
	 * shared with the cache entry it may be stored in.
	 */
	std::shared_ptr<const std::string> body;

	/**
	 * When was the request sent?
	 */
	std::chrono::system_clock::time_point request_time;

	/**
	 * When was the response received?
	 */
	std::chrono::system_clock::time_point response_time;

	HttpResponse() = default;

	HttpResponse(HttpStatus _status, StringMap &&_headers={},
		     std::shared_ptr<const std::string> _body=nullptr)
		:status(_status), headers(std::move(_headers)),
		 body(std::move(_body)) {}

	bool HasBody() const noexcept {
		return body != nullptr;
	}

	std::size_t GetBodySize() const noexcept {
		return body != nullptr ? body->size() : 0;
	}
};
