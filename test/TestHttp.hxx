// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Helpers for constructing HTTP messages in unit tests.
 */

#pragma once

#include "http_cache_document.hxx"
#include "http/HeaderParser.hxx"
#include "http/Request.hxx"
#include "http/Response.hxx"
#include "http/Date.hxx"

#include <chrono>
#include <memory>
#include <string>

/**
 * A fixed point in time with whole seconds.
 */
inline const auto test_epoch =
	std::chrono::system_clock::from_time_t(1700000000);

inline StringMap
ParseHeaders(const char *raw)
{
	StringMap headers;
	if (raw != nullptr)
		header_parse_buffer(headers, raw);
	return headers;
}

inline HttpRequest
MakeRequest(HttpMethod method, const char *uri, const char *headers=nullptr)
{
	return HttpRequest(method, uri, ParseHeaders(headers));
}

inline HttpResponse
MakeResponse(HttpStatus status, const char *headers, const char *body=nullptr,
	     std::chrono::system_clock::time_point request_time=test_epoch,
	     std::chrono::system_clock::time_point response_time=test_epoch)
{
	HttpResponse response(status, ParseHeaders(headers),
			      body != nullptr
			      ? std::make_shared<const std::string>(body)
			      : nullptr);
	response.request_time = request_time;
	response.response_time = response_time;
	return response;
}

/**
 * Build a document from a GET request for the given URI.
 */
inline HttpCacheDocumentPtr
MakeDocument(const char *response_headers, const char *body=nullptr,
	     std::chrono::system_clock::time_point request_time=test_epoch,
	     std::chrono::system_clock::time_point response_time=test_epoch,
	     HttpStatus status=HttpStatus::OK)
{
	const auto request = MakeRequest(HttpMethod::GET, "/");
	const auto response = MakeResponse(status, response_headers, body,
					   request_time, response_time);
	return http_cache_new_document(request, response);
}

inline std::string
DateHeader(std::chrono::system_clock::time_point t)
{
	return "date: " + http_date_format(t) + "\n";
}
