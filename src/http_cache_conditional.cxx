// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http_cache_conditional.hxx"
#include "http_cache_document.hxx"
#include "http/List.hxx"
#include "http/Request.hxx"

#include <fmt/format.h>

HttpRequest
http_cache_build_conditional(const HttpRequest &request,
			     const HttpCacheDocument &document)
{
	HttpRequest result(request);
	auto &headers = result.headers;

	if (const char *etag = document.GetETag()) {
		const auto if_none_match = headers.GetJoined("if-none-match");
		if (if_none_match.empty())
			headers.Set("if-none-match", etag);
		else if (if_none_match != "*" &&
			 !http_list_contains(if_none_match, etag))
			headers.Set("if-none-match",
				    fmt::format("{}, {}", if_none_match, etag));
	}

	if (!headers.Contains("if-modified-since")) {
		const char *last_modified = document.GetLastModified();
		if (last_modified == nullptr)
			last_modified = document.response_headers.Get("date");

		if (last_modified != nullptr)
			headers.Set("if-modified-since", last_modified);
	}

	if (document.cache_control.must_revalidate) {
		/* make sure intermediate caches revalidate, too */
		const auto cache_control = headers.GetJoined("cache-control");
		if (cache_control.empty())
			headers.Set("cache-control", "max-age=0");
		else if (!http_list_contains_i(cache_control, "max-age=0"))
			headers.Set("cache-control",
				    fmt::format("{}, max-age=0", cache_control));
	}

	return result;
}

HttpRequest
http_cache_build_unconditional(const HttpRequest &request)
{
	HttpRequest result(request);
	auto &headers = result.headers;

	headers.Remove("if-match");
	headers.Remove("if-none-match");
	headers.Remove("if-modified-since");
	headers.Remove("if-unmodified-since");
	headers.Remove("if-range");

	headers.Set("cache-control", "no-cache");
	headers.Set("pragma", "no-cache");

	return result;
}
