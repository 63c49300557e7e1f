// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http_cache_invalidate.hxx"
#include "http_cache_key.hxx"
#include "http_cache_rfc.hxx"
#include "http_cache_storage.hxx"
#include "http/Date.hxx"
#include "http/Host.hxx"
#include "http/Request.hxx"
#include "http/Response.hxx"
#include "uri/Parser.hxx"

#include <stdexcept>
#include <string_view>

/**
 * Do both (normalized) keys refer to the same scheme, host and port?
 */
[[gnu::pure]]
static bool
IsSameAuthority(std::string_view a, std::string_view b) noexcept
{
	UriParts x, y;
	return x.Parse(a) && y.Parse(b) &&
		x.IsAbsolute() && y.IsAbsolute() &&
		x.scheme == y.scheme && x.host == y.host &&
		x.GetPort() == y.GetPort();
}

/**
 * Is the stored entry at least as current as the response?
 */
[[gnu::pure]]
static bool
IsCurrent(const HttpCacheDocument &document,
	  const HttpResponse &response) noexcept
{
	const char *stored_etag = document.GetETag();
	const char *response_etag = response.headers.Get("etag");
	if (stored_etag != nullptr && response_etag != nullptr &&
	    std::string_view{stored_etag} == response_etag)
		return true;

	const auto stored_date = document.GetDate();
	const char *response_date = response.headers.Get("date");
	if (stored_date && response_date != nullptr) {
		const auto date = http_date_parse(response_date);
		if (date && *stored_date > *date)
			return true;
	}

	return false;
}

void
HttpCacheInvalidator::Remove(const std::string &key)
{
	const auto document = storage.Get(key);
	if (document != nullptr)
		for (const auto &[variant_key, id] : document->variants)
			storage.Remove(id);

	storage.Remove(key);

	logger.Fmt(4, "invalidate {}", key);
}

void
HttpCacheInvalidator::OnRequest(const HttpHost &host,
				const HttpRequest &request) noexcept
{
	if (!http_cache_request_invalidate(request.method))
		return;

	try {
		Remove(http_cache_key(host, request));
	} catch (...) {
		logger(2, "Failed to invalidate", std::current_exception());
	}
}

void
HttpCacheInvalidator::InvalidateLocation(const std::string &request_key,
					 const HttpResponse &response,
					 const char *location,
					 bool check_content_location)
{
	std::string target;
	try {
		target = uri_resolve(request_key, location);
	} catch (const std::invalid_argument &) {
		/* malformed header value: ignore it */
		return;
	}

	const auto key = http_cache_key(target);
	if (key == request_key || !IsSameAuthority(key, request_key))
		return;

	if (check_content_location) {
		const auto document = storage.Get(key);
		if (document == nullptr || IsCurrent(*document, response))
			return;
	}

	Remove(key);
}

void
HttpCacheInvalidator::OnResponse(const HttpHost &host,
				 const HttpRequest &request,
				 const HttpResponse &response) noexcept
{
	if (!http_status_is_success(response.status) &&
	    !http_status_is_redirect(response.status))
		return;

	const char *location = response.headers.Get("location");
	const char *content_location = response.headers.Get("content-location");
	if (location == nullptr && content_location == nullptr)
		return;

	try {
		const auto request_key = http_cache_key(host, request);

		if (location != nullptr)
			InvalidateLocation(request_key, response, location, false);

		if (content_location != nullptr)
			InvalidateLocation(request_key, response,
					   content_location, true);
	} catch (...) {
		logger(2, "Failed to invalidate", std::current_exception());
	}
}
