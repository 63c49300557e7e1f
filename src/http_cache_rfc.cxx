// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http_cache_rfc.hxx"
#include "http_cache_config.hxx"
#include "http_cache_info.hxx"
#include "http/CacheControl.hxx"
#include "http/Date.hxx"
#include "http/List.hxx"
#include "http/Request.hxx"
#include "http/Response.hxx"
#include "strmap.hxx"
#include "strutil.hxx"

/* check whether the request could produce a cacheable response */
bool
http_cache_request_evaluate(HttpCacheRequestInfo &info,
			    const HttpCacheConfig &config,
			    const HttpRequest &request)
{
	if (!config.IsCacheableMethod(request.method) || request.HasBody())
		/* RFC 2616 13.11 "Write-Through Mandatory" */
		return false;

	const auto &headers = request.headers;

	if (headers.Contains("range"))
		/* partial responses are not stored */
		return false;

	info.cache_control = HttpCacheControl::Parse(headers);
	if (info.cache_control.no_store)
		/* RFC 7234 5.2.1.5 */
		return false;

	if (!config.obey_no_cache)
		info.cache_control.no_cache = false;

	info.has_authorization = headers.Contains("authorization");

	const std::string_view uri = request.uri;
	info.has_query_string = uri.substr(0, uri.find('#')).find('?') != uri.npos;

	info.if_match = headers.Get("if-match");
	info.if_none_match = headers.Get("if-none-match");
	info.if_modified_since = headers.Get("if-modified-since");
	info.if_unmodified_since = headers.Get("if-unmodified-since");

	return true;
}

[[gnu::pure]]
static bool
HasVaryStar(const StringMap &headers) noexcept
{
	bool found = false;
	headers.ForEach("vary", [&found](std::string_view value){
		if (http_list_contains(value, "*"))
			found = true;
	});

	return found;
}

/**
 * Does the body disagree with the "Content-Length" header (e.g. a
 * truncated response)?
 */
[[gnu::pure]]
static bool
IsBodyIncomplete(const HttpResponse &response) noexcept
{
	if (!response.HasBody())
		return false;

	const char *p = response.headers.Get("content-length");
	if (p == nullptr)
		return false;

	const auto length = ParseDecimal(Strip(p));
	return length && *length != response.body->size();
}

[[gnu::pure]]
static bool
HasExpires(const StringMap &headers) noexcept
{
	const char *p = headers.Get("expires");
	return p != nullptr && http_date_parse(p).has_value();
}

bool
http_cache_response_evaluate(const HttpCacheConfig &config,
			     const HttpCacheRequestInfo &request_info,
			     const HttpRequest &request,
			     const HttpResponse &response)
{
	if (!config.IsCacheableMethod(request.method))
		return false;

	const auto status = response.status;
	if (!http_status_is_valid(status) ||
	    http_status_is_informational(status) ||
	    status == HttpStatus::PARTIAL_CONTENT ||
	    status == HttpStatus::NOT_MODIFIED)
		return false;

	const auto &headers = response.headers;
	const auto cc = HttpCacheControl::Parse(headers);

	if (cc.no_store || request_info.cache_control.no_store)
		return false;

	if (config.shared_cache && cc.is_private)
		/* RFC 7234 3: "the "private" response directive does
		   not appear in the response, if the cache is
		   shared" */
		return false;

	if (config.shared_cache && request_info.has_authorization &&
	    !cc.is_public && !cc.s_maxage && !cc.must_revalidate)
		/* RFC 7234 3.2 */
		return false;

	if (HasVaryStar(headers))
		/* RFC 7231 7.1.4: a Vary header field-value of "*"
		   always fails to match */
		return false;

	if (response.GetBodySize() > config.max_object_size)
		/* too large for the cache */
		return false;

	if (IsBodyIncomplete(response))
		return false;

	const bool explicit_freshness = cc.max_age ||
		(config.shared_cache && cc.s_maxage) ||
		HasExpires(headers);

	if (!explicit_freshness && !http_status_cacheable(status))
		return false;

	if (request_info.has_query_string && !explicit_freshness)
		/* RFC 2616 13.9: "since some applications have
		   traditionally used GETs and HEADs with query URLs
		   (those containing a "?" in the rel_path part) to
		   perform operations with significant side effects,
		   caches MUST NOT treat responses to such URIs as fresh
		   unless the server provides an explicit expiration
		   time" */
		return false;

	const bool has_validator = headers.Contains("etag") ||
		headers.Contains("last-modified");

	if (cc.no_cache && !has_validator)
		/* must be revalidated each time, which is impossible
		   without a validator */
		return false;

	if (explicit_freshness || has_validator)
		return true;

	/* no freshness information and no validator: only a
	   heuristic default lifetime makes this worth caching */
	return config.heuristic_caching &&
		config.heuristic_default_lifetime.count() > 0;
}

bool
http_cache_is_cacheable(const HttpCacheConfig &config,
			const HttpRequest &request,
			const HttpResponse &response)
{
	HttpCacheRequestInfo info;
	return http_cache_request_evaluate(info, config, request) &&
		http_cache_response_evaluate(config, info, request, response);
}
