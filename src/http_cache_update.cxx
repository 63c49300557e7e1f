// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http_cache_update.hxx"
#include "http/Date.hxx"
#include "http/Request.hxx"
#include "http/Response.hxx"
#include "strutil.hxx"

#include <algorithm>
#include <array>
#include <set>

using std::string_view_literals::operator""sv;

/**
 * These headers describe the stored body (or the connection) and
 * must not be replaced by the ones from a "304 Not Modified"
 * response.
 */
static constexpr std::array excluded_headers{
	"content-length"sv,
	"content-encoding"sv,
	"transfer-encoding"sv,
	"content-range"sv,
	"content-md5"sv,
	"connection"sv,
	"keep-alive"sv,
	"trailer"sv,
	"upgrade"sv,
	"te"sv,
};

[[gnu::pure]]
static bool
IsExcludedHeader(std::string_view name) noexcept
{
	return std::find(excluded_headers.begin(), excluded_headers.end(),
			 name) != excluded_headers.end();
}

/**
 * Is this a "Warning" value with a 1xx warn-code?  These must be
 * deleted after successful revalidation (RFC 7234 4.3.4).
 */
[[gnu::pure]]
static bool
IsWarning1xx(std::string_view value) noexcept
{
	value = StripLeft(value);
	return value.size() >= 3 && value[0] == '1' &&
		IsDigitASCII(value[1]) && IsDigitASCII(value[2]);
}

/**
 * Is the response older than the stored document, according to
 * their "Date" headers?
 */
[[gnu::pure]]
static bool
IsOutOfOrder(const HttpCacheDocument &document,
	     const HttpResponse &response) noexcept
{
	const char *p = response.headers.Get("date");
	if (p == nullptr)
		return false;

	const auto response_date = http_date_parse(p);
	const auto document_date = document.GetDate();
	return response_date && document_date &&
		*response_date < *document_date;
}

static StringMap
MergeHeaders(const StringMap &old_headers, const StringMap &new_headers)
{
	StringMap headers;

	for (const auto &i : old_headers) {
		if (i.key == "age")
			/* the old "Age" must not survive; it
			   describes the previous response */
			continue;

		if (i.key == "warning" && IsWarning1xx(i.value))
			continue;

		headers.Add(i.key, i.value);
	}

	/* "Vary" is kept, too: the variant layout of a resource is
	   only changed by a full response */
	std::set<std::string_view> names;
	for (const auto &i : new_headers)
		if (!IsExcludedHeader(i.key) && i.key != "vary")
			names.emplace(i.key);

	for (const auto name : names)
		headers.CopyFrom(new_headers, name);

	return headers;
}

HttpCacheDocumentPtr
http_cache_update_document(const HttpCacheDocumentPtr &old_document,
			   const HttpResponse &response)
{
	const auto &old = *old_document;

	if (IsOutOfOrder(old, response))
		/* RFC 7234 4.3.4: this response is older than the one
		   we have; don't merge it */
		return old_document;

	auto headers = MergeHeaders(old.response_headers, response.headers);
	if (!response.headers.Contains("date"))
		/* the old "Date" would make the merged document as
		   old as the previous response */
		headers.Set("date", http_date_format(response.response_time));

	std::string variant_key = old.variant_key;
	HttpCacheDocument::VariantMap variants = old.variants;

	return std::make_shared<const HttpCacheDocument>(old.method,
							 response.request_time,
							 response.response_time,
							 old.status,
							 std::move(headers),
							 old.body,
							 std::move(variant_key),
							 std::move(variants));
}

HttpCacheDocumentPtr
http_cache_replace_document(const HttpRequest &request,
			    const HttpResponse &response,
			    std::string &&variant_key)
{
	return http_cache_new_document(request, response,
				       std::move(variant_key));
}

bool
http_cache_etag_mismatch(const HttpCacheDocument &document,
			 const HttpResponse &response) noexcept
{
	const char *etag = response.headers.Get("etag");
	if (etag == nullptr)
		return false;

	const std::string_view new_etag = Strip(etag);
	if (new_etag.starts_with("W/"))
		/* weak validators are not compared */
		return false;

	const char *old_etag = document.GetETag();
	return old_etag == nullptr || Strip(old_etag) != new_etag;
}
