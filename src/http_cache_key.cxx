// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http_cache_key.hxx"
#include "http_cache_document.hxx"
#include "http/Host.hxx"
#include "http/Request.hxx"
#include "uri/Escape.hxx"
#include "uri/Parser.hxx"
#include "strmap.hxx"
#include "strutil.hxx"

#include <optional>
#include <stdexcept>

[[gnu::pure]]
static int
GetDefaultPort(std::string_view scheme) noexcept
{
	if (scheme == "http")
		return 80;
	else if (scheme == "https")
		return 443;
	else
		return -1;
}

/**
 * @return the normalized URI or std::nullopt if the URI is malformed
 * or cannot be normalized
 */
static std::optional<std::string>
NormalizeUri(std::string_view src)
{
	UriParts uri;
	if (!uri.Parse(src) || !uri.has_authority || uri.host.empty())
		return std::nullopt;

	/* a network-path reference ("//host/path") defaults to
	   "http" */
	const std::string scheme = uri.IsAbsolute()
		? ToLower(uri.scheme)
		: std::string{"http"};

	const auto host = uri_normalize_escapes(ToLower(uri.host));
	auto path = uri_normalize_escapes(uri.path);
	if (!host || !path)
		return std::nullopt;

	std::string result = scheme;
	result.append("://");
	result.append(*host);

	int port = uri.GetPort();
	if (port < 0)
		port = GetDefaultPort(scheme);

	if (port >= 0) {
		result.push_back(':');
		result.append(std::to_string(port));
	}

	if (path->empty())
		result.push_back('/');
	else
		result.append(uri_remove_dot_segments(*path));

	if (uri.has_query) {
		const auto query = uri_normalize_escapes(uri.query);
		if (!query)
			return std::nullopt;

		result.push_back('?');
		result.append(*query);
	}

	return result;
}

std::string
http_cache_key(const HttpHost &host, const HttpRequest &request)
{
	std::optional<std::string> key;

	UriParts uri;
	if (uri.Parse(request.uri) && (uri.IsAbsolute() || uri.has_authority)) {
		key = NormalizeUri(request.uri);
	} else {
		/* rewrite the relative request target against the
		   host */
		try {
			key = NormalizeUri(uri_resolve(host.ToURI() + "/",
						       request.uri));
		} catch (const std::invalid_argument &) {
			/* malformed host or request target; fall
			   back to the raw request target below */
		}
	}

	if (!key)
		return request.uri;

	return std::move(*key);
}

std::string
http_cache_key(std::string_view url)
{
	auto key = NormalizeUri(url);
	if (!key)
		return std::string{url};

	return std::move(*key);
}

/**
 * Join all values of the specified request header, each stripped of
 * leading and trailing whitespace.  A missing header results in an
 * empty string.
 */
static std::string
GetFullHeaderValue(const StringMap &headers, std::string_view name)
{
	std::string result;
	bool first = true;

	headers.ForEach(name, [&result, &first](std::string_view value){
		if (!first)
			result.append(", ");
		first = false;
		result.append(Strip(value));
	});

	return result;
}

std::string
http_cache_variant_key(const StringMap &request_headers,
		       const std::vector<std::string> &vary)
{
	std::string result = "{";
	bool first = true;

	for (const auto &name : vary) {
		if (!first)
			result.push_back('&');
		first = false;

		result.append(uri_form_escape(name));
		result.push_back('=');
		result.append(uri_form_escape(GetFullHeaderValue(request_headers,
								 name)));
	}

	result.push_back('}');
	return result;
}

std::string
http_cache_variant_key(const HttpRequest &request,
		       const HttpCacheDocument &document)
{
	return http_cache_variant_key(request.headers, document.vary);
}

std::string
http_cache_variant_uri(const HttpHost &host, const HttpRequest &request,
		       const HttpCacheDocument &document)
{
	if (!document.HasVary())
		return http_cache_key(host, request);

	return http_cache_variant_key(request, document) +
		http_cache_key(host, request);
}
