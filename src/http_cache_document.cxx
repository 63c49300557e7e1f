// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http_cache_document.hxx"
#include "http/Date.hxx"
#include "http/List.hxx"
#include "http/Request.hxx"
#include "http/Response.hxx"
#include "strutil.hxx"

#include <algorithm>
#include <stdexcept>

std::vector<std::string>
http_cache_parse_vary(const StringMap &headers)
{
	std::vector<std::string> vary;

	headers.ForEach("vary", [&vary](std::string_view value){
		for (auto &name : http_list_split(value))
			vary.emplace_back(std::move(name));
	});

	std::sort(vary.begin(), vary.end());
	vary.erase(std::unique(vary.begin(), vary.end()), vary.end());
	return vary;
}

HttpCacheDocument::HttpCacheDocument(HttpMethod _method,
				     time_point _request_time,
				     time_point _response_time,
				     HttpStatus _status,
				     StringMap &&_response_headers,
				     std::shared_ptr<const std::string> _body,
				     std::string &&_variant_key,
				     VariantMap &&_variants)
	:method(_method),
	 request_time(_request_time), response_time(_response_time),
	 status(_status),
	 response_headers(std::move(_response_headers)),
	 body(std::move(_body)),
	 cache_control(HttpCacheControl::Parse(response_headers)),
	 vary(http_cache_parse_vary(response_headers)),
	 variant_key(std::move(_variant_key)),
	 variants(std::move(_variants))
{
	if (!http_status_is_valid(status))
		throw std::invalid_argument("Invalid response status");

	if (response_time < request_time)
		throw std::invalid_argument("Response is older than its request");

	if (body != nullptr) {
		const char *content_length = response_headers.Get("content-length");
		if (content_length != nullptr) {
			const auto length = ParseDecimal(Strip(content_length));
			if (length && *length != body->size())
				throw std::invalid_argument("Body length does not match Content-Length");
		}
	}
}

HttpCacheDocument::HttpCacheDocument(const HttpCacheDocument &src,
				     VariantMap &&_variants)
	:method(src.method),
	 request_time(src.request_time), response_time(src.response_time),
	 status(src.status),
	 response_headers(src.response_headers),
	 body(src.body),
	 cache_control(src.cache_control),
	 vary(src.vary),
	 variant_key(src.variant_key),
	 variants(std::move(_variants))
{
}

std::optional<HttpCacheDocument::time_point>
HttpCacheDocument::GetDate() const noexcept
{
	const char *date = response_headers.Get("date");
	if (date == nullptr)
		return std::nullopt;

	return http_date_parse(date);
}

std::size_t
HttpCacheDocument::GetSize() const noexcept
{
	std::size_t size = sizeof(*this) + variant_key.size();

	for (const auto &i : response_headers)
		size += i.key.size() + i.value.size();

	for (const auto &i : vary)
		size += i.size();

	for (const auto &[key, value] : variants)
		size += key.size() + value.size();

	if (body != nullptr)
		size += body->size();

	return size;
}

HttpCacheDocumentPtr
http_cache_new_document(const HttpRequest &request,
			const HttpResponse &response,
			std::string &&variant_key)
{
	StringMap headers(response.headers);
	if (!headers.Contains("date"))
		headers.Add("date", http_date_format(response.response_time));

	return std::make_shared<const HttpCacheDocument>(request.method,
							 response.request_time,
							 response.response_time,
							 response.status,
							 std::move(headers),
							 response.body,
							 std::move(variant_key));
}
