// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TestHttp.hxx"
#include "http_cache_rfc.hxx"
#include "http_cache_config.hxx"
#include "http_cache_info.hxx"

#include <gtest/gtest.h>

static bool
IsCacheable(const HttpCacheConfig &config, const HttpRequest &request,
	    HttpStatus status, const char *response_headers,
	    const char *body=nullptr)
{
	return http_cache_is_cacheable(config, request,
				       MakeResponse(status, response_headers, body));
}

static bool
IsCacheable(HttpStatus status, const char *response_headers,
	    const char *body=nullptr)
{
	const HttpCacheConfig config;
	return IsCacheable(config, MakeRequest(HttpMethod::GET, "/"),
			   status, response_headers, body);
}

TEST(HttpCacheRfc, RequestEvaluate)
{
	const HttpCacheConfig config;
	HttpCacheRequestInfo info;

	EXPECT_TRUE(http_cache_request_evaluate(info, config,
						MakeRequest(HttpMethod::GET, "/foo")));
	EXPECT_FALSE(info.has_query_string);
	EXPECT_FALSE(info.IsConditional());

	EXPECT_TRUE(http_cache_request_evaluate(info, config,
						MakeRequest(HttpMethod::HEAD, "/foo?bar",
							    "if-none-match: \"x\"\n")));
	EXPECT_TRUE(info.has_query_string);
	EXPECT_TRUE(info.IsConditional());
	EXPECT_STREQ(info.if_none_match, "\"x\"");

	/* a '?' in the fragment is not a query string */
	EXPECT_TRUE(http_cache_request_evaluate(info, config,
						MakeRequest(HttpMethod::GET, "/foo#?")));
	EXPECT_FALSE(info.has_query_string);

	EXPECT_FALSE(http_cache_request_evaluate(info, config,
						 MakeRequest(HttpMethod::POST, "/foo")));
	EXPECT_FALSE(http_cache_request_evaluate(info, config,
						 MakeRequest(HttpMethod::GET, "/foo",
							     "cache-control: no-store\n")));
	EXPECT_FALSE(http_cache_request_evaluate(info, config,
						 MakeRequest(HttpMethod::GET, "/foo",
							     "range: bytes=0-10\n")));

	auto with_body = MakeRequest(HttpMethod::GET, "/foo");
	with_body.body = std::make_shared<const std::string>("x");
	EXPECT_FALSE(http_cache_request_evaluate(info, config, with_body));
}

TEST(HttpCacheRfc, PragmaNoCache)
{
	HttpCacheConfig config;
	HttpCacheRequestInfo info;

	const auto request = MakeRequest(HttpMethod::GET, "/foo",
					 "pragma: no-cache\n");
	ASSERT_TRUE(http_cache_request_evaluate(info, config, request));
	EXPECT_TRUE(info.cache_control.no_cache);

	config.obey_no_cache = false;
	ASSERT_TRUE(http_cache_request_evaluate(info, config, request));
	EXPECT_FALSE(info.cache_control.no_cache);
}

TEST(HttpCacheRfc, Status)
{
	EXPECT_TRUE(IsCacheable(HttpStatus::OK, "etag: \"a\"\n"));
	EXPECT_TRUE(IsCacheable(HttpStatus::NOT_FOUND, "last-modified: Thu, 01 Jan 2009 00:00:00 GMT\n"));
	EXPECT_TRUE(IsCacheable(HttpStatus::MOVED_PERMANENTLY, "etag: \"a\"\n"));

	/* not cacheable by default */
	EXPECT_FALSE(IsCacheable(HttpStatus::FOUND, "etag: \"a\"\n"));
	EXPECT_FALSE(IsCacheable(HttpStatus::INTERNAL_SERVER_ERROR, "etag: \"a\"\n"));

	/* ... unless there is explicit freshness */
	EXPECT_TRUE(IsCacheable(HttpStatus::FOUND, "cache-control: max-age=60\n"));
	EXPECT_TRUE(IsCacheable(HttpStatus::INTERNAL_SERVER_ERROR,
				"expires: Thu, 01 Jan 2037 00:00:00 GMT\n"));

	/* never */
	EXPECT_FALSE(IsCacheable(HttpStatus::PARTIAL_CONTENT, "cache-control: max-age=60\n"));
	EXPECT_FALSE(IsCacheable(HttpStatus::NOT_MODIFIED, "cache-control: max-age=60\n"));
	EXPECT_FALSE(IsCacheable(HttpStatus::CONTINUE, "cache-control: max-age=60\n"));
}

TEST(HttpCacheRfc, Freshness)
{
	/* neither freshness information nor a validator */
	EXPECT_FALSE(IsCacheable(HttpStatus::OK, ""));

	/* an unparsable "Expires" is no freshness information */
	EXPECT_FALSE(IsCacheable(HttpStatus::OK, "expires: 0\n"));

	EXPECT_TRUE(IsCacheable(HttpStatus::OK, "cache-control: max-age=0\n"));

	HttpCacheConfig config;
	config.heuristic_caching = true;
	const auto request = MakeRequest(HttpMethod::GET, "/");
	EXPECT_FALSE(IsCacheable(config, request, HttpStatus::OK, ""));
	config.heuristic_default_lifetime = std::chrono::seconds(60);
	EXPECT_TRUE(IsCacheable(config, request, HttpStatus::OK, ""));
}

TEST(HttpCacheRfc, QueryString)
{
	const HttpCacheConfig config;
	const auto request = MakeRequest(HttpMethod::GET, "/foo?bar=1");

	EXPECT_FALSE(IsCacheable(config, request, HttpStatus::OK, "etag: \"a\"\n"));
	EXPECT_TRUE(IsCacheable(config, request, HttpStatus::OK, "cache-control: max-age=60\n"));
}

TEST(HttpCacheRfc, CacheControl)
{
	EXPECT_FALSE(IsCacheable(HttpStatus::OK, "cache-control: max-age=60, no-store\n"));
	EXPECT_FALSE(IsCacheable(HttpStatus::OK, "cache-control: max-age=60, private\n"));

	/* "no-cache" requires a validator */
	EXPECT_FALSE(IsCacheable(HttpStatus::OK, "cache-control: max-age=60, no-cache\n"));
	EXPECT_TRUE(IsCacheable(HttpStatus::OK, "cache-control: no-cache\n"
				"etag: \"a\"\n"));

	EXPECT_FALSE(IsCacheable(HttpStatus::OK, "cache-control: max-age=60\n"
				 "vary: accept, *\n"));

	/* a private cache may store "private" responses */
	HttpCacheConfig config;
	config.shared_cache = false;
	EXPECT_TRUE(IsCacheable(config, MakeRequest(HttpMethod::GET, "/"),
				HttpStatus::OK, "cache-control: max-age=60, private\n"));

	/* a shared cache uses "s-maxage" */
	EXPECT_TRUE(IsCacheable(HttpStatus::OK, "cache-control: s-maxage=60\n"));
	EXPECT_FALSE(IsCacheable(config, MakeRequest(HttpMethod::GET, "/?x"),
				 HttpStatus::OK, "cache-control: s-maxage=60\n"));
}

TEST(HttpCacheRfc, Authorization)
{
	const HttpCacheConfig config;
	const auto request = MakeRequest(HttpMethod::GET, "/",
					 "authorization: Basic Zm9vOmJhcg==\n");

	EXPECT_FALSE(IsCacheable(config, request, HttpStatus::OK,
				 "cache-control: max-age=60\n"));
	EXPECT_TRUE(IsCacheable(config, request, HttpStatus::OK,
				"cache-control: max-age=60, public\n"));
	EXPECT_TRUE(IsCacheable(config, request, HttpStatus::OK,
				"cache-control: s-maxage=60\n"));
	EXPECT_TRUE(IsCacheable(config, request, HttpStatus::OK,
				"cache-control: max-age=60, must-revalidate\n"));
}

TEST(HttpCacheRfc, Body)
{
	HttpCacheConfig config;
	config.max_object_size = 8;
	const auto request = MakeRequest(HttpMethod::GET, "/");

	EXPECT_TRUE(IsCacheable(config, request, HttpStatus::OK,
				"cache-control: max-age=60\n", "12345678"));
	EXPECT_FALSE(IsCacheable(config, request, HttpStatus::OK,
				 "cache-control: max-age=60\n", "123456789"));

	/* truncated */
	EXPECT_FALSE(IsCacheable(config, request, HttpStatus::OK,
				 "cache-control: max-age=60\n"
				 "content-length: 8\n", "1234"));
	EXPECT_TRUE(IsCacheable(config, request, HttpStatus::OK,
				"cache-control: max-age=60\n"
				"content-length: 4\n", "1234"));
}

TEST(HttpCacheRfc, Invalidate)
{
	EXPECT_FALSE(http_cache_request_invalidate(HttpMethod::GET));
	EXPECT_FALSE(http_cache_request_invalidate(HttpMethod::HEAD));
	EXPECT_FALSE(http_cache_request_invalidate(HttpMethod::OPTIONS));
	EXPECT_TRUE(http_cache_request_invalidate(HttpMethod::POST));
	EXPECT_TRUE(http_cache_request_invalidate(HttpMethod::PUT));
	EXPECT_TRUE(http_cache_request_invalidate(HttpMethod::DELETE));
	EXPECT_TRUE(http_cache_request_invalidate(HttpMethod::PATCH));
}
