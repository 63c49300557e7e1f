// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TestHttp.hxx"
#include "http_cache_conditional.hxx"

#include <gtest/gtest.h>

TEST(HttpCacheConditional, ETag)
{
	const auto document = MakeDocument("date: Fri, 30 Jan 2009 10:00:00 GMT\n"
					   "etag: \"abc\"\n");

	const auto request = http_cache_build_conditional(MakeRequest(HttpMethod::GET, "/",
								      "accept: text/html\n"),
							  *document);
	EXPECT_EQ(request.method, HttpMethod::GET);
	EXPECT_EQ(request.uri, "/");
	EXPECT_STREQ(request.headers.Get("accept"), "text/html");
	EXPECT_STREQ(request.headers.Get("if-none-match"), "\"abc\"");

	/* without "Last-Modified", the "Date" is used */
	EXPECT_STREQ(request.headers.Get("if-modified-since"),
		     "Fri, 30 Jan 2009 10:00:00 GMT");
	EXPECT_EQ(request.headers.Get("cache-control"), nullptr);
}

TEST(HttpCacheConditional, LastModified)
{
	const auto document = MakeDocument("date: Fri, 30 Jan 2009 10:00:00 GMT\n"
					   "last-modified: Thu, 01 Jan 2009 00:00:00 GMT\n");

	const auto request = http_cache_build_conditional(MakeRequest(HttpMethod::GET, "/"),
							  *document);
	EXPECT_EQ(request.headers.Get("if-none-match"), nullptr);
	EXPECT_STREQ(request.headers.Get("if-modified-since"),
		     "Thu, 01 Jan 2009 00:00:00 GMT");
}

TEST(HttpCacheConditional, MergeCallerConditions)
{
	const auto document = MakeDocument("etag: \"abc\"\n"
					   "last-modified: Thu, 01 Jan 2009 00:00:00 GMT\n");

	/* the caller's conditions are preserved */
	auto request = http_cache_build_conditional(MakeRequest(HttpMethod::GET, "/",
								"if-none-match: \"xyz\"\n"
								"if-modified-since: Sat, 03 Jan 2009 00:00:00 GMT\n"),
						    *document);
	EXPECT_STREQ(request.headers.Get("if-none-match"), "\"xyz\", \"abc\"");
	EXPECT_STREQ(request.headers.Get("if-modified-since"),
		     "Sat, 03 Jan 2009 00:00:00 GMT");

	/* no duplicates */
	request = http_cache_build_conditional(MakeRequest(HttpMethod::GET, "/",
							   "if-none-match: \"abc\", \"xyz\"\n"),
					       *document);
	EXPECT_STREQ(request.headers.Get("if-none-match"), "\"abc\", \"xyz\"");

	/* "*" already matches everything */
	request = http_cache_build_conditional(MakeRequest(HttpMethod::GET, "/",
							   "if-none-match: *\n"),
					       *document);
	EXPECT_STREQ(request.headers.Get("if-none-match"), "*");
}

TEST(HttpCacheConditional, MustRevalidate)
{
	const auto document = MakeDocument("etag: \"abc\"\n"
					   "cache-control: max-age=60, must-revalidate\n");

	auto request = http_cache_build_conditional(MakeRequest(HttpMethod::GET, "/"),
						    *document);
	EXPECT_STREQ(request.headers.Get("cache-control"), "max-age=0");

	request = http_cache_build_conditional(MakeRequest(HttpMethod::GET, "/",
							   "cache-control: no-transform\n"),
					       *document);
	EXPECT_STREQ(request.headers.Get("cache-control"), "no-transform, max-age=0");

	request = http_cache_build_conditional(MakeRequest(HttpMethod::GET, "/",
							   "cache-control: max-age=0\n"),
					       *document);
	EXPECT_STREQ(request.headers.Get("cache-control"), "max-age=0");
}

TEST(HttpCacheConditional, Unconditional)
{
	const auto request = http_cache_build_unconditional(MakeRequest(HttpMethod::GET, "/",
									"accept: */*\n"
									"if-none-match: \"abc\"\n"
									"if-match: \"abc\"\n"
									"if-modified-since: Thu, 01 Jan 2009 00:00:00 GMT\n"
									"if-unmodified-since: Thu, 01 Jan 2009 00:00:00 GMT\n"
									"if-range: \"abc\"\n"
									"cache-control: max-age=60\n"));

	EXPECT_STREQ(request.headers.Get("accept"), "*/*");
	EXPECT_FALSE(request.headers.Contains("if-none-match"));
	EXPECT_FALSE(request.headers.Contains("if-match"));
	EXPECT_FALSE(request.headers.Contains("if-modified-since"));
	EXPECT_FALSE(request.headers.Contains("if-unmodified-since"));
	EXPECT_FALSE(request.headers.Contains("if-range"));
	EXPECT_STREQ(request.headers.Get("cache-control"), "no-cache");
	EXPECT_STREQ(request.headers.Get("pragma"), "no-cache");
}
