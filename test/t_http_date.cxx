// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http/Date.hxx"

#include <gtest/gtest.h>

using std::chrono::system_clock;

static constexpr time_t t_1994 = 784111777;

TEST(HttpDate, Format)
{
	EXPECT_EQ(http_date_format(system_clock::from_time_t(t_1994)),
		  "Sun, 06 Nov 1994 08:49:37 GMT");
	EXPECT_EQ(http_date_format(system_clock::from_time_t(1700000000)),
		  "Tue, 14 Nov 2023 22:13:20 GMT");
	EXPECT_EQ(http_date_format(system_clock::from_time_t(0)),
		  "Thu, 01 Jan 1970 00:00:00 GMT");
}

TEST(HttpDate, Parse)
{
	const auto expected = system_clock::from_time_t(t_1994);

	EXPECT_EQ(http_date_parse("Sun, 06 Nov 1994 08:49:37 GMT"), expected);
	EXPECT_EQ(http_date_parse("Sunday, 06-Nov-94 08:49:37 GMT"), expected);
	EXPECT_EQ(http_date_parse("Sun Nov  6 08:49:37 1994"), expected);

	/* tolerated variations */
	EXPECT_EQ(http_date_parse("  Sun, 06 Nov 1994 08:49:37 GMT "), expected);
	EXPECT_EQ(http_date_parse("sun, 06 nov 1994 08:49:37 GMT"), expected);
	EXPECT_EQ(http_date_parse("Sun, 6 Nov 1994 08:49:37 GMT"), expected);
}

TEST(HttpDate, Invalid)
{
	EXPECT_FALSE(http_date_parse(""));
	EXPECT_FALSE(http_date_parse("0"));
	EXPECT_FALSE(http_date_parse("-1"));
	EXPECT_FALSE(http_date_parse("tomorrow"));
	EXPECT_FALSE(http_date_parse("Sun, 06 Nov 1994 08:49:37"));
	EXPECT_FALSE(http_date_parse("Sun, 06 Nov 1994 08:49:37 CET"));
	EXPECT_FALSE(http_date_parse("Sun, 06 Foo 1994 08:49:37 GMT"));
	EXPECT_FALSE(http_date_parse("Sun, 32 Nov 1994 08:49:37 GMT"));
	EXPECT_FALSE(http_date_parse("Sun, 06 Nov 1994 24:49:37 GMT"));
	EXPECT_FALSE(http_date_parse("Sun, 06 Nov 1994 08:49:37 GMT junk"));
	EXPECT_FALSE(http_date_parse("Sun, 06 Nov 94 08:49:37 GMT"));
}

TEST(HttpDate, RoundTrip)
{
	const auto t = system_clock::from_time_t(1234567890);
	EXPECT_EQ(http_date_parse(http_date_format(t)), t);
}
