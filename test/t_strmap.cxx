// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "strmap.hxx"
#include "http/HeaderParser.hxx"

#include <gtest/gtest.h>

#include <string>
#include <vector>

static std::vector<std::string>
Collect(const StringMap &map, const char *key)
{
	std::vector<std::string> result;
	map.ForEach(key, [&result](std::string_view value){
		result.emplace_back(value);
	});
	return result;
}

TEST(StringMap, Basic)
{
	StringMap map;
	EXPECT_TRUE(map.IsEmpty());
	EXPECT_EQ(map.Get("foo"), nullptr);
	EXPECT_FALSE(map.Contains("foo"));

	map.Add("Foo", "1");
	map.Add("bar", "2");
	map.Add("FOO", "3");

	EXPECT_EQ(map.size(), 3u);
	EXPECT_STREQ(map.Get("foo"), "1");
	EXPECT_STREQ(map.Get("fOo"), "1");
	EXPECT_TRUE(map.Contains("BAR"));
	EXPECT_EQ(Collect(map, "foo"), (std::vector<std::string>{"1", "3"}));
	EXPECT_EQ(map.GetJoined("foo"), "1, 3");
	EXPECT_EQ(map.GetJoined("missing"), "");

	/* keys are stored in lower case, order is preserved */
	auto i = map.begin();
	EXPECT_EQ(i->key, "foo");
	++i;
	EXPECT_EQ(i->key, "bar");
	++i;
	EXPECT_EQ(i->key, "foo");
}

TEST(StringMap, Set)
{
	StringMap map{{"a", "1"}, {"b", "2"}, {"a", "3"}, {"c", "4"}};

	map.Set("A", "5");
	ASSERT_EQ(map.size(), 3u);
	auto i = map.begin();
	EXPECT_EQ(i->key, "a");
	EXPECT_EQ(i->value, "5");
	EXPECT_EQ((++i)->key, "b");
	EXPECT_EQ((++i)->key, "c");

	map.Set("d", "6");
	EXPECT_EQ(map.size(), 4u);
	EXPECT_STREQ(map.Get("d"), "6");
}

TEST(StringMap, Remove)
{
	StringMap map{{"a", "1"}, {"b", "2"}, {"a", "3"}};

	EXPECT_TRUE(map.Remove("A"));
	EXPECT_FALSE(map.Remove("a"));
	EXPECT_EQ(map.size(), 1u);
	EXPECT_STREQ(map.Get("b"), "2");

	map.Clear();
	EXPECT_TRUE(map.IsEmpty());
}

TEST(StringMap, CopyFrom)
{
	const StringMap src{{"a", "1"}, {"b", "2"}, {"a", "3"}};
	StringMap dest{{"a", "old"}, {"c", "4"}};

	dest.CopyFrom(src, "a");
	EXPECT_EQ(Collect(dest, "a"), (std::vector<std::string>{"1", "3"}));
	EXPECT_STREQ(dest.Get("c"), "4");

	/* copying a missing key removes it */
	dest.CopyFrom(src, "c");
	EXPECT_FALSE(dest.Contains("c"));
}

TEST(HeaderParser, Line)
{
	StringMap map;
	EXPECT_TRUE(header_parse_line(map, "Content-Type:  text/html  "));
	EXPECT_STREQ(map.Get("content-type"), "text/html");

	EXPECT_TRUE(header_parse_line(map, "X-Empty:"));
	EXPECT_STREQ(map.Get("x-empty"), "");

	EXPECT_FALSE(header_parse_line(map, "no colon"));
	EXPECT_FALSE(header_parse_line(map, ": no name"));
	EXPECT_FALSE(header_parse_line(map, "bad name: value"));
	EXPECT_EQ(map.size(), 2u);
}

TEST(HeaderParser, Buffer)
{
	StringMap map;
	header_parse_buffer(map,
			    "Host: example.com\r\n"
			    "Accept: text/html\r\n"
			    "garbage\n"
			    "\n"
			    "Accept: */*\n"
			    "  Vary: accept");

	EXPECT_EQ(map.size(), 4u);
	EXPECT_STREQ(map.Get("host"), "example.com");
	EXPECT_EQ(map.GetJoined("accept"), "text/html, */*");
	EXPECT_STREQ(map.Get("vary"), "accept");
}
