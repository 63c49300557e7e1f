// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "io/ConfigParser.hxx"
#include "io/LineParser.hxx"
#include "http_cache_config.hxx"
#include "Exception.hxx"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include <stdio.h>

namespace fs = boost::filesystem;

using namespace std::chrono_literals;

namespace {

class MyConfigParser final
	: public ConfigParser, public std::vector<std::string> {
public:
	bool finished = false;

	void ParseLine(LineParser &line) override {
		const char *value = line.NextUnescape();
		if (value == nullptr)
			throw LineParser::Error("Quoted value expected");
		line.ExpectEnd();
		emplace_back(value);
	}

	void Finish() override {
		finished = true;
	}
};

/**
 * A temporary directory which is deleted recursively by the
 * destructor.
 */
class TempDirectory {
	const fs::path path;

public:
	TempDirectory()
		:path(fs::temp_directory_path() / fs::unique_path("hcache-%%%%-%%%%-%%%%")) {
		fs::create_directory(path);
	}

	~TempDirectory() noexcept {
		boost::system::error_code ec;
		fs::remove_all(path, ec);
	}

	TempDirectory(const TempDirectory &) = delete;
	TempDirectory &operator=(const TempDirectory &) = delete;

	fs::path Write(const char *name, const char *contents) const {
		auto p = path / name;

		FILE *file = fopen(p.c_str(), "w");
		if (file == nullptr)
			throw std::runtime_error("Failed to create " + p.native());

		fputs(contents, file);
		fclose(file);
		return p;
	}
};

}

static void
ParseConfigLines(ConfigParser &parser, const char *const*lines)
{
	while (*lines != nullptr) {
		std::string buffer(*lines++);
		LineParser line_parser(buffer.data());
		if (!parser.PreParseLine(line_parser))
			parser.ParseLine(line_parser);
	}

	parser.Finish();
}

TEST(ConfigParserTest, CommentConfigParser)
{
	static const char *const lines[] = {
		"# comment",
		"",
		"   ",
		"'foo'",
		"  \"bar\\n\"  ",
		"\t# indented comment",
		nullptr
	};

	MyConfigParser p;
	CommentConfigParser c(p);
	ParseConfigLines(c, lines);

	ASSERT_EQ(p.size(), 2u);
	EXPECT_EQ(p[0], "foo");
	EXPECT_EQ(p[1], "bar\n");
	EXPECT_TRUE(p.finished);
}

TEST(ConfigParserTest, Include)
{
	const TempDirectory dir;
	dir.Write("a.conf", "'a'\n");
	dir.Write("b.conf", "'b'\n");
	dir.Write("c.txt", "'c'\n");
	dir.Write("sub.conf", "'sub'\n");
	const auto main_path = dir.Write("main",
				    "'first'\n"
				    "@include \"sub.conf\"\n"
				    "@include \"*.conf\"\n"
				    "@include_optional \"missing.conf\"\n"
				    "'last'\n");

	MyConfigParser p;
	CommentConfigParser c(p);
	IncludeConfigParser i(fs::path(main_path), c);
	ParseConfigFile(main_path, i);

	const std::vector<std::string> expected{
		"first", "sub", "a", "b", "sub", "last",
	};
	EXPECT_EQ(static_cast<const std::vector<std::string> &>(p), expected);
	EXPECT_TRUE(p.finished);
}

TEST(ConfigParserTest, MissingFile)
{
	const TempDirectory dir;
	const auto main_path = dir.Write("main", "@include \"missing.conf\"\n");

	MyConfigParser p;
	IncludeConfigParser i(fs::path(main_path), p);

	try {
		ParseConfigFile(main_path, i);
		FAIL();
	} catch (const std::exception &e) {
		const auto msg = GetFullMessage(e);
		EXPECT_EQ(msg.find(main_path.native() + ":1"), 0u) << msg;
		EXPECT_NE(msg.find("Failed to open"), std::string::npos) << msg;
	}
}

TEST(ConfigParserTest, LineParser)
{
	std::string buffer = "  word 'quoted value' 16k 5m yes 0.25  ";
	LineParser line(buffer.data());

	EXPECT_STREQ(line.NextWord(), "word");
	EXPECT_STREQ(line.NextValue(), "quoted value");
	EXPECT_EQ(line.NextSize(), 16384u);
	EXPECT_EQ(line.NextDuration(), 300s);
	EXPECT_TRUE(line.NextBool());
	EXPECT_DOUBLE_EQ(line.NextDouble(), 0.25);
	EXPECT_TRUE(line.IsEnd());
	EXPECT_NO_THROW(line.ExpectEnd());

	buffer = "1x";
	LineParser bad_size(buffer.data());
	EXPECT_THROW(bad_size.NextSize(), LineParser::Error);

	buffer = "0";
	LineParser zero(buffer.data());
	EXPECT_THROW(zero.NextPositiveInteger(), LineParser::Error);

	buffer = "maybe";
	LineParser maybe(buffer.data());
	EXPECT_THROW(maybe.NextBool(), LineParser::Error);

	buffer = "a b";
	LineParser trailing(buffer.data());
	EXPECT_STREQ(trailing.NextWord(), "a");
	EXPECT_THROW(trailing.ExpectEnd(), LineParser::Error);
}

TEST(HttpCacheConfigTest, Load)
{
	const TempDirectory dir;
	const auto path = dir.Write("hcache.conf",
				    "# HTTP cache settings\n"
				    "shared_cache no\n"
				    "heuristic_caching yes\n"
				    "heuristic_coefficient 0.2\n"
				    "heuristic_default_lifetime 10m\n"
				    "max_object_size 1M\n"
				    "max_size 2G\n"
				    "max_entries 100\n"
				    "cacheable_methods GET\n"
				    "etag_mismatch_policy trust\n"
				    "stale_while_revalidate no\n"
				    "stale_if_error no\n"
				    "worker_threads 4\n"
				    "max_key_length 1024\n"
				    "obey_no_cache no\n");

	HttpCacheConfig config;
	LoadConfigFile(config, path);

	EXPECT_FALSE(config.shared_cache);
	EXPECT_TRUE(config.heuristic_caching);
	EXPECT_DOUBLE_EQ(config.heuristic_coefficient, 0.2);
	EXPECT_EQ(config.heuristic_default_lifetime, 600s);
	EXPECT_EQ(config.max_object_size, 1024u * 1024u);
	EXPECT_EQ(config.max_size, std::size_t(2) << 30);
	EXPECT_EQ(config.max_entries, 100u);
	EXPECT_EQ(config.cacheable_methods, std::vector<HttpMethod>{HttpMethod::GET});
	EXPECT_EQ(config.etag_mismatch_policy, HttpCacheEtagMismatchPolicy::TRUST);
	EXPECT_FALSE(config.stale_while_revalidate);
	EXPECT_FALSE(config.stale_if_error);
	EXPECT_EQ(config.worker_threads, 4u);
	EXPECT_EQ(config.max_key_length, 1024u);
	EXPECT_FALSE(config.obey_no_cache);

	EXPECT_TRUE(config.IsCacheableMethod(HttpMethod::GET));
	EXPECT_FALSE(config.IsCacheableMethod(HttpMethod::HEAD));
}

TEST(HttpCacheConfigTest, Errors)
{
	const TempDirectory dir;

	static constexpr struct {
		const char *contents, *message;
	} tests[] = {
		{"foo yes\n", "Unknown option: foo"},
		{"\nshared_cache maybe\n", "yes/no expected"},
		{"max_entries 0\n", "Not a positive number: 0"},
		{"max_size 1X\n", "Unknown size suffix: 1X"},
		{"cacheable_methods GET FOO\n", "Unknown method: FOO"},
		{"etag_mismatch_policy sometimes\n", "\"discard\" or \"trust\" expected"},
		{"shared_cache yes no\n", "Unexpected tokens at end of line: no"},
	};

	for (const auto &i : tests) {
		const auto path = dir.Write("hcache.conf", i.contents);

		HttpCacheConfig config;
		try {
			LoadConfigFile(config, path);
			FAIL() << i.contents;
		} catch (const std::exception &e) {
			const auto msg = GetFullMessage(e);
			EXPECT_EQ(msg.find(path.native() + ':'), 0u) << msg;
			EXPECT_NE(msg.find(i.message), std::string::npos) << msg;
		}
	}

	/* the line number */
	const auto path = dir.Write("hcache.conf",
				    "# comment\n"
				    "max_entries 10\n"
				    "bar no\n");
	HttpCacheConfig config;
	try {
		LoadConfigFile(config, path);
		FAIL();
	} catch (const std::exception &e) {
		EXPECT_EQ(GetFullMessage(e),
			  path.native() + ":3; Unknown option: bar");
	}
}

TEST(HttpCacheConfigTest, Check)
{
	HttpCacheConfig config;
	EXPECT_NO_THROW(config.Check());

	config.max_object_size = config.max_size + 1;
	EXPECT_THROW(config.Check(), std::runtime_error);

	config = {};
	config.cacheable_methods.clear();
	EXPECT_THROW(config.Check(), std::runtime_error);

	config = {};
	config.cacheable_methods.push_back(HttpMethod::POST);
	EXPECT_THROW(config.Check(), std::runtime_error);

	config = {};
	config.heuristic_coefficient = 1.5;
	EXPECT_THROW(config.Check(), std::runtime_error);

	/* invalid values are detected when the file is finished */
	config = {};
	const TempDirectory dir;
	const auto path = dir.Write("hcache.conf",
				    "max_size 1k\n"
				    "max_object_size 2k\n");
	EXPECT_THROW(LoadConfigFile(config, path), std::runtime_error);
}

TEST(HttpCacheConfigTest, HandleSet)
{
	HttpCacheConfig config;
	config.HandleSet("max_entries", "42");
	EXPECT_EQ(config.max_entries, 42u);

	config.HandleSet("cacheable_methods", "GET HEAD OPTIONS");
	EXPECT_TRUE(config.IsCacheableMethod(HttpMethod::OPTIONS));

	EXPECT_THROW(config.HandleSet("max_entries", "many"), std::runtime_error);
	EXPECT_THROW(config.HandleSet("nonexistent", "1"), std::runtime_error);
}
