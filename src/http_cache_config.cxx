// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http_cache_config.hxx"
#include "io/ConfigParser.hxx"
#include "io/LineParser.hxx"
#include "strutil.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>
#include <string>

#include <string.h>

bool
HttpCacheConfig::IsCacheableMethod(HttpMethod method) const noexcept
{
	return std::find(cacheable_methods.begin(), cacheable_methods.end(),
			 method) != cacheable_methods.end();
}

static HttpCacheEtagMismatchPolicy
ParseEtagMismatchPolicy(const char *s)
{
	if (strcmp(s, "discard") == 0)
		return HttpCacheEtagMismatchPolicy::DISCARD;
	else if (strcmp(s, "trust") == 0)
		return HttpCacheEtagMismatchPolicy::TRUST;
	else
		throw LineParser::Error("\"discard\" or \"trust\" expected");
}

static HttpMethod
ParseCacheableMethod(const char *s)
{
	const auto method = http_method_parse(s);
	if (method == HttpMethod::INVALID)
		throw LineParser::Error(fmt::format("Unknown method: {}", s));

	return method;
}

/**
 * Parse the value(s) of one option from the rest of the line.
 */
static void
ParseOption(HttpCacheConfig &config, std::string_view name, LineParser &line)
{
	if (name == "shared_cache") {
		config.shared_cache = line.NextBool();
	} else if (name == "heuristic_caching") {
		config.heuristic_caching = line.NextBool();
	} else if (name == "heuristic_coefficient") {
		config.heuristic_coefficient = line.NextDouble();
	} else if (name == "heuristic_default_lifetime") {
		config.heuristic_default_lifetime = line.NextDuration();
	} else if (name == "max_object_size") {
		config.max_object_size = line.NextSize();
	} else if (name == "max_entries") {
		config.max_entries = line.NextPositiveInteger();
	} else if (name == "max_size") {
		config.max_size = line.NextSize();
	} else if (name == "cacheable_methods") {
		config.cacheable_methods.clear();

		do {
			config.cacheable_methods.push_back(ParseCacheableMethod(line.ExpectValue()));
		} while (!line.IsEnd());
	} else if (name == "etag_mismatch_policy") {
		config.etag_mismatch_policy = ParseEtagMismatchPolicy(line.ExpectValue());
	} else if (name == "stale_while_revalidate") {
		config.stale_while_revalidate = line.NextBool();
	} else if (name == "stale_if_error") {
		config.stale_if_error = line.NextBool();
	} else if (name == "worker_threads") {
		const char *s = line.ExpectValue();
		const auto value = ParseDecimal(s, 1024);
		if (!value)
			throw LineParser::Error("Number expected");
		config.worker_threads = unsigned(*value);
	} else if (name == "max_key_length") {
		config.max_key_length = line.NextPositiveInteger();
	} else if (name == "obey_no_cache") {
		config.obey_no_cache = line.NextBool();
	} else
		throw LineParser::Error(fmt::format("Unknown option: {}", name));

	line.ExpectEnd();
}

void
HttpCacheConfig::HandleSet(std::string_view name, const char *value)
{
	std::string buffer(value);
	LineParser line(buffer.data());
	ParseOption(*this, name, line);
}

void
HttpCacheConfig::Check() const
{
	if (heuristic_coefficient > 1)
		throw std::runtime_error("heuristic_coefficient must not be larger than 1");

	if (max_object_size > max_size)
		throw std::runtime_error("max_object_size must not be larger than max_size");

	if (cacheable_methods.empty())
		throw std::runtime_error("No cacheable methods");

	if (!std::all_of(cacheable_methods.begin(), cacheable_methods.end(),
			 http_method_is_safe))
		throw std::runtime_error("Only safe methods may be cacheable");
}

namespace {

class HttpCacheConfigParser final : public ConfigParser {
	HttpCacheConfig &config;

public:
	explicit HttpCacheConfigParser(HttpCacheConfig &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) override;
	void Finish() override;
};

void
HttpCacheConfigParser::ParseLine(LineParser &line)
{
	const char *word = line.NextWord();
	if (word == nullptr)
		throw LineParser::Error("Option name expected");

	ParseOption(config, word, line);
}

void
HttpCacheConfigParser::Finish()
{
	config.Check();
}

}

void
LoadConfigFile(HttpCacheConfig &config, const boost::filesystem::path &path)
{
	HttpCacheConfigParser parser(config);
	CommentConfigParser parser2(parser);
	IncludeConfigParser parser3(boost::filesystem::path(path), parser2);

	ParseConfigFile(path, parser3);
}
