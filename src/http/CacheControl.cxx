// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CacheControl.hxx"
#include "List.hxx"
#include "strmap.hxx"
#include "strutil.hxx"

/**
 * RFC 7234 1.2.1: "If a cache receives a delta-seconds value greater
 * than the greatest integer it can represent, or if any of its
 * subsequent calculations overflows, the cache MUST consider the
 * value to be either 2147483648 (2^31) or the greatest positive
 * integer it can conveniently represent."
 */
static constexpr uint_least64_t MAX_DELTA_SECONDS = 2147483648ULL;

std::optional<std::chrono::seconds>
http_parse_delta_seconds(std::string_view s) noexcept
{
	/* tolerate a quoted argument, e.g. max-age="60" */
	if (s.size() >= 2 && s.front() == '"' && s.back() == '"')
		s = s.substr(1, s.size() - 2);

	const auto value = ParseDecimal(s, MAX_DELTA_SECONDS);
	if (!value)
		return std::nullopt;

	return std::chrono::seconds(*value);
}

void
HttpCacheControl::ParseValue(std::string_view value)
{
	for (std::string_view directive : http_list_split_raw(value)) {
		auto [name, argument] = Split(directive, '=');
		name = Strip(name);

		const bool has_argument = argument.data() != nullptr;
		argument = Strip(argument);

		if (StringIsEqualIgnoreCase(name, "no-store"))
			no_store = true;
		else if (StringIsEqualIgnoreCase(name, "no-cache"))
			no_cache = true;
		else if (StringIsEqualIgnoreCase(name, "must-revalidate"))
			must_revalidate = true;
		else if (StringIsEqualIgnoreCase(name, "proxy-revalidate"))
			proxy_revalidate = true;
		else if (StringIsEqualIgnoreCase(name, "public"))
			is_public = true;
		else if (StringIsEqualIgnoreCase(name, "private"))
			is_private = true;
		else if (StringIsEqualIgnoreCase(name, "only-if-cached"))
			only_if_cached = true;
		else if (StringIsEqualIgnoreCase(name, "max-age"))
			max_age = http_parse_delta_seconds(argument);
		else if (StringIsEqualIgnoreCase(name, "s-maxage"))
			s_maxage = http_parse_delta_seconds(argument);
		else if (StringIsEqualIgnoreCase(name, "stale-while-revalidate"))
			stale_while_revalidate = http_parse_delta_seconds(argument);
		else if (StringIsEqualIgnoreCase(name, "stale-if-error"))
			stale_if_error = http_parse_delta_seconds(argument);
		else if (StringIsEqualIgnoreCase(name, "min-fresh"))
			min_fresh = http_parse_delta_seconds(argument);
		else if (StringIsEqualIgnoreCase(name, "max-stale")) {
			if (has_argument)
				max_stale = http_parse_delta_seconds(argument);
			else
				max_stale_any = true;
		}
	}
}

HttpCacheControl
HttpCacheControl::Parse(const StringMap &headers)
{
	HttpCacheControl cc;

	headers.ForEach("cache-control", [&cc](std::string_view value){
		cc.ParseValue(value);
	});

	/* RFC 7234 5.4: "Pragma: no-cache" is only honoured if there
	   is no "Cache-Control" header */
	if (!headers.Contains("cache-control"))
		headers.ForEach("pragma", [&cc](std::string_view value){
			if (http_list_contains_i(value, "no-cache"))
				cc.no_cache = true;
		});

	return cc;
}
