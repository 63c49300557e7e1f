// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http_cache_age.hxx"
#include "http_cache_config.hxx"
#include "http_cache_document.hxx"
#include "http/CacheControl.hxx"
#include "http/Date.hxx"

#include <algorithm>

using std::chrono::duration_cast;

static constexpr std::chrono::seconds MAX_AGE{2147483648LL};

/**
 * Clamp a duration to [0, MAX_AGE] and truncate it to whole seconds.
 */
static constexpr std::chrono::seconds
ClampSeconds(std::chrono::system_clock::duration d) noexcept
{
	if (d <= d.zero())
		return {};

	const auto s = duration_cast<std::chrono::seconds>(d);
	return std::min(s, MAX_AGE);
}

/**
 * The heuristic freshness lifetime (RFC 7234 4.2.2).
 */
[[gnu::pure]]
static std::chrono::seconds
HeuristicFreshnessLifetime(const HttpCacheConfig &config,
			   const HttpCacheDocument &document) noexcept
{
	if (!config.heuristic_caching)
		return {};

	const char *last_modified = document.GetLastModified();
	if (last_modified == nullptr)
		return config.heuristic_default_lifetime;

	const auto lm = http_date_parse(last_modified);
	const auto date = document.GetDate();
	if (!lm || !date)
		return config.heuristic_default_lifetime;

	const auto age = ClampSeconds(*date - *lm);
	return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(age.count() * config.heuristic_coefficient));
}

std::chrono::seconds
http_cache_freshness_lifetime(const HttpCacheConfig &config,
			      const HttpCacheDocument &document) noexcept
{
	const auto &cc = document.cache_control;

	if (config.shared_cache && cc.s_maxage)
		return *cc.s_maxage;

	if (cc.max_age)
		return *cc.max_age;

	if (const char *expires = document.response_headers.Get("expires")) {
		const auto e = http_date_parse(expires);
		const auto date = document.GetDate();
		if (e && date)
			return ClampSeconds(*e - *date);
	}

	return HeuristicFreshnessLifetime(config, document);
}

/**
 * Parse the "Age" header.  Invalid values are treated as absent.
 */
[[gnu::pure]]
static std::chrono::seconds
GetAgeValue(const HttpCacheDocument &document) noexcept
{
	const char *age = document.response_headers.Get("age");
	if (age == nullptr)
		return {};

	return http_parse_delta_seconds(age).value_or(std::chrono::seconds{});
}

std::chrono::seconds
http_cache_current_age(const HttpCacheDocument &document,
		       std::chrono::system_clock::time_point now) noexcept
{
	const auto date = document.GetDate();
	const std::chrono::seconds apparent_age = date
		? ClampSeconds(document.response_time - *date)
		: std::chrono::seconds{};

	const auto response_delay = ClampSeconds(document.response_time -
						 document.request_time);
	const auto corrected_age_value = GetAgeValue(document) + response_delay;
	const auto corrected_initial_age = std::max(apparent_age,
						    corrected_age_value);

	const auto resident_time = ClampSeconds(now - document.response_time);

	return std::min(corrected_initial_age + resident_time, MAX_AGE);
}

bool
http_cache_is_fresh(const HttpCacheConfig &config,
		    const HttpCacheDocument &document,
		    std::chrono::system_clock::time_point now) noexcept
{
	return http_cache_current_age(document, now) <
		http_cache_freshness_lifetime(config, document);
}

std::chrono::seconds
http_cache_staleness(const HttpCacheConfig &config,
		     const HttpCacheDocument &document,
		     std::chrono::system_clock::time_point now) noexcept
{
	const auto age = http_cache_current_age(document, now);
	const auto lifetime = http_cache_freshness_lifetime(config, document);
	return age > lifetime ? age - lifetime : std::chrono::seconds{};
}

bool
http_cache_stale_forbidden(const HttpCacheConfig &config,
			   const HttpCacheDocument &document) noexcept
{
	const auto &cc = document.cache_control;
	return cc.must_revalidate || cc.no_cache ||
		(config.shared_cache && cc.proxy_revalidate);
}

bool
http_cache_may_stale_while_revalidate(const HttpCacheConfig &config,
				      const HttpCacheDocument &document,
				      std::chrono::system_clock::time_point now) noexcept
{
	const auto &swr = document.cache_control.stale_while_revalidate;
	if (!config.stale_while_revalidate || !swr ||
	    http_cache_stale_forbidden(config, document))
		return false;

	return http_cache_staleness(config, document, now) <= *swr;
}

bool
http_cache_may_stale_if_error(const HttpCacheConfig &config,
			      const HttpCacheDocument &document,
			      std::chrono::system_clock::time_point now,
			      const HttpCacheControl *request_cache_control) noexcept
{
	if (!config.stale_if_error ||
	    http_cache_stale_forbidden(config, document))
		return false;

	const auto staleness = http_cache_staleness(config, document, now);

	const auto &response_sie = document.cache_control.stale_if_error;
	if (response_sie && staleness <= *response_sie)
		return true;

	if (request_cache_control != nullptr) {
		const auto &request_sie = request_cache_control->stale_if_error;
		if (request_sie && staleness <= *request_sie)
			return true;
	}

	return false;
}
