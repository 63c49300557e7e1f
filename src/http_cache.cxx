// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http_cache.hxx"
#include "http_cache_age.hxx"
#include "http_cache_conditional.hxx"
#include "http_cache_info.hxx"
#include "http_cache_key.hxx"
#include "http_cache_rfc.hxx"
#include "http_cache_storage.hxx"
#include "http_cache_update.hxx"
#include "thread/ThreadPool.hxx"
#include "http/Date.hxx"
#include "http/Host.hxx"
#include "http/List.hxx"
#include "http/Request.hxx"
#include "http/Response.hxx"
#include "ResourceLoader.hxx"
#include "Clock.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <cassert>
#include <optional>
#include <stdexcept>

using Hcache::CacheResponseStatus;

static constexpr const char *warning_stale = "110 - \"Response is Stale\"";
static constexpr const char *warning_revalidation_failed = "111 - \"Revalidation Failed\"";

/**
 * A stale document which is being revalidated in a worker thread
 * while the stale copy is served.
 */
class HttpCache::RevalidateJob final : public ThreadJob {
public:
	HttpCache &cache;

	const std::string key;

	/**
	 * Identifies the variant in #HttpCache::jobs.
	 */
	const std::string id;

	const HttpHost host;

	HttpRequest request;

	const HttpCacheDocumentPtr document;

	RevalidateJob(HttpCache &_cache, const std::string &_key,
		      const HttpHost &_host, const HttpRequest &_request,
		      HttpCacheDocumentPtr &&_document)
		:cache(_cache), key(_key), id(_document->variant_key + _key),
		 host(_host), request(_request),
		 document(std::move(_document))
	{
		/* the client's conditions are irrelevant for
		   refreshing the cache */
		request.headers.Remove("if-match");
		request.headers.Remove("if-none-match");
		request.headers.Remove("if-modified-since");
		request.headers.Remove("if-unmodified-since");
		request.headers.Remove("if-range");

		/* fetch the representation the document contains */
		request.method = document->method;
	}

	/* virtual methods from class ThreadJob */
	void Run() noexcept override {
		cache.RunRevalidation(*this);
	}

	void Done() noexcept override {
		cache.OnRevalidationDone(*this);
	}
};

HttpCache::HttpCache(const HttpCacheConfig &_config, HttpCacheStorage &_storage,
		     ResourceLoader &_resource_loader, const Clock &_clock)
	:config(_config), storage(_storage),
	 resource_loader(_resource_loader), clock(_clock),
	 invalidator(storage)
{
	config.Check();

	if (config.worker_threads > 0)
		pool = std::make_unique<ThreadPool>(queue, config.worker_threads);
}

HttpCache::~HttpCache() noexcept
{
	{
		/* drop the jobs which have not been started yet; the
		   busy ones remove themselves in
		   OnRevalidationDone() */
		const std::scoped_lock lock{jobs_mutex};
		for (auto i = jobs.begin(); i != jobs.end();) {
			if (queue.Cancel(*i->second))
				i = jobs.erase(i);
			else
				++i;
		}
	}

	/* join the worker threads before the jobs are destroyed */
	pool.reset();
}

HttpCacheStats
HttpCache::GetStats() const noexcept
{
	return {
		n_hits.load(std::memory_order_relaxed),
		n_misses.load(std::memory_order_relaxed),
		n_updates.load(std::memory_order_relaxed),
		n_stale.load(std::memory_order_relaxed),
		n_storage_failures.load(std::memory_order_relaxed),
	};
}

[[gnu::pure]]
static bool
CheckETagList(const char *list, const StringMap &response_headers) noexcept
{
	assert(list != nullptr);

	if (std::string_view{list} == "*")
		return true;

	const char *etag = response_headers.Get("etag");
	return etag != nullptr && http_list_contains(list, etag);
}

static HttpResponse
MakeCacheResponse(HttpStatus status,
		  std::chrono::system_clock::time_point now)
{
	HttpResponse response(status);
	response.headers.Add("date", http_date_format(now));
	response.headers.Add("content-length", "0");
	response.request_time = response.response_time = now;
	return response;
}

static HttpResponse
MakeNotModified(const HttpCacheDocument &document, std::chrono::seconds age,
		std::chrono::system_clock::time_point now)
{
	HttpResponse response(HttpStatus::NOT_MODIFIED,
			      StringMap(document.response_headers));
	response.headers.Remove("content-length");
	response.headers.Set("age", fmt::to_string(age.count()));
	response.request_time = response.response_time = now;
	return response;
}

/**
 * Evaluate the client's own conditional request headers against the
 * cached document.
 *
 * @return the response to be sent instead of the document, or
 * std::nullopt if the document shall be served
 */
static std::optional<HttpResponse>
CheckCacheRequest(const HttpCacheRequestInfo &info,
		  const HttpCacheDocument &document,
		  std::chrono::seconds age,
		  std::chrono::system_clock::time_point now)
{
	bool ignore_if_modified_since = false;

	if (info.if_match != nullptr &&
	    !CheckETagList(info.if_match, document.response_headers))
		return MakeCacheResponse(HttpStatus::PRECONDITION_FAILED, now);

	if (info.if_none_match != nullptr) {
		if (CheckETagList(info.if_none_match, document.response_headers))
			return MakeNotModified(document, age, now);

		/* RFC 7232 3.3: "A recipient MUST ignore
		   If-Modified-Since if the request contains an
		   If-None-Match header field" */
		ignore_if_modified_since = true;
	}

	if (info.if_modified_since != nullptr && !ignore_if_modified_since) {
		const char *last_modified = document.GetLastModified();
		if (last_modified != nullptr) {
			if (std::string_view{info.if_modified_since} == last_modified)
				/* common fast path: client sends the
				   previous Last-Modified header string
				   as-is */
				return MakeNotModified(document, age, now);

			const auto ims = http_date_parse(info.if_modified_since);
			const auto lm = http_date_parse(last_modified);
			if (ims && lm && *lm <= *ims)
				return MakeNotModified(document, age, now);
		}
	}

	if (info.if_unmodified_since != nullptr) {
		const char *last_modified = document.GetLastModified();
		if (last_modified != nullptr) {
			const auto iums = http_date_parse(info.if_unmodified_since);
			const auto lm = http_date_parse(last_modified);
			if (iums && lm && *lm > *iums)
				return MakeCacheResponse(HttpStatus::PRECONDITION_FAILED,
							 now);
		}
	}

	return std::nullopt;
}

HttpResponse
HttpCache::Forward(const HttpHost &host, const HttpRequest &request)
{
	const auto request_time = clock.SystemNow();
	auto response = resource_loader.SendRequest(host, request);
	response.request_time = request_time;
	response.response_time = std::max(clock.SystemNow(), request_time);
	return response;
}

HttpCacheDocumentPtr
HttpCache::Lookup(const HttpRequest &request, const std::string &key)
{
	auto root = storage.Get(key);
	if (root == nullptr || !root->HasVary())
		return root;

	const auto variant_key = http_cache_variant_key(request, *root);

	if (auto i = root->variants.find(variant_key);
	    i != root->variants.end()) {
		auto variant = storage.Get(i->second);
		if (variant != nullptr)
			return variant;
	}

	/* the root document is a copy of the most recently stored
	   variant */
	if (root->variant_key == variant_key)
		return root;

	return nullptr;
}

void
HttpCache::Put(const std::string &key, HttpCacheDocumentPtr document)
{
	assert(document != nullptr);

	const auto old_root = storage.Get(key);

	if (!document->HasVary()) {
		/* the resource has no variants (anymore) */
		if (old_root != nullptr)
			for (const auto &[variant_key, id] : old_root->variants)
				storage.Remove(id);

		storage.Put(key, std::move(document));
		return;
	}

	HttpCacheDocument::VariantMap variants;
	if (old_root != nullptr) {
		if (old_root->vary == document->vary)
			variants = old_root->variants;
		else
			/* "Vary" has changed, and the old variant
			   keys cannot be matched anymore */
			for (const auto &[variant_key, id] : old_root->variants)
				storage.Remove(id);
	}

	std::string id = document->variant_key + key;
	storage.Put(id, document);

	variants.insert_or_assign(document->variant_key, std::move(id));
	storage.Put(key,
		    std::make_shared<const HttpCacheDocument>(*document,
							      std::move(variants)));
}

void
HttpCache::Store(const HttpRequest &request, const std::string &key,
		 const HttpResponse &response, bool replace) noexcept
try {
	const auto vary = http_cache_parse_vary(response.headers);

	std::string variant_key;
	if (!vary.empty())
		variant_key = http_cache_variant_key(request.headers, vary);

	if (replace) {
		Put(key, http_cache_replace_document(request, response,
						     std::move(variant_key)));
		logger.Fmt(4, "replace {}", key);
	} else {
		Put(key, http_cache_new_document(request, response,
						 std::move(variant_key)));
		logger.Fmt(4, "put {}", key);
	}
} catch (const std::invalid_argument &) {
	logger(2, "Not storing malformed response", std::current_exception());
} catch (...) {
	++n_storage_failures;
	logger(2, "Failed to store response", std::current_exception());
}

void
HttpCache::Remove(const std::string &key) noexcept
try {
	invalidator.Remove(key);
} catch (...) {
	++n_storage_failures;
	logger(2, "Failed to remove cache entry", std::current_exception());
}

HttpResponse
HttpCache::SendRequest(const HttpHost &host, const HttpRequest &request)
{
	HttpCacheContext context;
	return SendRequest(host, request, context);
}

HttpResponse
HttpCache::SendRequest(const HttpHost &host, const HttpRequest &request,
		       HttpCacheContext &context)
{
	const auto key = http_cache_key(host, request);

	try {
		return Dispatch(host, request, key, context);
	} catch (...) {
		context.status = CacheResponseStatus::FAILURE;
		std::throw_with_nested(std::runtime_error(fmt::format("http_cache {}",
								      key)));
	}
}

HttpResponse
HttpCache::Dispatch(const HttpHost &host, const HttpRequest &request,
		    const std::string &key, HttpCacheContext &context)
{
	context.status = CacheResponseStatus::CACHE_MISS;

	HttpCacheRequestInfo info;
	if (/* don't cache a huge request URI; probably it contains
	       lots and lots of unique parameters, and that's not
	       worth the cache space anyway */
	    key.size() > config.max_key_length ||
	    !http_cache_request_evaluate(info, config, request)) {
		logger.Fmt(4, "ignore {}", key);

		invalidator.OnRequest(host, request);
		auto response = Forward(host, request);
		invalidator.OnResponse(host, request, response);
		return response;
	}

	HttpCacheDocumentPtr document;
	try {
		document = Lookup(request, key);
	} catch (...) {
		++n_storage_failures;
		logger(2, "Cache lookup failed", std::current_exception());
		return Forward(host, request);
	}

	if (document != nullptr && document->method == HttpMethod::HEAD &&
	    request.method != HttpMethod::HEAD)
		/* a response to HEAD has no body */
		document = nullptr;

	if (document == nullptr)
		return Miss(host, request, info, key, context);

	return Found(host, request, info, key, std::move(document), context);
}

HttpResponse
HttpCache::Miss(const HttpHost &host, const HttpRequest &request,
		const HttpCacheRequestInfo &info,
		const std::string &key, HttpCacheContext &context)
{
	if (info.cache_control.only_if_cached) {
		/* RFC 7234 5.2.1.7 */
		logger.Fmt(4, "only_if_cached {}", key);
		context.status = CacheResponseStatus::CACHE_MODULE_RESPONSE;
		return MakeCacheResponse(HttpStatus::GATEWAY_TIMEOUT,
					 clock.SystemNow());
	}

	logger.Fmt(4, "miss {}", key);
	++n_misses;
	context.status = CacheResponseStatus::CACHE_MISS;

	auto response = Forward(host, request);
	invalidator.OnResponse(host, request, response);

	if (http_cache_response_evaluate(config, info, request, response))
		Store(request, key, response);
	else
		logger.Fmt(4, "nocache {}", key);

	return response;
}

HttpResponse
HttpCache::Found(const HttpHost &host, const HttpRequest &request,
		 const HttpCacheRequestInfo &info,
		 const std::string &key,
		 HttpCacheDocumentPtr document,
		 HttpCacheContext &context)
{
	const auto now = clock.SystemNow();
	const auto &request_cc = info.cache_control;
	const auto lifetime = http_cache_freshness_lifetime(config, *document);
	const auto age = http_cache_current_age(*document, now);

	const bool force_revalidate = request_cc.no_cache ||
		document->cache_control.no_cache;

	bool fresh = age < lifetime;

	if (request_cc.max_age &&
	    (request_cc.max_age->count() == 0 || age > *request_cc.max_age))
		/* the client doesn't accept a response this old */
		fresh = false;

	if (request_cc.min_fresh && age + *request_cc.min_fresh > lifetime)
		/* the client wants a response which will still be
		   fresh for the specified time */
		fresh = false;

	if (fresh && !force_revalidate) {
		++n_hits;
		context.status = CacheResponseStatus::CACHE_HIT;
		return Serve(request, info, key, *document, context);
	}

	if (!force_revalidate && age >= lifetime &&
	    !http_cache_stale_forbidden(config, *document)) {
		const auto staleness = age - lifetime;

		if (request_cc.only_if_cached || request_cc.max_stale_any ||
		    (request_cc.max_stale && staleness <= *request_cc.max_stale)) {
			/* the client accepts a stale response */
			++n_hits;
			++n_stale;
			context.status = CacheResponseStatus::CACHE_HIT;
			return Serve(request, info, key, *document, context,
				     warning_stale);
		}

		if (pool != nullptr &&
		    http_cache_may_stale_while_revalidate(config, *document, now)) {
			logger.Fmt(4, "stale_while_revalidate {}", key);
			ScheduleRevalidation(host, request, key, document);

			++n_hits;
			++n_stale;
			context.status = CacheResponseStatus::CACHE_HIT;
			return Serve(request, info, key, *document, context,
				     warning_stale);
		}
	}

	if (request_cc.only_if_cached) {
		logger.Fmt(4, "only_if_cached {}", key);
		context.status = CacheResponseStatus::CACHE_MODULE_RESPONSE;
		return MakeCacheResponse(HttpStatus::GATEWAY_TIMEOUT, now);
	}

	return Revalidate(host, request, info, key, std::move(document),
			  context);
}

HttpResponse
HttpCache::Serve(const HttpRequest &request,
		 const HttpCacheRequestInfo &info,
		 const std::string &key,
		 const HttpCacheDocument &document,
		 HttpCacheContext &context,
		 const char *warning)
{
	const auto now = clock.SystemNow();
	const auto age = http_cache_current_age(document, now);

	if (auto response = CheckCacheRequest(info, document, age, now)) {
		logger.Fmt(4, "conditional {} {}", key,
			   static_cast<unsigned>(response->status));
		context.status = CacheResponseStatus::CACHE_MODULE_RESPONSE;
		return std::move(*response);
	}

	logger.Fmt(4, "serve {}", key);

	HttpResponse response(document.status,
			      StringMap(document.response_headers),
			      request.method == HttpMethod::HEAD
			      ? nullptr
			      : document.body);
	response.headers.Set("age", fmt::to_string(age.count()));
	if (warning != nullptr)
		response.headers.Add("warning", warning);

	response.request_time = document.request_time;
	response.response_time = document.response_time;
	return response;
}

HttpCacheDocumentPtr
HttpCache::NotModified(const std::string &key,
		       const HttpCacheDocumentPtr &document,
		       const HttpResponse &response) noexcept
{
	HttpCacheDocumentPtr updated;

	try {
		updated = http_cache_update_document(document, response);
	} catch (...) {
		logger(2, "Failed to update cache entry", std::current_exception());
		return document;
	}

	logger.Fmt(4, "not_modified {}", key);

	if (updated == document)
		/* out-of-order response */
		return document;

	try {
		Put(key, updated);
	} catch (...) {
		++n_storage_failures;
		logger(2, "Failed to store cache entry", std::current_exception());
	}

	return updated;
}

HttpResponse
HttpCache::Revalidate(const HttpHost &host, const HttpRequest &request,
		      const HttpCacheRequestInfo &info,
		      const std::string &key,
		      HttpCacheDocumentPtr document,
		      HttpCacheContext &context)
{
	logger.Fmt(4, "test {}", key);

	HttpResponse response;

	try {
		response = Forward(host, http_cache_build_conditional(request,
								      *document));
	} catch (...) {
		if (!http_cache_may_stale_if_error(config, *document,
						   clock.SystemNow(),
						   &info.cache_control))
			throw;

		logger(2, "Revalidation failed, serving stale response",
		       std::current_exception());
		++n_stale;
		context.status = CacheResponseStatus::CACHE_HIT;
		return Serve(request, info, key, *document, context,
			     warning_revalidation_failed);
	}

	invalidator.OnResponse(host, request, response);

	if (response.status == HttpStatus::NOT_MODIFIED) {
		if (http_cache_etag_mismatch(*document, response)) {
			const char *etag = response.headers.Get("etag");
			if (info.if_none_match != nullptr && etag != nullptr &&
			    http_list_contains(info.if_none_match, etag)) {
				/* this "304" answers the client's own
				   condition, not ours */
				logger.Fmt(4, "not_modified_client {}", key);
				context.status = CacheResponseStatus::CACHE_MISS;
				return response;
			}

			if (config.etag_mismatch_policy == HttpCacheEtagMismatchPolicy::DISCARD) {
				logger.Fmt(4, "etag_mismatch {}", key);
				Remove(key);

				++n_misses;
				context.status = CacheResponseStatus::CACHE_MISS;

				response = Forward(host,
						   http_cache_build_unconditional(request));
				invalidator.OnResponse(host, request, response);

				if (http_cache_response_evaluate(config, info,
								 request, response))
					Store(request, key, response, true);
				else
					logger.Fmt(4, "nocache {}", key);

				return response;
			}
		}

		const auto updated = NotModified(key, document, response);
		++n_updates;
		context.status = CacheResponseStatus::VALIDATED;
		return Serve(request, info, key, *updated, context);
	}

	if (http_status_is_server_error(response.status) &&
	    http_cache_may_stale_if_error(config, *document, clock.SystemNow(),
					  &info.cache_control)) {
		logger.Fmt(3, "Revalidation of {} failed with status {}, serving stale response",
			   key, static_cast<unsigned>(response.status));
		++n_stale;
		context.status = CacheResponseStatus::CACHE_HIT;
		return Serve(request, info, key, *document, context,
			     warning_revalidation_failed);
	}

	context.status = CacheResponseStatus::CACHE_MISS;

	if (request.method != document->method)
		/* a response to HEAD cannot replace a GET document */
		return response;

	if (http_cache_response_evaluate(config, info, request, response)) {
		Store(request, key, response, true);
	} else if (!http_status_is_server_error(response.status)) {
		logger.Fmt(4, "nocache {}", key);
		Remove(key);
	}

	return response;
}

void
HttpCache::ScheduleRevalidation(const HttpHost &host,
				const HttpRequest &request,
				const std::string &key,
				HttpCacheDocumentPtr document) noexcept
try {
	const std::scoped_lock lock{jobs_mutex};

	std::string id = document->variant_key + key;
	if (jobs.find(id) != jobs.end()) {
		logger.Fmt(5, "already revalidating {}", id);
		return;
	}

	auto job = std::make_unique<RevalidateJob>(*this, key, host, request,
						   std::move(document));
	auto &j = *job;
	jobs.emplace(std::move(id), std::move(job));

	if (!queue.Add(j))
		/* shutting down */
		jobs.erase(jobs.find(j.id));
} catch (...) {
	logger(2, "Failed to schedule revalidation", std::current_exception());
}

void
HttpCache::RunRevalidation(RevalidateJob &job) noexcept
try {
	logger.Fmt(4, "background_test {}", job.key);

	HttpCacheRequestInfo info;
	if (!http_cache_request_evaluate(info, config, job.request))
		return;

	const auto response =
		Forward(job.host,
			http_cache_build_conditional(job.request, *job.document));
	invalidator.OnResponse(job.host, job.request, response);

	if (response.status == HttpStatus::NOT_MODIFIED) {
		if (http_cache_etag_mismatch(*job.document, response) &&
		    config.etag_mismatch_policy == HttpCacheEtagMismatchPolicy::DISCARD) {
			/* the next request will fetch a new copy */
			logger.Fmt(4, "etag_mismatch {}", job.key);
			Remove(job.key);
			return;
		}

		NotModified(job.key, job.document, response);
		++n_updates;
	} else if (http_cache_response_evaluate(config, info, job.request,
						response)) {
		Store(job.request, job.key, response, true);
	} else if (!http_status_is_server_error(response.status)) {
		logger.Fmt(4, "nocache {}", job.key);
		Remove(job.key);
	}
} catch (...) {
	logger(2, "Background revalidation failed", std::current_exception());
}

void
HttpCache::OnRevalidationDone(RevalidateJob &job) noexcept
{
	std::unique_ptr<RevalidateJob> p;

	{
		const std::scoped_lock lock{jobs_mutex};
		auto i = jobs.find(job.id);
		assert(i != jobs.end() && i->second.get() == &job);

		p = std::move(i->second);
		jobs.erase(i);
	}

	jobs_cond.notify_all();

	/* the job is destroyed here */
}

void
HttpCache::WaitIdle() noexcept
{
	std::unique_lock lock{jobs_mutex};
	jobs_cond.wait(lock, [this]{ return jobs.empty(); });
}
