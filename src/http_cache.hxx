// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Caching HTTP responses.
 */

#pragma once

#include "http_cache_config.hxx"
#include "http_cache_document.hxx"
#include "http_cache_invalidate.hxx"
#include "thread/ThreadQueue.hxx"
#include "Logger.hxx"
#include "hcache/CacheStatus.hxx"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

class Clock;
class HttpCacheStorage;
class ResourceLoader;
class ThreadPool;
struct HttpCacheRequestInfo;
struct HttpHost;
struct HttpRequest;
struct HttpResponse;

struct HttpCacheStats {
	uint64_t hits, misses;

	/**
	 * The number of entries which were revalidated successfully.
	 */
	uint64_t updates;

	/**
	 * The number of stale responses which were served.
	 */
	uint64_t stale;

	uint64_t storage_failures;
};

/**
 * Information about how a response was produced.
 */
struct HttpCacheContext {
	Hcache::CacheResponseStatus status = Hcache::CacheResponseStatus::CACHE_MISS;
};

/**
 * A HTTP client cache (RFC 7234).  It sits in front of a
 * #ResourceLoader, serves responses from a #HttpCacheStorage and
 * revalidates stale ones.  All methods are thread-safe.
 */
class HttpCache {
	class RevalidateJob;

	const Logger logger{"HttpCache"};

	const HttpCacheConfig config;

	HttpCacheStorage &storage;
	ResourceLoader &resource_loader;
	const Clock &clock;

	HttpCacheInvalidator invalidator;

	std::atomic<uint64_t> n_hits{0}, n_misses{0}, n_updates{0};
	std::atomic<uint64_t> n_stale{0}, n_storage_failures{0};

	ThreadQueue queue;

	std::mutex jobs_mutex;
	std::condition_variable jobs_cond;

	/**
	 * Pending background revalidations, indexed by the variant
	 * key followed by the cache key.
	 * Protected by #jobs_mutex.
	 */
	std::map<std::string, std::unique_ptr<RevalidateJob>, std::less<>> jobs;

	/**
	 * The worker threads for background revalidation; nullptr if
	 * disabled.  This must be the last member, because
	 * destroying it joins the threads which access the other
	 * members.
	 */
	std::unique_ptr<ThreadPool> pool;

public:
	/**
	 * Throws std::runtime_error if the configuration is invalid
	 * or if a worker thread could not be launched.
	 */
	HttpCache(const HttpCacheConfig &_config, HttpCacheStorage &_storage,
		  ResourceLoader &_resource_loader, const Clock &_clock);

	/**
	 * Stops the background revalidation; pending jobs are
	 * dropped.
	 */
	~HttpCache() noexcept;

	HttpCache(const HttpCache &) = delete;
	HttpCache &operator=(const HttpCache &) = delete;

	const HttpCacheConfig &GetConfig() const noexcept {
		return config;
	}

	[[gnu::pure]]
	HttpCacheStats GetStats() const noexcept;

	/**
	 * Send a request, consulting the cache.
	 *
	 * Throws if the request to the origin server has failed and
	 * no cached response may be served instead.
	 */
	HttpResponse SendRequest(const HttpHost &host,
				 const HttpRequest &request);

	HttpResponse SendRequest(const HttpHost &host,
				 const HttpRequest &request,
				 HttpCacheContext &context);

	/**
	 * Wait until all pending background revalidations have
	 * finished.
	 */
	void WaitIdle() noexcept;

private:
	HttpResponse Dispatch(const HttpHost &host, const HttpRequest &request,
			      const std::string &key, HttpCacheContext &context);

	/**
	 * Send the request to the origin server and fill in the
	 * response's timestamps.
	 */
	HttpResponse Forward(const HttpHost &host, const HttpRequest &request);

	/**
	 * Find the document (or the variant) matching the request.
	 *
	 * Throws on storage error.
	 */
	HttpCacheDocumentPtr Lookup(const HttpRequest &request,
				    const std::string &key);

	/**
	 * Store a document under the specified key.  Variants are
	 * stored under their own key, and the root document at the
	 * base key is replaced with a copy which lists all variants.
	 *
	 * Throws on storage error.
	 */
	void Put(const std::string &key, HttpCacheDocumentPtr document);

	/**
	 * Build a document from the response and store it.  Errors
	 * are logged.
	 *
	 * @param replace true if the response is a full answer to a
	 * revalidation and replaces the stored document
	 */
	void Store(const HttpRequest &request, const std::string &key,
		   const HttpResponse &response, bool replace=false) noexcept;

	/**
	 * Remove the entry with all of its variants.  Errors are
	 * logged.
	 */
	void Remove(const std::string &key) noexcept;

	HttpResponse Miss(const HttpHost &host, const HttpRequest &request,
			  const HttpCacheRequestInfo &info,
			  const std::string &key, HttpCacheContext &context);

	HttpResponse Found(const HttpHost &host, const HttpRequest &request,
			   const HttpCacheRequestInfo &info,
			   const std::string &key,
			   HttpCacheDocumentPtr document,
			   HttpCacheContext &context);

	HttpResponse Serve(const HttpRequest &request,
			   const HttpCacheRequestInfo &info,
			   const std::string &key,
			   const HttpCacheDocument &document,
			   HttpCacheContext &context,
			   const char *warning=nullptr);

	HttpResponse Revalidate(const HttpHost &host,
				const HttpRequest &request,
				const HttpCacheRequestInfo &info,
				const std::string &key,
				HttpCacheDocumentPtr document,
				HttpCacheContext &context);

	/**
	 * Merge a "304 Not Modified" response into the document and
	 * store the result.
	 *
	 * @return the new document
	 */
	HttpCacheDocumentPtr NotModified(const std::string &key,
					 const HttpCacheDocumentPtr &document,
					 const HttpResponse &response) noexcept;

	void ScheduleRevalidation(const HttpHost &host,
				  const HttpRequest &request,
				  const std::string &key,
				  HttpCacheDocumentPtr document) noexcept;

	void RunRevalidation(RevalidateJob &job) noexcept;
	void OnRevalidationDone(RevalidateJob &job) noexcept;
};
