// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http_cache_storage.hxx"
#include "Logger.hxx"

#include <boost/intrusive/list.hpp>

#include <cstddef>
#include <mutex>
#include <unordered_map>

struct HttpCacheHeapStats {
	std::size_t n_entries, size;
	std::size_t n_evictions;
};

/**
 * Caching HTTP responses in heap memory.  The least recently used
 * documents are evicted when one of the limits is exceeded.
 */
class HttpCacheHeap final : public HttpCacheStorage {
	struct Item {
		static constexpr auto link_mode = boost::intrusive::normal_link;
		using LinkMode = boost::intrusive::link_mode<link_mode>;
		using SiblingsHook = boost::intrusive::list_member_hook<LinkMode>;
		SiblingsHook siblings;

		const std::string key;

		HttpCacheDocumentPtr document;

		std::size_t size;

		Item(const std::string &_key, HttpCacheDocumentPtr &&_document,
		     std::size_t _size) noexcept
			:key(_key), document(std::move(_document)), size(_size) {}

		Item(const Item &) = delete;
		Item &operator=(const Item &) = delete;
	};

	const Logger logger{"HttpCacheHeap"};

	const std::size_t max_entries, max_size;

	mutable std::mutex mutex;

	std::unordered_map<std::string, Item> items;

	/**
	 * All items, sorted by last access, oldest first.
	 */
	boost::intrusive::list<Item,
			       boost::intrusive::member_hook<Item,
							     Item::SiblingsHook,
							     &Item::siblings>,
			       boost::intrusive::constant_time_size<false>> sorted_items;

	std::size_t size = 0;

	std::size_t n_evictions = 0;

public:
	HttpCacheHeap(std::size_t _max_entries, std::size_t _max_size) noexcept;
	~HttpCacheHeap() noexcept override;

	HttpCacheHeap(const HttpCacheHeap &) = delete;
	HttpCacheHeap &operator=(const HttpCacheHeap &) = delete;

	[[gnu::pure]]
	HttpCacheHeapStats GetStats() const noexcept;

	/**
	 * Remove all documents.
	 */
	void Flush() noexcept;

	/* virtual methods from class HttpCacheStorage */
	HttpCacheDocumentPtr Get(const std::string &key) override;
	void Put(const std::string &key, HttpCacheDocumentPtr document) override;
	void Remove(const std::string &key) override;

private:
	void RemoveItem(std::unordered_map<std::string, Item>::iterator i) noexcept;

	/**
	 * Evict the least recently used items until all limits are
	 * met.  The caller must hold the lock.
	 *
	 * @return the number of evicted items
	 */
	std::size_t Shrink() noexcept;
};
