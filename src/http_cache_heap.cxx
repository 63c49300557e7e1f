// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http_cache_heap.hxx"

#include <cassert>

HttpCacheHeap::HttpCacheHeap(std::size_t _max_entries,
			     std::size_t _max_size) noexcept
	:max_entries(_max_entries), max_size(_max_size)
{
	assert(max_entries > 0);
	assert(max_size > 0);
}

HttpCacheHeap::~HttpCacheHeap() noexcept
{
	sorted_items.clear();
}

HttpCacheHeapStats
HttpCacheHeap::GetStats() const noexcept
{
	const std::scoped_lock lock{mutex};
	return {items.size(), size, n_evictions};
}

void
HttpCacheHeap::Flush() noexcept
{
	const std::scoped_lock lock{mutex};

	sorted_items.clear();
	items.clear();
	size = 0;
}

HttpCacheDocumentPtr
HttpCacheHeap::Get(const std::string &key)
{
	const std::scoped_lock lock{mutex};

	auto i = items.find(key);
	if (i == items.end())
		return nullptr;

	/* move to the end of the list (most recently used) */
	auto &item = i->second;
	sorted_items.erase(sorted_items.iterator_to(item));
	sorted_items.push_back(item);

	return item.document;
}

void
HttpCacheHeap::Put(const std::string &key, HttpCacheDocumentPtr document)
{
	assert(document != nullptr);

	const std::size_t item_size = key.size() + document->GetSize();

	const bool too_large = item_size > max_size;
	std::size_t n_evicted = 0;

	{
		const std::scoped_lock lock{mutex};

		if (auto i = items.find(key); i != items.end())
			RemoveItem(i);

		if (!too_large) {
			auto [i, inserted] = items.try_emplace(key, key,
							       std::move(document),
							       item_size);
			assert(inserted);

			sorted_items.push_back(i->second);
			size += item_size;

			n_evicted = Shrink();
		}
	}

	/* log without holding the lock */
	if (too_large)
		logger.Fmt(4, "too large: {}", key);
	else if (n_evicted > 0)
		logger.Fmt(5, "evicted {} items for {}", n_evicted, key);
}

void
HttpCacheHeap::Remove(const std::string &key)
{
	const std::scoped_lock lock{mutex};

	if (auto i = items.find(key); i != items.end())
		RemoveItem(i);
}

void
HttpCacheHeap::RemoveItem(std::unordered_map<std::string, Item>::iterator i) noexcept
{
	auto &item = i->second;

	assert(size >= item.size);
	size -= item.size;

	sorted_items.erase(sorted_items.iterator_to(item));
	items.erase(i);
}

std::size_t
HttpCacheHeap::Shrink() noexcept
{
	std::size_t n = 0;

	while (!sorted_items.empty() &&
	       (items.size() > max_entries || size > max_size)) {
		auto &oldest = sorted_items.front();

		++n;
		RemoveItem(items.find(oldest.key));
	}

	n_evictions += n;
	return n;
}
