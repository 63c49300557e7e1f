// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http_cache_document.hxx"

#include <stdexcept>
#include <string>

/**
 * Thrown by #HttpCacheStorage implementations when the storage is
 * unavailable or failed.
 */
class HttpCacheStorageError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * The key/value store which holds the cached documents.  The
 * implementation must be thread-safe.
 */
class HttpCacheStorage {
public:
	virtual ~HttpCacheStorage() noexcept = default;

	/**
	 * Look up a document.
	 *
	 * Throws on error (usually #HttpCacheStorageError).
	 *
	 * @return the document or nullptr if there is none
	 */
	virtual HttpCacheDocumentPtr Get(const std::string &key) = 0;

	/**
	 * Store a document, replacing the existing one.
	 *
	 * Throws on error (usually #HttpCacheStorageError).
	 */
	virtual void Put(const std::string &key,
			 HttpCacheDocumentPtr document) = 0;

	/**
	 * Remove a document (if it exists).
	 *
	 * Throws on error (usually #HttpCacheStorageError).
	 */
	virtual void Remove(const std::string &key) = 0;
};
