// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ResourceLoader.hxx"
#include "http/Host.hxx"
#include "http/Request.hxx"
#include "http/Response.hxx"

#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

/**
 * A #ResourceLoader which replies with prepared responses (or
 * errors) and records all requests.
 */
class MockResourceLoader final : public ResourceLoader {
	mutable std::mutex mutex;

	std::deque<std::variant<HttpResponse, std::string>> replies;

	std::vector<HttpRequest> requests;

public:
	void Enqueue(HttpResponse &&response) {
		const std::scoped_lock lock{mutex};
		replies.emplace_back(std::move(response));
	}

	/**
	 * The next request fails with the specified error message.
	 */
	void EnqueueError(std::string message) {
		const std::scoped_lock lock{mutex};
		replies.emplace_back(std::move(message));
	}

	std::size_t GetRequestCount() const noexcept {
		const std::scoped_lock lock{mutex};
		return requests.size();
	}

	HttpRequest GetRequest(std::size_t i) const {
		const std::scoped_lock lock{mutex};
		return requests.at(i);
	}

	HttpRequest GetLastRequest() const {
		const std::scoped_lock lock{mutex};
		return requests.back();
	}

	std::size_t GetPendingCount() const noexcept {
		const std::scoped_lock lock{mutex};
		return replies.size();
	}

	/* virtual methods from class ResourceLoader */
	HttpResponse SendRequest(const HttpHost &,
				 const HttpRequest &request) override {
		const std::scoped_lock lock{mutex};
		requests.push_back(request);

		if (replies.empty())
			throw std::runtime_error("Unexpected request: " + request.uri);

		auto reply = std::move(replies.front());
		replies.pop_front();

		if (auto *error = std::get_if<std::string>(&reply))
			throw std::runtime_error(*error);

		return std::get<HttpResponse>(std::move(reply));
	}
};
