// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <thread>
#include <vector>

class ThreadQueue;

/**
 * A set of worker threads which perform the jobs of one
 * #ThreadQueue.
 */
class ThreadPool {
	ThreadQueue &queue;

	std::vector<std::thread> workers;

public:
	/**
	 * Launch the worker threads.
	 *
	 * Throws std::system_error on error.
	 */
	ThreadPool(ThreadQueue &_queue, unsigned n_threads);

	/**
	 * Stops the queue and waits for all worker threads to exit.
	 */
	~ThreadPool() noexcept;

	ThreadPool(const ThreadPool &) = delete;
	ThreadPool &operator=(const ThreadPool &) = delete;

	std::size_t size() const noexcept {
		return workers.size();
	}

	/**
	 * Stop the queue and wait for all worker threads to exit.
	 * Jobs which are being worked on are finished first.
	 */
	void StopAndJoin() noexcept;

private:
	void Run() noexcept;
};
