// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ThreadJob.hxx"

#include <boost/intrusive/list.hpp>

#include <condition_variable>
#include <mutex>

/**
 * A queue that manages work for worker threads.
 */
class ThreadQueue {
	std::mutex mutex;
	std::condition_variable cond;

	bool alive = true;

	using JobList =
		boost::intrusive::list<ThreadJob,
				       boost::intrusive::constant_time_size<false>>;

	JobList waiting, busy;

public:
	ThreadQueue() = default;
	~ThreadQueue() noexcept;

	ThreadQueue(const ThreadQueue &) = delete;
	ThreadQueue &operator=(const ThreadQueue &) = delete;

	/**
	 * Cancel all Wait() calls and refuse all further calls.  This
	 * is used to initiate shutdown of all threads connected to
	 * this queue.  Jobs which are still waiting are dropped from
	 * the queue; their Done() method is not invoked.
	 */
	void Stop() noexcept;

	/**
	 * Enqueue a job, and wake up an idle thread (if there is
	 * any).  The job must not be busy.
	 *
	 * @return false if the queue has been stopped
	 */
	bool Add(ThreadJob &job) noexcept;

	/**
	 * Dequeue an existing job or wait for a new job, and reserve
	 * it.
	 *
	 * @return nullptr if Stop() has been called
	 */
	ThreadJob *Wait() noexcept;

	/**
	 * Mark the specified job (returned by Wait()) as "done".  It
	 * is idle afterwards, and the caller shall invoke its Done()
	 * method.
	 */
	void Done(ThreadJob &job) noexcept;

	/**
	 * Cancel a job that has been queued.
	 *
	 * @return true if the job is now canceled, false if the job is
	 * currently being processed
	 */
	bool Cancel(ThreadJob &job) noexcept;
};
