// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/intrusive/list_hook.hpp>

/**
 * A job that shall be executed in a worker thread.
 */
class ThreadJob
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::normal_link>> {
public:
	enum class State {
		/**
		 * The job is not in any queue.
		 */
		INITIAL,

		/**
		 * The job has been added to the queue, but is not being
		 * worked on yet.
		 */
		WAITING,

		/**
		 * The job is being performed via Run().
		 */
		BUSY,
	};

	State state = State::INITIAL;

	ThreadJob() = default;

	ThreadJob(const ThreadJob &) = delete;
	ThreadJob &operator=(const ThreadJob &) = delete;

	/**
	 * Is this job currently idle, i.e. not being worked on by a
	 * worker thread?  The caller must hold the queue's lock or
	 * know that the job has never been enqueued.
	 */
	bool IsIdle() const noexcept {
		return state == State::INITIAL;
	}

	/**
	 * Do the actual work.  This runs in a worker thread.
	 */
	virtual void Run() noexcept = 0;

	/**
	 * The job has finished and has been removed from the queue.
	 * This runs in the worker thread which has invoked Run(), and
	 * the method may destroy the job.
	 */
	virtual void Done() noexcept = 0;

protected:
	~ThreadJob() noexcept = default;
};
