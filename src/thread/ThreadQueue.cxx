// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ThreadQueue.hxx"

#include <cassert>

ThreadQueue::~ThreadQueue() noexcept
{
	assert(!alive || (waiting.empty() && busy.empty()));

	waiting.clear_and_dispose([](ThreadJob *job){
		job->state = ThreadJob::State::INITIAL;
	});
}

void
ThreadQueue::Stop() noexcept
{
	const std::scoped_lock lock{mutex};
	alive = false;

	waiting.clear_and_dispose([](ThreadJob *job){
		job->state = ThreadJob::State::INITIAL;
	});

	cond.notify_all();
}

bool
ThreadQueue::Add(ThreadJob &job) noexcept
{
	const std::scoped_lock lock{mutex};
	if (!alive)
		return false;

	assert(job.state != ThreadJob::State::BUSY);

	if (job.state == ThreadJob::State::INITIAL) {
		job.state = ThreadJob::State::WAITING;
		waiting.push_back(job);
		cond.notify_one();
	}

	return true;
}

ThreadJob *
ThreadQueue::Wait() noexcept
{
	std::unique_lock lock{mutex};

	while (true) {
		if (!alive)
			return nullptr;

		auto i = waiting.begin();
		if (i != waiting.end()) {
			auto &job = *i;
			assert(job.state == ThreadJob::State::WAITING);

			job.state = ThreadJob::State::BUSY;
			waiting.erase(i);
			busy.push_back(job);
			return &job;
		}

		/* queue is empty, wait for a new job to be added */
		cond.wait(lock);
	}
}

void
ThreadQueue::Done(ThreadJob &job) noexcept
{
	const std::scoped_lock lock{mutex};

	assert(job.state == ThreadJob::State::BUSY);

	busy.erase(busy.iterator_to(job));
	job.state = ThreadJob::State::INITIAL;
}

bool
ThreadQueue::Cancel(ThreadJob &job) noexcept
{
	const std::scoped_lock lock{mutex};

	switch (job.state) {
	case ThreadJob::State::INITIAL:
		/* already idle */
		return true;

	case ThreadJob::State::WAITING:
		/* cancel it */
		waiting.erase(waiting.iterator_to(job));
		job.state = ThreadJob::State::INITIAL;
		return true;

	case ThreadJob::State::BUSY:
		/* no chance */
		return false;
	}

	return false;
}
