// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ThreadPool.hxx"
#include "ThreadQueue.hxx"
#include "Logger.hxx"

ThreadPool::ThreadPool(ThreadQueue &_queue, unsigned n_threads)
	:queue(_queue)
{
	workers.reserve(n_threads);

	try {
		for (unsigned i = 0; i < n_threads; ++i)
			workers.emplace_back(&ThreadPool::Run, this);
	} catch (...) {
		StopAndJoin();
		throw;
	}

	LogFmt(5, "ThreadQueue", "launched {} worker threads", n_threads);
}

ThreadPool::~ThreadPool() noexcept
{
	StopAndJoin();
}

void
ThreadPool::StopAndJoin() noexcept
{
	queue.Stop();

	for (auto &i : workers)
		if (i.joinable())
			i.join();

	workers.clear();
}

void
ThreadPool::Run() noexcept
{
	ThreadJob *job;
	while ((job = queue.Wait()) != nullptr) {
		job->Run();
		queue.Done(*job);

		/* this may destroy the job */
		job->Done();
	}
}
