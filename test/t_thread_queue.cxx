// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "thread/ThreadJob.hxx"
#include "thread/ThreadQueue.hxx"
#include "thread/ThreadPool.hxx"

#include <gtest/gtest.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace {

struct CountingJob final : ThreadJob {
	unsigned n_runs = 0, n_done = 0;

	void Run() noexcept override {
		++n_runs;
	}

	void Done() noexcept override {
		++n_done;
	}
};

/**
 * A job which signals its completion to the test thread.
 */
class NotifyingJob final : public ThreadJob {
	std::mutex &mutex;
	std::condition_variable &cond;
	unsigned &n_finished;

public:
	bool ran = false;

	NotifyingJob(std::mutex &_mutex, std::condition_variable &_cond,
		     unsigned &_n_finished) noexcept
		:mutex(_mutex), cond(_cond), n_finished(_n_finished) {}

	void Run() noexcept override {
		ran = true;
	}

	void Done() noexcept override {
		const std::scoped_lock lock{mutex};
		++n_finished;
		cond.notify_all();
	}
};

}

TEST(ThreadQueue, Basic)
{
	ThreadQueue queue;
	CountingJob a, b;

	EXPECT_TRUE(a.IsIdle());
	EXPECT_TRUE(queue.Add(a));
	EXPECT_EQ(a.state, ThreadJob::State::WAITING);

	/* adding twice is a no-op */
	EXPECT_TRUE(queue.Add(a));
	EXPECT_TRUE(queue.Add(b));

	/* first in, first out */
	ThreadJob *job = queue.Wait();
	ASSERT_EQ(job, &a);
	EXPECT_EQ(a.state, ThreadJob::State::BUSY);
	queue.Done(*job);
	EXPECT_TRUE(a.IsIdle());

	job = queue.Wait();
	ASSERT_EQ(job, &b);
	queue.Done(*job);

	queue.Stop();
}

TEST(ThreadQueue, Cancel)
{
	ThreadQueue queue;
	CountingJob a, b;

	EXPECT_TRUE(queue.Cancel(a));

	ASSERT_TRUE(queue.Add(a));
	ASSERT_TRUE(queue.Add(b));
	EXPECT_TRUE(queue.Cancel(a));
	EXPECT_TRUE(a.IsIdle());

	ASSERT_EQ(queue.Wait(), &b);
	EXPECT_FALSE(queue.Cancel(b));
	queue.Done(b);
	EXPECT_TRUE(b.IsIdle());

	queue.Stop();
}

TEST(ThreadQueue, Stop)
{
	ThreadQueue queue;
	CountingJob a, b;

	ASSERT_TRUE(queue.Add(a));
	queue.Stop();

	/* waiting jobs are dropped */
	EXPECT_TRUE(a.IsIdle());
	EXPECT_EQ(queue.Wait(), nullptr);
	EXPECT_FALSE(queue.Add(b));
	EXPECT_TRUE(b.IsIdle());
}

TEST(ThreadPool, Run)
{
	ThreadQueue queue;
	ThreadPool pool(queue, 3);
	EXPECT_EQ(pool.size(), 3u);

	std::mutex mutex;
	std::condition_variable cond;
	unsigned n_finished = 0;

	std::vector<std::unique_ptr<NotifyingJob>> jobs;
	for (unsigned i = 0; i < 16; ++i)
		jobs.emplace_back(std::make_unique<NotifyingJob>(mutex, cond,
								 n_finished));

	for (auto &i : jobs)
		ASSERT_TRUE(queue.Add(*i));

	{
		std::unique_lock lock{mutex};
		cond.wait(lock, [&n_finished, &jobs]{
			return n_finished == jobs.size();
		});
	}

	pool.StopAndJoin();
	EXPECT_EQ(pool.size(), 0u);

	for (const auto &i : jobs) {
		EXPECT_TRUE(i->ran);
		EXPECT_TRUE(i->IsIdle());
	}
}
