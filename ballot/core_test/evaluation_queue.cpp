#include <ballot/lib/logging.hpp>
#include <ballot/lib/random.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/node/evaluation_queue.hpp>
#include <ballot/test_common/system.hpp>
#include <ballot/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>

using namespace std::chrono_literals;

namespace
{
ballot::evaluation_queue_config quick_config ()
{
	ballot::evaluation_queue_config config;
	config.initial_delay = 5ms;
	config.max_delay = 20ms;
	config.jitter = 0.0;
	config.max_attempts = 3;
	return config;
}
}

TEST (evaluation_queue, execute)
{
	ballot::test::system system;
	auto config = quick_config ();
	ballot::stats stats;
	ballot::logger logger;
	ballot::evaluation_queue queue{ config, stats, logger };
	ballot::test::start_stop_guard guard{ queue };
	std::atomic<unsigned> executed{ 0 };
	for (auto i = 0; i < 10; ++i)
	{
		queue.push ("task", i, 1, [&executed] () { ++executed; });
	}
	ASSERT_TIMELY_EQ (5s, executed, 10);
	ASSERT_TIMELY_EQ (5s, stats.count (ballot::stat::type::evaluation_queue, ballot::stat::detail::task_completed), 10);
	ASSERT_TRUE (queue.dead_letters ().empty ());
}

// A task failing transiently is retried until it succeeds
TEST (evaluation_queue, retry)
{
	ballot::test::system system;
	auto config = quick_config ();
	ballot::stats stats;
	ballot::logger logger;
	ballot::evaluation_queue queue{ config, stats, logger };
	ballot::test::start_stop_guard guard{ queue };
	std::atomic<unsigned> attempts{ 0 };
	queue.push ("flaky", 1, 1, [&attempts] () {
		if (++attempts < 3)
		{
			throw std::runtime_error ("transient");
		}
	});
	ASSERT_TIMELY_EQ (5s, stats.count (ballot::stat::type::evaluation_queue, ballot::stat::detail::task_completed), 1);
	ASSERT_EQ (3, attempts);
	ASSERT_EQ (2, stats.count (ballot::stat::type::evaluation_queue, ballot::stat::detail::task_retry));
	ASSERT_TRUE (queue.dead_letters ().empty ());
}

TEST (evaluation_queue, dead_letter)
{
	ballot::test::system system;
	auto config = quick_config ();
	ballot::stats stats;
	ballot::logger logger;
	ballot::evaluation_queue queue{ config, stats, logger };
	ballot::test::start_stop_guard guard{ queue };
	std::atomic<unsigned> attempts{ 0 };
	std::atomic<unsigned> reported{ 0 };
	queue.dead_lettered.add ([&reported] (ballot::dead_letter const & letter) {
		ASSERT_EQ ("broken", letter.name);
		++reported;
	});
	queue.push ("broken", 7, 2, [&attempts] () {
		++attempts;
		throw std::runtime_error ("permanent");
	});
	ASSERT_TIMELY_EQ (5s, reported, 1);
	ASSERT_EQ (3, attempts);
	auto letters = queue.dead_letters ();
	ASSERT_EQ (1, letters.size ());
	ASSERT_EQ (7, letters[0].vote);
	ASSERT_EQ (2, letters[0].round);
	ASSERT_EQ (3, letters[0].attempts);
	ASSERT_EQ ("permanent", letters[0].error);
	ASSERT_EQ (1, stats.count (ballot::stat::type::evaluation_queue, ballot::stat::detail::dead_letter));
}

TEST (evaluation_queue, dead_letter_capacity)
{
	ballot::test::system system;
	auto config = quick_config ();
	config.max_attempts = 1;
	config.dead_letter_capacity = 2;
	ballot::stats stats;
	ballot::logger logger;
	ballot::evaluation_queue queue{ config, stats, logger };
	ballot::test::start_stop_guard guard{ queue };
	for (auto i = 0; i < 4; ++i)
	{
		queue.push ("broken", i, 1, [] () { throw std::runtime_error ("permanent"); });
	}
	ASSERT_TIMELY_EQ (5s, stats.count (ballot::stat::type::evaluation_queue, ballot::stat::detail::dead_letter), 4);
	ASSERT_EQ (2, queue.dead_letters ().size ());
}

TEST (evaluation_queue_config, backoff)
{
	ballot::evaluation_queue_config config;
	config.initial_delay = 100ms;
	config.max_delay = 1000ms;
	config.backoff_multiplier = 2.0;
	config.jitter = 0.0;
	ballot::random_generator random;
	ASSERT_EQ (100ms, config.backoff (1, random));
	ASSERT_EQ (200ms, config.backoff (2, random));
	ASSERT_EQ (400ms, config.backoff (3, random));
	ASSERT_EQ (800ms, config.backoff (4, random));
	// Capped
	ASSERT_EQ (1000ms, config.backoff (5, random));
	ASSERT_EQ (1000ms, config.backoff (10, random));
}

TEST (evaluation_queue_config, backoff_jitter)
{
	ballot::evaluation_queue_config config;
	config.initial_delay = 100ms;
	config.max_delay = 1000ms;
	config.jitter = 0.1;
	ballot::random_generator random;
	for (auto i = 0; i < 100; ++i)
	{
		auto delay = config.backoff (1, random);
		ASSERT_LE (90ms, delay);
		ASSERT_GE (110ms, delay);
	}
}
