#include <ballot/lib/stats.hpp>
#include <ballot/test_common/testutil.hpp>

#include <boost/property_tree/ptree.hpp>

#include <gtest/gtest.h>

// Test stat counting at both type and detail levels
TEST (stats, counters)
{
	ballot::stats stats;

	stats.add (ballot::stat::type::round_manager, ballot::stat::detail::test, ballot::stat::dir::in, 1);
	stats.add (ballot::stat::type::round_manager, ballot::stat::detail::test, ballot::stat::dir::in, 5);
	stats.inc (ballot::stat::type::round_manager, ballot::stat::detail::test);
	stats.inc (ballot::stat::type::round_manager, ballot::stat::detail::round_opened);
	stats.inc (ballot::stat::type::round_manager, ballot::stat::detail::round_opened);
	stats.inc (ballot::stat::type::round_manager, ballot::stat::detail::round_closed);

	ASSERT_EQ (10, stats.count (ballot::stat::type::round_manager));
	ASSERT_EQ (2, stats.count (ballot::stat::type::round_manager, ballot::stat::detail::round_opened));
	ASSERT_EQ (1, stats.count (ballot::stat::type::round_manager, ballot::stat::detail::round_closed));
	ASSERT_EQ (0, stats.count (ballot::stat::type::round_manager, ballot::stat::detail::round_closed, ballot::stat::dir::out));

	stats.add (ballot::stat::type::round_manager, ballot::stat::detail::test, ballot::stat::dir::in, 0);

	ASSERT_EQ (10, stats.count (ballot::stat::type::round_manager));
}

TEST (stats, samples)
{
	ballot::stats stats;

	stats.sample (ballot::stat::sample::heartbeat_response_time, 5);
	stats.sample (ballot::stat::sample::heartbeat_response_time, 11);
	stats.sample (ballot::stat::sample::vote_finalize_duration, 2137);

	auto samples1 = stats.samples (ballot::stat::sample::heartbeat_response_time);
	ASSERT_EQ (2, samples1.size ());
	ASSERT_EQ (5, samples1[0]);
	ASSERT_EQ (11, samples1[1]);

	// Collecting resets the sampler
	ASSERT_TRUE (stats.samples (ballot::stat::sample::heartbeat_response_time).empty ());

	auto samples2 = stats.samples (ballot::stat::sample::vote_finalize_duration);
	ASSERT_EQ (1, samples2.size ());
	ASSERT_EQ (2137, samples2[0]);
}

TEST (stats, samples_capacity)
{
	ballot::stats_config config;
	config.max_samples = 3;
	ballot::stats stats{ config };

	for (int i = 0; i < 5; ++i)
	{
		stats.sample (ballot::stat::sample::heartbeat_response_time, i);
	}
	auto samples = stats.samples (ballot::stat::sample::heartbeat_response_time);
	ASSERT_EQ ((std::vector<ballot::stats::sampler_value_t>{ 2, 3, 4 }), samples);
}

TEST (stats, clear)
{
	ballot::stats stats;
	stats.inc (ballot::stat::type::vote_store, ballot::stat::detail::vote_created);
	stats.sample (ballot::stat::sample::heartbeat_response_time, 1);
	ASSERT_EQ (1, stats.count (ballot::stat::type::vote_store));
	stats.clear ();
	ASSERT_EQ (0, stats.count (ballot::stat::type::vote_store));
	ASSERT_TRUE (stats.samples (ballot::stat::sample::heartbeat_response_time).empty ());
	ASSERT_LE (stats.last_reset (), std::chrono::seconds{ 1 });
}

TEST (stats, to_ptree)
{
	ballot::stats stats;
	stats.inc (ballot::stat::type::vote_store, ballot::stat::detail::vote_created);
	stats.inc (ballot::stat::type::vote_store, ballot::stat::detail::duplicate_vote);
	stats.inc (ballot::stat::type::vote_store, ballot::stat::detail::duplicate_vote);

	auto tree = stats.to_ptree ();
	ASSERT_EQ (1, tree.get<uint64_t> ("vote_store.vote_created.in"));
	ASSERT_EQ (2, tree.get<uint64_t> ("vote_store.duplicate_vote.in"));
	ASSERT_EQ (3, tree.get<uint64_t> ("vote_store.all.in"));

	auto json = stats.dump ();
	ASSERT_NE (std::string::npos, json.find ("\"duplicate_vote\""));
}
