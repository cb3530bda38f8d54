#include <ballot/lib/stats.hpp>
#include <ballot/node/cache.hpp>
#include <ballot/test_common/testutil.hpp>

#include <gtest/gtest.h>

TEST (cache, keys)
{
	ASSERT_EQ ("vote_status_5", ballot::cache_keys::vote_status (5));
	ASSERT_EQ ("election_stats", ballot::cache_keys::election_stats);
	ASSERT_EQ ("election_stats_2", ballot::cache_keys::election_stats_of (2));
	ASSERT_EQ ("voter_elections_alice", ballot::cache_keys::voter_elections ("alice"));
}

TEST (cache, invalidate)
{
	ballot::stats stats;
	ballot::status_cache cache{ stats };
	cache.put ("vote_status_1", "pending");
	cache.put ("vote_status_2", "pending");
	ASSERT_EQ ("pending", *cache.get ("vote_status_1"));
	cache.invalidate ("vote_status_1");
	ASSERT_FALSE (cache.get ("vote_status_1"));
	ASSERT_TRUE (cache.get ("vote_status_2"));
	ASSERT_EQ (1, cache.size ());
	// Missing keys are ignored
	cache.invalidate ("vote_status_1");
	ASSERT_EQ (1, stats.count (ballot::stat::type::notifications, ballot::stat::detail::cache_invalidate));
}
