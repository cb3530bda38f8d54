#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/node/vote_store.hpp>
#include <ballot/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

TEST (vote_store, create)
{
	ballot::stats stats;
	ballot::logger logger;
	ballot::vote_store store{ stats, logger };
	auto result = store.create ("alice", "bob", 1, 3);
	ASSERT_NO_ERROR (result.code);
	ASSERT_EQ (1, result.vote.id);
	ASSERT_EQ (ballot::vote_status::pending, result.vote.status);
	ASSERT_EQ (3, result.vote.required_confirmations);
	ASSERT_EQ (0, result.vote.confirmation_count);
	ASSERT_TRUE (result.vote.rounds.empty ());
	ASSERT_EQ (ballot::compute_fingerprint ("alice", "bob", 1, result.vote.nonce), result.vote.fingerprint);
	auto stored = store.get (result.vote.id);
	ASSERT_TRUE (stored);
	ASSERT_EQ ("alice", stored->voter);
	ASSERT_EQ ("bob", stored->candidate);
	ASSERT_EQ (1, store.size ());
	ASSERT_FALSE (store.get (2));
	ASSERT_EQ (nullptr, store.record (2));
}

TEST (vote_store, duplicate)
{
	ballot::stats stats;
	ballot::logger logger;
	ballot::vote_store store{ stats, logger };
	auto first = store.create ("alice", "bob", 1, 3);
	ASSERT_NO_ERROR (first.code);
	auto second = store.create ("alice", "carol", 1, 3);
	ASSERT_EQ (ballot::error_consensus::duplicate_vote, second.code);
	ASSERT_EQ (1, store.size ());
	ASSERT_EQ ("bob", store.find ("alice", 1)->candidate);
	// Same voter in another election is a different vote
	ASSERT_NO_ERROR (store.create ("alice", "carol", 2, 3).code);
	ASSERT_EQ (2, store.size ());
	ASSERT_EQ (1, stats.count (ballot::stat::type::vote_store, ballot::stat::detail::duplicate_vote));
}

TEST (vote_store, fingerprint_differs)
{
	ballot::stats stats;
	ballot::logger logger;
	ballot::vote_store store{ stats, logger };
	auto first = store.create ("alice", "bob", 1, 3);
	auto second = store.create ("alice", "bob", 2, 3);
	ASSERT_NE (first.vote.fingerprint, second.vote.fingerprint);
	ASSERT_FALSE (first.vote.fingerprint.is_zero ());
}

// Concurrent casts by the same voter, exactly one succeeds
TEST (vote_store, duplicate_concurrent)
{
	ballot::stats stats;
	ballot::logger logger;
	ballot::vote_store store{ stats, logger };
	std::atomic<unsigned> created{ 0 };
	std::atomic<unsigned> duplicates{ 0 };
	std::vector<std::thread> threads;
	for (auto i = 0; i < 16; ++i)
	{
		threads.emplace_back ([&store, &created, &duplicates, i] () {
			auto result = store.create ("alice", "candidate_" + std::to_string (i), 1, 3);
			if (!result.code)
			{
				++created;
			}
			else if (result.code == ballot::error_consensus::duplicate_vote)
			{
				++duplicates;
			}
		});
	}
	for (auto & thread : threads)
	{
		thread.join ();
	}
	ASSERT_EQ (1, created);
	ASSERT_EQ (15, duplicates);
	ASSERT_EQ (1, store.size ());
}

TEST (vote_store, list)
{
	ballot::stats stats;
	ballot::logger logger;
	ballot::vote_store store{ stats, logger };
	auto vote1 = store.create ("alice", "x", 1, 3).vote;
	auto vote2 = store.create ("bob", "x", 2, 3).vote;
	auto vote3 = store.create ("carol", "y", 1, 3).vote;
	auto vote4 = store.create ("alice", "y", 3, 3).vote;
	ASSERT_EQ ((std::vector<ballot::vote_id>{ vote1.id, vote3.id }), store.list (1));
	ASSERT_EQ ((std::vector<ballot::vote_id>{ vote2.id }), store.list (2));
	ASSERT_TRUE (store.list (4).empty ());
	auto elections = store.elections_of ("alice");
	std::sort (elections.begin (), elections.end ());
	ASSERT_EQ ((std::vector<ballot::election_id>{ 1, 3 }), elections);
	ASSERT_TRUE (store.elections_of ("dave").empty ());
	ASSERT_EQ (vote4.id, store.find ("alice", 3)->id);
}
