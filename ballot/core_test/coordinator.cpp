#include <ballot/node/cache.hpp>
#include <ballot/node/coordinator.hpp>
#include <ballot/test_common/system.hpp>
#include <ballot/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <thread>

using namespace std::chrono_literals;

namespace
{
ballot::election_id active_election (ballot::coordinator & coordinator, uint32_t nodes)
{
	auto election = coordinator.create_election ("test", nodes);
	auto error = coordinator.start_election (election.id);
	release_assert (!error);
	return election.id;
}
}

TEST (coordinator, create_election)
{
	ballot::test::system system;
	auto & coordinator = system.add_coordinator ();
	auto election = coordinator.create_election ("board", 5);
	ASSERT_EQ (ballot::election_status::upcoming, election.status);
	auto nodes = coordinator.election_node_statuses (election.id);
	ASSERT_EQ (5, nodes.size ());
	ASSERT_EQ ("127.0.0.1:7100", nodes[0].address);
	ASSERT_EQ ("127.0.0.1:7104", nodes[4].address);
	for (auto const & node : nodes)
	{
		ASSERT_EQ (ballot::node_status::active, node.status);
	}
	// Replication factor defaults to the configured one
	auto other = coordinator.create_election ("other");
	ASSERT_EQ (3, coordinator.election_node_statuses (other.id).size ());
	ASSERT_EQ (2, coordinator.audit.size ());
}

TEST (coordinator, cast_refused)
{
	ballot::test::system system;
	auto & coordinator = system.add_coordinator ();
	ASSERT_EQ (ballot::error_consensus::unknown_election, coordinator.cast_vote ("alice", "bob", 42).code);
	auto upcoming = coordinator.create_election ("upcoming", 3);
	ASSERT_EQ (ballot::error_consensus::election_not_active, coordinator.cast_vote ("alice", "bob", upcoming.id).code);
	ASSERT_EQ (0, coordinator.store.size ());
	ASSERT_EQ (2, coordinator.stats.count (ballot::stat::type::coordinator, ballot::stat::detail::vote_rejected));
}

TEST (coordinator, cast_duplicate)
{
	ballot::test::system system;
	auto & coordinator = system.add_coordinator ();
	auto election = active_election (coordinator, 5);
	auto first = coordinator.cast_vote ("alice", "bob", election);
	ASSERT_NO_ERROR (first.code);
	ASSERT_EQ (ballot::vote_status::pending, first.status);
	ASSERT_FALSE (first.fingerprint.is_zero ());
	auto second = coordinator.cast_vote ("alice", "carol", election);
	ASSERT_EQ (ballot::error_consensus::duplicate_vote, second.code);
	ASSERT_EQ (1, coordinator.store.size ());
}

TEST (coordinator, cast_duplicate_concurrent)
{
	ballot::test::system system;
	auto & coordinator = system.add_coordinator ();
	auto election = active_election (coordinator, 5);
	std::atomic<unsigned> accepted{ 0 };
	std::vector<std::thread> threads;
	for (auto i = 0; i < 8; ++i)
	{
		threads.emplace_back ([&coordinator, &accepted, election] () {
			if (!coordinator.cast_vote ("alice", "bob", election).code)
			{
				++accepted;
			}
		});
	}
	for (auto & thread : threads)
	{
		thread.join ();
	}
	ASSERT_EQ (1, accepted);
	ASSERT_EQ (1, coordinator.store.size ());
}

// Five nodes, three required confirmations, every selected node confirms
TEST (coordinator, finalize)
{
	ballot::test::system system;
	auto & coordinator = system.add_coordinator ();
	auto election = active_election (coordinator, 5);
	auto cast = coordinator.cast_vote ("alice", "bob", election);
	ASSERT_NO_ERROR (cast.code);
	ASSERT_TIMELY_EQ (5s, ballot::test::round_number (coordinator, cast.vote), 1);
	auto nodes = ballot::test::round_nodes (coordinator, cast.vote);
	ASSERT_EQ (3, nodes.size ());
	for (auto const & node : nodes)
	{
		ASSERT_NO_ERROR (coordinator.record_confirmation (cast.vote, node, ballot::confirmation::confirmed));
	}
	ASSERT_TIMELY_EQ (5s, ballot::test::status (coordinator, cast.vote), ballot::vote_status::finalized);
	auto report = coordinator.vote_status (cast.vote);
	ASSERT_TRUE (report);
	ASSERT_EQ (ballot::vote_status::finalized, report->status);
	ASSERT_EQ (3, report->confirmation_count);
	ASSERT_EQ (3, report->required_confirmations);
	ASSERT_EQ (1, report->round);
	ASSERT_EQ (3, report->log_entries.size ());
	ASSERT_EQ (cast.fingerprint, report->fingerprint);
	ASSERT_TIMELY_EQ (5s, system.sink.count (ballot::topics::vote (cast.vote), ballot::notification_type::finalized), 1);
	ASSERT_TIMELY_EQ (5s, system.sink.count (ballot::topics::election (election), ballot::notification_type::finalized), 1);
	ASSERT_TIMELY_EQ (5s, system.sink.count (ballot::topics::admin, ballot::notification_type::finalized), 1);
	// Late confirmations are no-ops
	ASSERT_NO_ERROR (coordinator.record_confirmation (cast.vote, nodes[0], ballot::confirmation::confirmed));
	ASSERT_EQ (ballot::consensus_outcome::finalized, coordinator.evaluate (cast.vote).outcome);
	ASSERT_NEVER (200ms, system.sink.count (ballot::topics::vote (cast.vote), ballot::notification_type::finalized) > 1);
	ASSERT_FALSE (coordinator.audit.verify ());
}

// Two rejections and one confirmation fail the round, a new round is opened
TEST (coordinator, round_failed)
{
	ballot::test::system system;
	auto & coordinator = system.add_coordinator ();
	auto election = active_election (coordinator, 5);
	auto cast = coordinator.cast_vote ("alice", "bob", election);
	ASSERT_NO_ERROR (cast.code);
	ASSERT_TIMELY_EQ (5s, ballot::test::round_number (coordinator, cast.vote), 1);
	auto nodes = ballot::test::round_nodes (coordinator, cast.vote);
	ASSERT_NO_ERROR (coordinator.record_confirmation (cast.vote, nodes[0], ballot::confirmation::rejected));
	ASSERT_NO_ERROR (coordinator.record_confirmation (cast.vote, nodes[1], ballot::confirmation::rejected));
	ASSERT_NO_ERROR (coordinator.record_confirmation (cast.vote, nodes[2], ballot::confirmation::confirmed));
	ASSERT_TIMELY_EQ (5s, ballot::test::round_number (coordinator, cast.vote), 2);
	ASSERT_TIMELY_EQ (5s, system.sink.count (ballot::topics::vote (cast.vote), ballot::notification_type::round_failed), 1);
	auto vote = coordinator.store.get (cast.vote);
	ASSERT_EQ (ballot::vote_status::pending, vote->status);
	ASSERT_FALSE (vote->rounds[0].open);
	ASSERT_TRUE (vote->rounds[1].open);
	ASSERT_EQ (0, vote->confirmation_count);
	ASSERT_EQ (2, vote->rounds[0].count (ballot::entry_status::rejected));
	ASSERT_EQ (1, vote->rounds[0].count (ballot::entry_status::confirmed));
}

// Each failed round opens a new one until max_rounds, then the vote fails
TEST (coordinator, rounds_exhausted)
{
	ballot::test::system system;
	auto config = system.default_config ();
	config.consensus.max_rounds = 2;
	auto & coordinator = system.add_coordinator (config);
	auto election = active_election (coordinator, 3);
	auto cast = coordinator.cast_vote ("alice", "bob", election);
	ASSERT_NO_ERROR (cast.code);
	for (uint32_t round = 1; round <= 2; ++round)
	{
		ASSERT_TIMELY_EQ (5s, ballot::test::round_number (coordinator, cast.vote), round);
		for (auto const & node : ballot::test::round_nodes (coordinator, cast.vote))
		{
			ASSERT_NO_ERROR (coordinator.record_confirmation (cast.vote, node, ballot::confirmation::rejected));
		}
	}
	ASSERT_TIMELY_EQ (5s, ballot::test::status (coordinator, cast.vote), ballot::vote_status::failed);
	ASSERT_TIMELY_EQ (5s, system.sink.count (ballot::topics::vote (cast.vote), ballot::notification_type::vote_failed), 1);
	ASSERT_EQ (2, coordinator.store.get (cast.vote)->rounds.size ());
	auto received = system.sink.received ();
	auto failed = std::find_if (received.begin (), received.end (), [] (auto const & item) { return item.second.type == ballot::notification_type::vote_failed; });
	ASSERT_NE (received.end (), failed);
	ASSERT_EQ (ballot::make_error_code (ballot::error_consensus::round_exhausted).message (), failed->second.message);
	ASSERT_NEVER (200ms, ballot::test::round_number (coordinator, cast.vote) > 2);
}

// Rounds nobody answers are timed out by the sweep
TEST (coordinator, round_timeout)
{
	ballot::test::system system;
	auto config = system.default_config ();
	config.consensus.round_timeout = 100ms;
	config.consensus.sweep_interval = 20ms;
	config.consensus.max_rounds = 2;
	auto & coordinator = system.add_coordinator (config);
	auto election = active_election (coordinator, 3);
	auto cast = coordinator.cast_vote ("alice", "bob", election);
	ASSERT_NO_ERROR (cast.code);
	ASSERT_TIMELY_EQ (5s, ballot::test::status (coordinator, cast.vote), ballot::vote_status::failed);
	auto vote = coordinator.store.get (cast.vote);
	ASSERT_EQ (2, vote->rounds.size ());
	ASSERT_EQ (3, vote->rounds[1].count (ballot::entry_status::timed_out));
}

// Without active nodes round opening is retried and finally given up
TEST (coordinator, insufficient_nodes)
{
	ballot::test::system system;
	auto config = system.default_config ();
	config.evaluation_queue.max_attempts = 3;
	auto & coordinator = system.add_coordinator (config);
	auto election = active_election (coordinator, 0);
	auto cast = coordinator.cast_vote ("alice", "bob", election);
	ASSERT_NO_ERROR (cast.code);
	ASSERT_TIMELY_EQ (5s, ballot::test::status (coordinator, cast.vote), ballot::vote_status::failed);
	ASSERT_TIMELY_EQ (5s, system.sink.count (ballot::topics::vote (cast.vote), ballot::notification_type::evaluation_error), 1);
	ASSERT_TIMELY_EQ (5s, system.sink.count (ballot::topics::vote (cast.vote), ballot::notification_type::vote_failed), 1);
	auto letters = coordinator.queue.dead_letters ();
	ASSERT_EQ (1, letters.size ());
	ASSERT_EQ ("open_round", letters[0].name);
	ASSERT_EQ (cast.vote, letters[0].vote);
	ASSERT_EQ (3, letters[0].attempts);
}

// A node reporting back lets a retried round open
TEST (coordinator, insufficient_nodes_recover)
{
	ballot::test::system system;
	auto config = system.default_config ();
	config.evaluation_queue.max_attempts = 100;
	auto & coordinator = system.add_coordinator (config);
	auto election = active_election (coordinator, 3);
	ASSERT_EQ (3, coordinator.registry.mark_unreachable (std::chrono::system_clock::now () + 2h));
	auto cast = coordinator.cast_vote ("alice", "bob", election);
	ASSERT_NO_ERROR (cast.code);
	ASSERT_TIMELY (5s, coordinator.stats.count (ballot::stat::type::evaluation_queue, ballot::stat::detail::task_retry) > 0);
	ASSERT_EQ (0, ballot::test::round_number (coordinator, cast.vote));
	auto nodes = coordinator.election_node_statuses (election);
	ASSERT_NO_ERROR (coordinator.heartbeat (nodes[0].id, 12.0));
	ASSERT_TIMELY_EQ (5s, ballot::test::round_number (coordinator, cast.vote), 1);
	auto round = ballot::test::round_nodes (coordinator, cast.vote);
	ASSERT_EQ (1, round.size ());
	ASSERT_EQ (nodes[0].id, round[0]);
}

TEST (coordinator, end_election)
{
	ballot::test::system system;
	auto & coordinator = system.add_coordinator ();
	auto election = active_election (coordinator, 5);
	auto pending = coordinator.cast_vote ("alice", "bob", election);
	auto finalized = coordinator.cast_vote ("carol", "bob", election);
	ASSERT_TIMELY_EQ (5s, ballot::test::round_number (coordinator, pending.vote), 1);
	ASSERT_TIMELY_EQ (5s, ballot::test::round_number (coordinator, finalized.vote), 1);
	for (auto const & node : ballot::test::round_nodes (coordinator, finalized.vote))
	{
		ASSERT_NO_ERROR (coordinator.record_confirmation (finalized.vote, node, ballot::confirmation::confirmed));
	}
	ASSERT_TIMELY_EQ (5s, ballot::test::status (coordinator, finalized.vote), ballot::vote_status::finalized);
	auto nodes = ballot::test::round_nodes (coordinator, pending.vote);
	ASSERT_NO_ERROR (coordinator.end_election (election));
	ASSERT_EQ (ballot::error_consensus::invalid_transition, coordinator.end_election (election));
	ASSERT_EQ (ballot::vote_status::expired, ballot::test::status (coordinator, pending.vote));
	// Terminal votes are left alone
	ASSERT_EQ (ballot::vote_status::finalized, ballot::test::status (coordinator, finalized.vote));
	// Stale answers after the end are refused
	ASSERT_EQ (ballot::error_consensus::election_ended, coordinator.record_confirmation (pending.vote, nodes[0], ballot::confirmation::confirmed));
	ASSERT_EQ (ballot::error_consensus::election_ended, coordinator.heartbeat (nodes[0], 10.0));
	ASSERT_EQ (ballot::error_consensus::election_not_active, coordinator.cast_vote ("dave", "bob", election).code);
	for (auto const & node : coordinator.election_node_statuses (election))
	{
		ASSERT_EQ (ballot::node_status::inactive, node.status);
	}
	ASSERT_TIMELY_EQ (5s, system.sink.count (ballot::topics::vote (pending.vote), ballot::notification_type::vote_expired), 1);
	ASSERT_TIMELY_EQ (5s, system.sink.count (ballot::topics::election (election), ballot::notification_type::election_ended), 1);
	auto stats = coordinator.election_stats (election);
	ASSERT_TRUE (stats);
	ASSERT_EQ (2, stats->total);
	ASSERT_EQ (1, stats->finalized);
	ASSERT_EQ (1, stats->expired);
	ASSERT_EQ (0, stats->pending);
	ASSERT_FALSE (coordinator.audit.verify ());
}

// Votes accepted while the election is being ended still expire, including ones stored after the end collected its pending votes
TEST (coordinator, end_election_concurrent_cast)
{
	ballot::test::system system;
	auto & coordinator = system.add_coordinator ();
	auto election = active_election (coordinator, 3);
	std::atomic<unsigned> accepted{ 0 };
	std::vector<std::thread> threads;
	for (auto i = 0; i < 4; ++i)
	{
		threads.emplace_back ([&coordinator, &accepted, election, i] () {
			for (auto j = 0; j < 200; ++j)
			{
				auto cast = coordinator.cast_vote ("voter" + std::to_string (i) + "_" + std::to_string (j), "bob", election);
				if (cast.code == ballot::error_consensus::election_not_active)
				{
					break;
				}
				if (!cast.code)
				{
					++accepted;
				}
			}
		});
	}
	while (accepted < 20)
	{
		std::this_thread::yield ();
	}
	ASSERT_NO_ERROR (coordinator.end_election (election));
	for (auto & thread : threads)
	{
		thread.join ();
	}
	uint64_t accepted_count = accepted;
	ASSERT_TIMELY_EQ (5s, coordinator.election_stats (election)->pending, 0);
	auto stats = coordinator.election_stats (election);
	ASSERT_EQ (accepted_count, stats->total);
	ASSERT_EQ (accepted_count, stats->expired);
	ASSERT_TIMELY_EQ (5s, system.sink.count (ballot::topics::election (election), ballot::notification_type::vote_expired), accepted_count);
	ASSERT_FALSE (coordinator.audit.verify ());
}

TEST (coordinator, queries)
{
	ballot::test::system system;
	auto & coordinator = system.add_coordinator ();
	auto election1 = active_election (coordinator, 3);
	auto election2 = active_election (coordinator, 3);
	ASSERT_NO_ERROR (coordinator.cast_vote ("alice", "bob", election1).code);
	ASSERT_NO_ERROR (coordinator.cast_vote ("alice", "bob", election2).code);
	ASSERT_NO_ERROR (coordinator.cast_vote ("carol", "bob", election2).code);
	ASSERT_EQ ((std::vector<ballot::election_id>{ election1, election2 }), coordinator.voter_elections ("alice"));
	ASSERT_EQ ((std::vector<ballot::election_id>{ election2 }), coordinator.voter_elections ("carol"));
	ASSERT_TRUE (coordinator.voter_elections ("dave").empty ());
	auto stats = coordinator.election_stats (election2);
	ASSERT_TRUE (stats);
	ASSERT_EQ (2, stats->total);
	ASSERT_EQ (2, stats->pending);
	ASSERT_FALSE (coordinator.election_stats (42));
	ASSERT_FALSE (coordinator.vote_status (42));
}

// Every state change drops the cached views it affects
TEST (coordinator, cache_invalidation)
{
	ballot::test::system system;
	auto & coordinator = system.add_coordinator ();
	auto election = active_election (coordinator, 3);
	ASSERT_LE (1, system.cache.count (ballot::cache_keys::election_stats_of (election)));
	auto cast = coordinator.cast_vote ("alice", "bob", election);
	ASSERT_NO_ERROR (cast.code);
	ASSERT_LE (1, system.cache.count (ballot::cache_keys::vote_status (cast.vote)));
	ASSERT_LE (1, system.cache.count (ballot::cache_keys::voter_elections ("alice")));
	ASSERT_LE (1, system.cache.count (ballot::cache_keys::election_stats));
	ASSERT_TIMELY_EQ (5s, ballot::test::round_number (coordinator, cast.vote), 1);
	auto before = system.cache.count (ballot::cache_keys::vote_status (cast.vote));
	for (auto const & node : ballot::test::round_nodes (coordinator, cast.vote))
	{
		ASSERT_NO_ERROR (coordinator.record_confirmation (cast.vote, node, ballot::confirmation::confirmed));
	}
	ASSERT_TIMELY_EQ (5s, ballot::test::status (coordinator, cast.vote), ballot::vote_status::finalized);
	ASSERT_LT (before, system.cache.count (ballot::cache_keys::vote_status (cast.vote)));
}

TEST (coordinator, status_cache)
{
	ballot::test::system system;
	ballot::stats stats;
	ballot::status_cache cache{ stats };
	ballot::coordinator coordinator{ system.default_config (), system.sink, cache };
	ballot::test::start_stop_guard guard{ coordinator };
	auto election = active_election (coordinator, 3);
	cache.put (ballot::cache_keys::voter_elections ("alice"), "[]");
	cache.put (ballot::cache_keys::election_stats_of (election), "{}");
	ASSERT_NO_ERROR (coordinator.cast_vote ("alice", "bob", election).code);
	ASSERT_FALSE (cache.get (ballot::cache_keys::voter_elections ("alice")));
	ASSERT_FALSE (cache.get (ballot::cache_keys::election_stats_of (election)));
	ASSERT_EQ (0, cache.size ());
}
