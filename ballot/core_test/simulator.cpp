#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/node/coordinator.hpp>
#include <ballot/node/simulator.hpp>
#include <ballot/test_common/system.hpp>
#include <ballot/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <set>

using namespace std::chrono_literals;

namespace
{
ballot::simulator_config quick_config ()
{
	ballot::simulator_config config;
	config.enable = true;
	config.confirmation_delay = 20ms;
	config.heartbeat_interval = 10ms;
	return config;
}

ballot::consensus_round make_round (std::vector<ballot::node_id> const & nodes)
{
	ballot::consensus_round round;
	round.number = 1;
	for (auto const & node : nodes)
	{
		round.entries.push_back ({ node });
	}
	return round;
}
}

TEST (confirmation_simulator, answer)
{
	ballot::test::system system;
	auto config = quick_config ();
	ballot::stats stats;
	ballot::logger logger;
	ballot::confirmation_simulator simulator{ config, stats, logger };
	ballot::mutex mutex;
	std::vector<std::pair<ballot::node_id, ballot::confirmation>> answers;
	simulator.respond = [&mutex, &answers] (ballot::vote_id, ballot::node_id const & node, ballot::confirmation outcome) {
		ballot::lock_guard<ballot::mutex> lock{ mutex };
		answers.emplace_back (node, outcome);
		return std::error_code{};
	};
	simulator.heartbeat = [] (ballot::node_id const &, double) { return std::error_code{}; };
	ballot::test::start_stop_guard guard{ simulator };
	ballot::vote vote;
	vote.id = 1;
	simulator.solicit (vote, make_round ({ "a", "b", "c" }));
	auto answered = [&mutex, &answers] () {
		ballot::lock_guard<ballot::mutex> lock{ mutex };
		return answers.size ();
	};
	ASSERT_TIMELY_EQ (5s, answered (), 3);
	ASSERT_EQ (0, simulator.pending ());
	for (auto const & [node, outcome] : answers)
	{
		ASSERT_EQ (ballot::confirmation::confirmed, outcome);
	}
	ASSERT_EQ (3, stats.count (ballot::stat::type::confirmation_simulator, ballot::stat::detail::simulated_confirm));
}

TEST (confirmation_simulator, reject)
{
	ballot::test::system system;
	auto config = quick_config ();
	config.rejection_ratio = 1.0;
	ballot::stats stats;
	ballot::logger logger;
	ballot::confirmation_simulator simulator{ config, stats, logger };
	std::atomic<unsigned> rejected{ 0 };
	simulator.respond = [&rejected] (ballot::vote_id, ballot::node_id const &, ballot::confirmation outcome) {
		if (outcome == ballot::confirmation::rejected)
		{
			++rejected;
		}
		return std::error_code{};
	};
	simulator.heartbeat = [] (ballot::node_id const &, double) { return std::error_code{}; };
	ballot::test::start_stop_guard guard{ simulator };
	simulator.solicit (ballot::vote{}, make_round ({ "a", "b" }));
	ASSERT_TIMELY_EQ (5s, rejected.load (), 2);
}

// Nodes whose heartbeats are refused are no longer tracked
TEST (confirmation_simulator, heartbeat)
{
	ballot::test::system system;
	auto config = quick_config ();
	config.response_time_min = 5;
	config.response_time_max = 10;
	ballot::stats stats;
	ballot::logger logger;
	ballot::confirmation_simulator simulator{ config, stats, logger };
	ballot::mutex mutex;
	std::set<ballot::node_id> seen;
	std::atomic<bool> bad_response_time{ false };
	simulator.respond = [] (ballot::vote_id, ballot::node_id const &, ballot::confirmation) { return std::error_code{}; };
	simulator.heartbeat = [&] (ballot::node_id const & node, double response_time_ms) {
		if (response_time_ms < 5.0 || response_time_ms >= 10.0)
		{
			bad_response_time = true;
		}
		ballot::lock_guard<ballot::mutex> lock{ mutex };
		seen.insert (node);
		return node == "gone" ? std::error_code{ ballot::error_consensus::election_ended } : std::error_code{};
	};
	simulator.track ("alive");
	simulator.track ("gone");
	ASSERT_EQ (2, simulator.tracked ());
	ballot::test::start_stop_guard guard{ simulator };
	ASSERT_TIMELY_EQ (5s, simulator.tracked (), 1);
	{
		ballot::lock_guard<ballot::mutex> lock{ mutex };
		ASSERT_EQ (2, seen.size ());
	}
	ASSERT_FALSE (bad_response_time);
}

TEST (confirmation_simulator, disabled)
{
	ballot::simulator_config config;
	ballot::stats stats;
	ballot::logger logger;
	ballot::confirmation_simulator simulator{ config, stats, logger };
	simulator.respond = [] (ballot::vote_id, ballot::node_id const &, ballot::confirmation) { return std::error_code{}; };
	simulator.heartbeat = [] (ballot::node_id const &, double) { return std::error_code{}; };
	simulator.start ();
	simulator.solicit (ballot::vote{}, make_round ({ "a" }));
	ASSERT_EQ (1, simulator.pending ());
	simulator.stop ();
}

// Full pipeline with simulated nodes: every vote is finalized
TEST (confirmation_simulator, coordinator)
{
	ballot::test::system system;
	auto config = system.default_config ();
	config.simulator = quick_config ();
	auto & coordinator = system.add_coordinator (config);
	auto election = coordinator.create_election ("simulated", 5);
	ASSERT_EQ (5, coordinator.simulator.tracked ());
	ASSERT_NO_ERROR (coordinator.start_election (election.id));
	std::vector<ballot::vote_id> votes;
	for (auto i = 0; i < 10; ++i)
	{
		auto cast = coordinator.cast_vote ("voter_" + std::to_string (i), "candidate_" + std::to_string (i % 3), election.id);
		ASSERT_NO_ERROR (cast.code);
		votes.push_back (cast.vote);
	}
	ASSERT_TIMELY_EQ (10s, coordinator.election_stats (election.id)->finalized, 10);
	for (auto vote : votes)
	{
		auto report = coordinator.vote_status (vote);
		ASSERT_EQ (ballot::vote_status::finalized, report->status);
		ASSERT_EQ (3, report->confirmation_count);
	}
	// Heartbeats keep the nodes measured
	auto measured = [&coordinator, &election] () {
		auto nodes = coordinator.election_node_statuses (election.id);
		return std::all_of (nodes.begin (), nodes.end (), [] (auto const & node) { return node.response_time_ms >= 5.0; });
	};
	ASSERT_TIMELY (5s, measured ());
	ASSERT_NO_ERROR (coordinator.end_election (election.id));
	// Heartbeats of the ended election are refused and no longer sent
	ASSERT_TIMELY_EQ (5s, coordinator.simulator.tracked (), 0);
	ASSERT_FALSE (coordinator.audit.verify ());
}
