#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/node/elections.hpp>
#include <ballot/test_common/testutil.hpp>

#include <gtest/gtest.h>

TEST (elections, lifecycle)
{
	ballot::stats stats;
	ballot::logger logger;
	ballot::elections elections{ stats, logger };
	auto election = elections.create ("board", 5);
	ASSERT_EQ (1, election.id);
	ASSERT_EQ ("board", election.name);
	ASSERT_EQ (5, election.replication_factor);
	ASSERT_EQ (ballot::election_status::upcoming, election.status);
	ASSERT_FALSE (elections.active (election.id));
	ASSERT_EQ (ballot::error_consensus::invalid_transition, elections.end (election.id));
	ASSERT_NO_ERROR (elections.start (election.id));
	ASSERT_TRUE (elections.active (election.id));
	ASSERT_EQ (ballot::error_consensus::invalid_transition, elections.start (election.id));
	ASSERT_NO_ERROR (elections.end (election.id));
	ASSERT_EQ (ballot::election_status::completed, *elections.status (election.id));
	ASSERT_EQ (ballot::error_consensus::invalid_transition, elections.end (election.id));
	ASSERT_EQ (ballot::error_consensus::invalid_transition, elections.start (election.id));
}

TEST (elections, unknown)
{
	ballot::stats stats;
	ballot::logger logger;
	ballot::elections elections{ stats, logger };
	ASSERT_EQ (ballot::error_consensus::unknown_election, elections.start (7));
	ASSERT_EQ (ballot::error_consensus::unknown_election, elections.end (7));
	ASSERT_FALSE (elections.get (7));
	ASSERT_FALSE (elections.status (7));
}

TEST (elections, list)
{
	ballot::stats stats;
	ballot::logger logger;
	ballot::elections elections{ stats, logger };
	elections.create ("one", 3);
	elections.create ("two", 3);
	auto list = elections.list ();
	ASSERT_EQ (2, list.size ());
	ASSERT_EQ ("one", list[0].name);
	ASSERT_EQ ("two", list[1].name);
	ASSERT_EQ (2, elections.size ());
}

TEST (elections_config, node_address)
{
	ballot::elections_config config;
	config.host = "10.0.0.1";
	config.port_base = 9000;
	ASSERT_EQ ("10.0.0.1:9000", config.node_address (1, 0));
	ASSERT_EQ ("10.0.0.1:9004", config.node_address (1, 4));
}
