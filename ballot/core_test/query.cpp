#include <ballot/node/query.hpp>

#include <gtest/gtest.h>

#include <boost/property_tree/ptree.hpp>

namespace
{
ballot::vote make_vote ()
{
	ballot::vote vote;
	vote.id = 7;
	vote.election = 2;
	vote.voter = "alice";
	vote.candidate = "bob";
	vote.required_confirmations = 2;
	vote.fingerprint = ballot::compute_fingerprint (vote.voter, vote.candidate, vote.election, 11);

	ballot::consensus_round first;
	first.number = 1;
	first.open = false;
	first.entries.push_back ({ "node-a", ballot::entry_status::rejected, "sig_a", {} });
	first.entries.push_back ({ "node-b", ballot::entry_status::timed_out, "", {} });
	vote.rounds.push_back (first);

	ballot::consensus_round second;
	second.number = 2;
	second.entries.push_back ({ "node-c", ballot::entry_status::confirmed, "sig_c", {} });
	vote.rounds.push_back (second);
	vote.confirmation_count = 1;
	return vote;
}
}

TEST (query, vote_status_report)
{
	auto vote = make_vote ();
	auto report = ballot::vote_status_report::from (vote);
	ASSERT_EQ (7, report.vote);
	ASSERT_EQ (2, report.round);
	ASSERT_EQ (ballot::vote_status::pending, report.status);
	ASSERT_EQ (3, report.log_entries.size ());
	ASSERT_EQ (1, report.log_entries[0].round);
	ASSERT_EQ (2, report.log_entries[2].round);
	ASSERT_EQ ("node-c", report.log_entries[2].entry.node);
}

TEST (query, vote_status_report_ptree)
{
	auto vote = make_vote ();
	auto tree = ballot::vote_status_report::from (vote).to_ptree ();
	ASSERT_EQ ("pending", tree.get<std::string> ("status"));
	ASSERT_EQ (1, tree.get<uint32_t> ("confirmation_count"));
	ASSERT_EQ (2, tree.get<uint32_t> ("required_confirmations"));
	ASSERT_EQ (vote.fingerprint.to_string (), tree.get<std::string> ("fingerprint"));
	auto const & entries = tree.get_child ("log_entries");
	ASSERT_EQ (3, entries.size ());
	auto const & first = entries.begin ()->second;
	ASSERT_EQ ("node-a", first.get<std::string> ("node"));
	ASSERT_EQ ("rejected", first.get<std::string> ("status"));
	ASSERT_EQ (1, first.get<uint32_t> ("round"));
}

TEST (query, node_summaries)
{
	ballot::election_node node;
	node.id = "node-a";
	node.address = "127.0.0.1:7100";
	node.status = ballot::node_status::unreachable;
	node.response_time_ms = 12.5;
	node.uptime_percentage = 50.0;
	auto summary = ballot::node_summary::from (node);
	ASSERT_EQ ("node-a", summary.id);
	ASSERT_EQ (ballot::node_status::unreachable, summary.status);

	auto tree = ballot::to_ptree (std::vector<ballot::node_summary>{ summary, summary });
	ASSERT_EQ (2, tree.size ());
	auto const & first = tree.begin ()->second;
	ASSERT_EQ ("unreachable", first.get<std::string> ("status"));
	ASSERT_EQ ("127.0.0.1:7100", first.get<std::string> ("address"));
	ASSERT_DOUBLE_EQ (12.5, first.get<double> ("response_time_ms"));
	ASSERT_DOUBLE_EQ (50.0, first.get<double> ("uptime_percentage"));
}

TEST (query, election_stats)
{
	ballot::election_stats stats;
	stats.election = 3;
	stats.add (ballot::vote_status::finalized);
	stats.add (ballot::vote_status::finalized);
	stats.add (ballot::vote_status::pending);
	stats.add (ballot::vote_status::failed);
	stats.add (ballot::vote_status::expired);
	ASSERT_EQ (5, stats.total);
	ASSERT_EQ (2, stats.finalized);
	ASSERT_EQ (1, stats.pending);
	ASSERT_EQ (1, stats.failed);
	ASSERT_EQ (1, stats.expired);

	auto tree = stats.to_ptree ();
	ASSERT_EQ (3, tree.get<uint64_t> ("election"));
	ASSERT_EQ (5, tree.get<uint64_t> ("total"));
	ASSERT_EQ (2, tree.get<uint64_t> ("finalized"));
}
