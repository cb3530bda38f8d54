#include <ballot/test_common/consensus.hpp>
#include <ballot/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST (round_manager, open)
{
	ballot::test::consensus_context context;
	auto vote = context.cast ("alice");
	auto result = context.rounds.open_round (vote.id);
	ASSERT_NO_ERROR (result.code);
	ASSERT_EQ (1, result.round.number);
	ASSERT_TRUE (result.round.open);
	// One entry per required confirmation
	ASSERT_EQ (3, result.round.entries.size ());
	for (auto const & entry : result.round.entries)
	{
		ASSERT_EQ (ballot::entry_status::pending, entry.status);
		ASSERT_EQ (ballot::signature_token (vote.fingerprint, entry.node), entry.signature);
		ASSERT_EQ (0, entry.signature.find ("sig_"));
	}
	auto stored = context.store.get (vote.id);
	ASSERT_EQ (1, stored->rounds.size ());
	ASSERT_EQ (1, stored->round_number ());
	ASSERT_EQ (0, stored->confirmation_count);
	ASSERT_EQ (1, context.stats.count (ballot::stat::type::round_manager, ballot::stat::detail::round_opened));
}

TEST (round_manager, open_unknown_vote)
{
	ballot::test::consensus_context context;
	ASSERT_EQ (ballot::error_consensus::unknown_vote, context.rounds.open_round (42).code);
}

// Round numbers strictly increase and only the newest round is open
TEST (round_manager, reopen)
{
	ballot::test::consensus_context context;
	auto vote = context.cast ("alice");
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	auto first = context.round_nodes (vote.id);
	ASSERT_NO_ERROR (context.rounds.record_confirmation (vote.id, first[0], ballot::confirmation::confirmed));
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	auto stored = context.store.get (vote.id);
	ASSERT_EQ (2, stored->rounds.size ());
	ASSERT_EQ (1, stored->rounds[0].number);
	ASSERT_EQ (2, stored->rounds[1].number);
	ASSERT_FALSE (stored->rounds[0].open);
	ASSERT_TRUE (stored->rounds[1].open);
	// Leftover entries of the closed round are timed out
	ASSERT_EQ (ballot::entry_status::confirmed, stored->rounds[0].entries[0].status);
	ASSERT_EQ (2, stored->rounds[0].count (ballot::entry_status::timed_out));
	// Counts only reflect the current round
	ASSERT_EQ (0, stored->confirmation_count);
	ASSERT_EQ (3, stored->rounds[1].count (ballot::entry_status::pending));
}

TEST (round_manager, superseded)
{
	ballot::test::consensus_context context;
	auto vote = context.cast ("alice");
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id, 0).code);
	// A second attempt to open the first round collapses into the first one
	ASSERT_EQ (ballot::error_consensus::round_superseded, context.rounds.open_round (vote.id, 0).code);
	ASSERT_EQ (1, context.store.get (vote.id)->rounds.size ());
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id, 1).code);
	ASSERT_EQ (2, context.store.get (vote.id)->round_number ());
}

TEST (round_manager, exhausted)
{
	ballot::test::consensus_context context;
	context.config.max_rounds = 2;
	auto vote = context.cast ("alice");
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	ASSERT_EQ (ballot::error_consensus::round_exhausted, context.rounds.open_round (vote.id).code);
	ASSERT_EQ (2, context.store.get (vote.id)->round_number ());
}

TEST (round_manager, insufficient_nodes)
{
	ballot::test::consensus_context context{ 0 };
	auto vote = context.cast ("alice");
	ASSERT_EQ (ballot::error_consensus::insufficient_nodes, context.rounds.open_round (vote.id).code);
	auto stored = context.store.get (vote.id);
	ASSERT_TRUE (stored->rounds.empty ());
	ASSERT_EQ (ballot::vote_status::pending, stored->status);
}

// Fewer active nodes than required still opens a round
TEST (round_manager, partial_round)
{
	ballot::test::consensus_context context{ 2 };
	auto vote = context.cast ("alice");
	auto result = context.rounds.open_round (vote.id);
	ASSERT_NO_ERROR (result.code);
	ASSERT_EQ (2, result.round.entries.size ());
}

TEST (round_manager, election_not_active)
{
	ballot::test::consensus_context context;
	auto upcoming = context.elections.create ("upcoming", 3).id;
	context.registry.add (upcoming, "node");
	auto result = context.store.create ("alice", "candidate", upcoming, 3);
	ASSERT_NO_ERROR (result.code);
	ASSERT_EQ (ballot::error_consensus::election_not_active, context.rounds.open_round (result.vote.id).code);
}

TEST (round_manager, confirmation)
{
	ballot::test::consensus_context context;
	auto vote = context.cast ("alice");
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	auto nodes = context.round_nodes (vote.id);
	ASSERT_NO_ERROR (context.rounds.record_confirmation (vote.id, nodes[0], ballot::confirmation::confirmed));
	ASSERT_EQ (1, context.store.get (vote.id)->confirmation_count);
	ASSERT_NO_ERROR (context.rounds.record_confirmation (vote.id, nodes[1], ballot::confirmation::rejected));
	ASSERT_EQ (1, context.store.get (vote.id)->confirmation_count);
	ASSERT_NO_ERROR (context.rounds.record_confirmation (vote.id, nodes[2], ballot::confirmation::confirmed));
	auto stored = context.store.get (vote.id);
	ASSERT_EQ (2, stored->confirmation_count);
	ASSERT_EQ (ballot::entry_status::rejected, stored->current_round ()->find (nodes[1])->status);
	// Confirmations never change the vote status, only evaluation does
	ASSERT_EQ (ballot::vote_status::pending, stored->status);
}

TEST (round_manager, confirmation_repeated)
{
	ballot::test::consensus_context context;
	auto vote = context.cast ("alice");
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	auto nodes = context.round_nodes (vote.id);
	ASSERT_NO_ERROR (context.rounds.record_confirmation (vote.id, nodes[0], ballot::confirmation::confirmed));
	ASSERT_NO_ERROR (context.rounds.record_confirmation (vote.id, nodes[0], ballot::confirmation::confirmed));
	ASSERT_EQ (1, context.store.get (vote.id)->confirmation_count);
	// An answered entry cannot change its mind
	ASSERT_EQ (ballot::error_consensus::unknown_round_entry, context.rounds.record_confirmation (vote.id, nodes[0], ballot::confirmation::rejected));
	ASSERT_EQ (1, context.store.get (vote.id)->confirmation_count);
}

TEST (round_manager, confirmation_unknown)
{
	ballot::test::consensus_context context;
	auto vote = context.cast ("alice");
	ASSERT_EQ (ballot::error_consensus::unknown_vote, context.rounds.record_confirmation (42, "node", ballot::confirmation::confirmed));
	// No round yet
	ASSERT_EQ (ballot::error_consensus::unknown_round_entry, context.rounds.record_confirmation (vote.id, "node", ballot::confirmation::confirmed));
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	ASSERT_EQ (ballot::error_consensus::unknown_round_entry, context.rounds.record_confirmation (vote.id, "node", ballot::confirmation::confirmed));
}

TEST (round_manager, confirmation_outsider)
{
	ballot::test::consensus_context context;
	auto vote = context.cast ("alice");
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	auto nodes = context.round_nodes (vote.id);
	// Nodes outside the current round are rejected
	auto all = context.registry.nodes (context.election);
	auto outsider = std::find_if (all.begin (), all.end (), [&nodes] (auto const & node) {
		return std::find (nodes.begin (), nodes.end (), node.id) == nodes.end ();
	});
	ASSERT_NE (all.end (), outsider);
	ASSERT_EQ (ballot::error_consensus::unknown_round_entry, context.rounds.record_confirmation (vote.id, outsider->id, ballot::confirmation::confirmed));
	ASSERT_EQ (0, context.store.get (vote.id)->confirmation_count);
}

TEST (round_manager, expire)
{
	ballot::test::consensus_context context;
	auto vote = context.cast ("alice");
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	auto nodes = context.round_nodes (vote.id);
	ASSERT_TRUE (context.rounds.expire (vote.id));
	ASSERT_FALSE (context.rounds.expire (vote.id));
	auto stored = context.store.get (vote.id);
	ASSERT_EQ (ballot::vote_status::expired, stored->status);
	ASSERT_FALSE (stored->current_round ()->open);
	ASSERT_EQ (3, stored->current_round ()->count (ballot::entry_status::timed_out));
	ASSERT_EQ (ballot::error_consensus::unknown_round_entry, context.rounds.record_confirmation (vote.id, nodes[0], ballot::confirmation::confirmed));
	ASSERT_EQ (ballot::error_consensus::vote_not_pending, context.rounds.open_round (vote.id).code);
	// Terminal statuses never change
	ASSERT_FALSE (context.rounds.fail (vote.id));
	ASSERT_EQ (ballot::vote_status::expired, context.store.get (vote.id)->status);
}

TEST (round_manager, fail)
{
	ballot::test::consensus_context context;
	auto vote = context.cast ("alice");
	ASSERT_TRUE (context.rounds.fail (vote.id));
	ASSERT_EQ (ballot::vote_status::failed, context.store.get (vote.id)->status);
	ASSERT_FALSE (context.rounds.expire (vote.id));
	ASSERT_FALSE (context.rounds.fail (42));
}

// Confirmations arriving after the election ended are dropped
TEST (round_manager, election_ended)
{
	ballot::test::consensus_context context;
	auto vote = context.cast ("alice");
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	auto nodes = context.round_nodes (vote.id);
	ASSERT_NO_ERROR (context.elections.end (context.election));
	ASSERT_EQ (ballot::error_consensus::election_ended, context.rounds.record_confirmation (vote.id, nodes[0], ballot::confirmation::confirmed));
	ASSERT_EQ (ballot::error_consensus::election_ended, context.rounds.open_round (vote.id).code);
	ASSERT_EQ (ballot::entry_status::pending, context.store.get (vote.id)->current_round ()->entries[0].status);
	ASSERT_EQ (1, context.stats.count (ballot::stat::type::round_manager, ballot::stat::detail::election_ended_confirmation));
}

// Confirmations for one vote arrive from many threads while the vote is being evaluated, every entry changes once
TEST (round_manager, concurrent_confirmations)
{
	ballot::test::consensus_context context;
	std::atomic<unsigned> finalized{ 0 };
	context.evaluator.vote_finalized.add ([&finalized] (ballot::vote const &) {
		++finalized;
	});
	auto vote = context.cast ("alice");
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	auto nodes = context.round_nodes (vote.id);
	ASSERT_EQ (3, nodes.size ());

	std::atomic<bool> done{ false };
	std::atomic<bool> overcounted{ false };
	std::thread evaluator ([&context, &done, &overcounted, id = vote.id] () {
		while (!done)
		{
			context.evaluator.evaluate (id);
			auto current = context.store.get (id);
			auto round = current->current_round ();
			if (current->confirmation_count > round->count (ballot::entry_status::confirmed) || current->confirmation_count > current->required_confirmations)
			{
				overcounted = true;
			}
		}
	});
	std::atomic<unsigned> errors{ 0 };
	std::vector<std::thread> threads;
	for (auto i = 0; i < 8; ++i)
	{
		threads.emplace_back ([&context, &errors, &nodes, i, id = vote.id] () {
			for (size_t j = 0; j < nodes.size (); ++j)
			{
				auto const & node = nodes[(i + j) % nodes.size ()];
				if (context.rounds.record_confirmation (id, node, ballot::confirmation::confirmed))
				{
					++errors;
				}
			}
		});
	}
	for (auto & thread : threads)
	{
		thread.join ();
	}
	done = true;
	evaluator.join ();

	ASSERT_EQ (ballot::consensus_outcome::finalized, context.evaluator.evaluate (vote.id).outcome);
	ASSERT_EQ (0, errors);
	ASSERT_FALSE (overcounted);
	ASSERT_EQ (1, finalized);
	// One transition per entry, every other answer was a repeat
	ASSERT_EQ (3, context.stats.count (ballot::stat::type::round_manager, ballot::stat::detail::confirmed));
	ASSERT_EQ (8 * 3 - 3, context.stats.count (ballot::stat::type::round_manager, ballot::stat::detail::duplicate));
	auto stored = context.store.get (vote.id);
	ASSERT_EQ (ballot::vote_status::finalized, stored->status);
	ASSERT_EQ (stored->current_round ()->count (ballot::entry_status::confirmed), stored->confirmation_count);
	ASSERT_EQ (3, stored->confirmation_count);
}

// Conflicting answers for the same entry race, only the first one is applied
TEST (round_manager, concurrent_conflicting_confirmations)
{
	ballot::test::consensus_context context;
	auto vote = context.cast ("alice");
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	auto nodes = context.round_nodes (vote.id);
	std::atomic<unsigned> applied{ 0 };
	std::vector<std::thread> threads;
	for (auto const & node : nodes)
	{
		for (auto outcome : { ballot::confirmation::confirmed, ballot::confirmation::rejected })
		{
			threads.emplace_back ([&context, &applied, node, outcome, id = vote.id] () {
				if (!context.rounds.record_confirmation (id, node, outcome))
				{
					++applied;
				}
			});
		}
	}
	for (auto & thread : threads)
	{
		thread.join ();
	}
	ASSERT_EQ (nodes.size (), applied);
	auto confirmed = context.stats.count (ballot::stat::type::round_manager, ballot::stat::detail::confirmed);
	auto rejected = context.stats.count (ballot::stat::type::round_manager, ballot::stat::detail::rejected);
	ASSERT_EQ (nodes.size (), confirmed + rejected);
	auto stored = context.store.get (vote.id);
	ASSERT_EQ (0, stored->current_round ()->count (ballot::entry_status::pending));
	ASSERT_EQ (confirmed, stored->confirmation_count);
	auto expected = confirmed == stored->required_confirmations ? ballot::consensus_outcome::finalized : ballot::consensus_outcome::failed;
	ASSERT_EQ (expected, context.evaluator.evaluate (vote.id).outcome);
}
