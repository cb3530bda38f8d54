#include <ballot/test_common/consensus.hpp>
#include <ballot/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <atomic>

using namespace std::chrono_literals;

TEST (consensus_evaluator, unknown_vote)
{
	ballot::test::consensus_context context;
	auto result = context.evaluator.evaluate (42);
	ASSERT_EQ (ballot::error_consensus::unknown_vote, result.code);
	ASSERT_EQ (ballot::consensus_outcome::still_pending, result.outcome);
}

TEST (consensus_evaluator, no_round)
{
	ballot::test::consensus_context context;
	auto vote = context.cast ("alice");
	auto result = context.evaluator.evaluate (vote.id);
	ASSERT_NO_ERROR (result.code);
	ASSERT_EQ (ballot::consensus_outcome::still_pending, result.outcome);
}

TEST (consensus_evaluator, still_pending)
{
	ballot::test::consensus_context context;
	auto vote = context.cast ("alice");
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	auto nodes = context.round_nodes (vote.id);
	ASSERT_NO_ERROR (context.rounds.record_confirmation (vote.id, nodes[0], ballot::confirmation::confirmed));
	ASSERT_NO_ERROR (context.rounds.record_confirmation (vote.id, nodes[1], ballot::confirmation::confirmed));
	auto result = context.evaluator.evaluate (vote.id);
	ASSERT_EQ (ballot::consensus_outcome::still_pending, result.outcome);
	ASSERT_EQ (ballot::vote_status::pending, context.store.get (vote.id)->status);
	ASSERT_TRUE (context.store.get (vote.id)->current_round ()->open);
}

TEST (consensus_evaluator, finalize)
{
	ballot::test::consensus_context context;
	std::atomic<unsigned> finalized{ 0 };
	context.evaluator.vote_finalized.add ([&finalized] (ballot::vote const & vote) {
		ASSERT_EQ (ballot::vote_status::finalized, vote.status);
		++finalized;
	});
	auto vote = context.cast ("alice");
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	for (auto const & node : context.round_nodes (vote.id))
	{
		ASSERT_NO_ERROR (context.rounds.record_confirmation (vote.id, node, ballot::confirmation::confirmed));
	}
	auto result = context.evaluator.evaluate (vote.id);
	ASSERT_NO_ERROR (result.code);
	ASSERT_EQ (ballot::consensus_outcome::finalized, result.outcome);
	auto stored = context.store.get (vote.id);
	ASSERT_EQ (ballot::vote_status::finalized, stored->status);
	ASSERT_EQ (3, stored->confirmation_count);
	ASSERT_FALSE (stored->current_round ()->open);
	ASSERT_EQ (1, finalized);
	ASSERT_EQ (1, context.stats.samples (ballot::stat::sample::vote_finalize_duration).size ());
}

// Evaluating a finalized vote again reports the same outcome without new side effects
TEST (consensus_evaluator, idempotent)
{
	ballot::test::consensus_context context;
	std::atomic<unsigned> finalized{ 0 };
	context.evaluator.vote_finalized.add ([&finalized] (ballot::vote const &) {
		++finalized;
	});
	auto vote = context.cast ("alice");
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	for (auto const & node : context.round_nodes (vote.id))
	{
		ASSERT_NO_ERROR (context.rounds.record_confirmation (vote.id, node, ballot::confirmation::confirmed));
	}
	ASSERT_EQ (ballot::consensus_outcome::finalized, context.evaluator.evaluate (vote.id).outcome);
	ASSERT_EQ (ballot::consensus_outcome::finalized, context.evaluator.evaluate (vote.id).outcome);
	ASSERT_EQ (ballot::consensus_outcome::finalized, context.evaluator.evaluate (vote.id).outcome);
	ASSERT_EQ (1, finalized);
	ASSERT_EQ (1, context.store.get (vote.id)->rounds.size ());
}

TEST (consensus_evaluator, round_failed)
{
	ballot::test::consensus_context context;
	std::atomic<unsigned> failed_rounds{ 0 };
	std::atomic<uint32_t> failed_round{ 0 };
	context.evaluator.round_failed.add ([&failed_rounds, &failed_round] (ballot::vote const &, uint32_t round) {
		failed_round = round;
		++failed_rounds;
	});
	auto vote = context.cast ("alice");
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	auto nodes = context.round_nodes (vote.id);
	ASSERT_NO_ERROR (context.rounds.record_confirmation (vote.id, nodes[0], ballot::confirmation::rejected));
	ASSERT_NO_ERROR (context.rounds.record_confirmation (vote.id, nodes[1], ballot::confirmation::rejected));
	ASSERT_NO_ERROR (context.rounds.record_confirmation (vote.id, nodes[2], ballot::confirmation::confirmed));
	auto result = context.evaluator.evaluate (vote.id);
	ASSERT_EQ (ballot::consensus_outcome::failed, result.outcome);
	auto stored = context.store.get (vote.id);
	// Rounds remain, the vote stays pending until the next round settles
	ASSERT_EQ (ballot::vote_status::pending, stored->status);
	ASSERT_EQ (1, stored->confirmation_count);
	ASSERT_FALSE (stored->current_round ()->open);
	ASSERT_EQ (1, failed_rounds);
	ASSERT_EQ (1, failed_round);
	// The failure was already reported
	ASSERT_EQ (ballot::consensus_outcome::failed, context.evaluator.evaluate (vote.id).outcome);
	ASSERT_EQ (1, failed_rounds);
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id, 1).code);
	ASSERT_EQ (ballot::consensus_outcome::still_pending, context.evaluator.evaluate (vote.id).outcome);
}

TEST (consensus_evaluator, vote_failed)
{
	ballot::test::consensus_context context;
	context.config.max_rounds = 2;
	std::atomic<unsigned> failed_rounds{ 0 };
	std::atomic<unsigned> failed_votes{ 0 };
	context.evaluator.round_failed.add ([&failed_rounds] (ballot::vote const &, uint32_t) {
		++failed_rounds;
	});
	context.evaluator.vote_failed.add ([&failed_votes] (ballot::vote const & vote) {
		ASSERT_EQ (ballot::vote_status::failed, vote.status);
		++failed_votes;
	});
	auto vote = context.cast ("alice");
	for (uint32_t round = 1; round <= 2; ++round)
	{
		ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
		for (auto const & node : context.round_nodes (vote.id))
		{
			ASSERT_NO_ERROR (context.rounds.record_confirmation (vote.id, node, ballot::confirmation::rejected));
		}
		ASSERT_EQ (ballot::consensus_outcome::failed, context.evaluator.evaluate (vote.id).outcome);
	}
	ASSERT_EQ (1, failed_rounds);
	ASSERT_EQ (1, failed_votes);
	ASSERT_EQ (ballot::vote_status::failed, context.store.get (vote.id)->status);
	ASSERT_EQ (ballot::error_consensus::vote_not_pending, context.rounds.open_round (vote.id).code);
}

TEST (consensus_evaluator, timeout)
{
	ballot::test::consensus_context context;
	auto vote = context.cast ("alice");
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	auto nodes = context.round_nodes (vote.id);
	ASSERT_NO_ERROR (context.rounds.record_confirmation (vote.id, nodes[0], ballot::confirmation::confirmed));
	ASSERT_NO_ERROR (context.rounds.record_confirmation (vote.id, nodes[1], ballot::confirmation::confirmed));
	// Not timed out yet
	ASSERT_EQ (ballot::consensus_outcome::still_pending, context.evaluator.evaluate (vote.id).outcome);
	auto later = std::chrono::system_clock::now () + context.config.round_timeout + 1s;
	ASSERT_EQ (ballot::consensus_outcome::failed, context.evaluator.evaluate (vote.id, later).outcome);
	auto stored = context.store.get (vote.id);
	ASSERT_EQ (ballot::entry_status::timed_out, stored->current_round ()->find (nodes[2])->status);
	ASSERT_EQ (2, stored->confirmation_count);
}

TEST (consensus_evaluator, election_ended)
{
	ballot::test::consensus_context context;
	auto vote = context.cast ("alice");
	ASSERT_NO_ERROR (context.rounds.open_round (vote.id).code);
	ASSERT_NO_ERROR (context.elections.end (context.election));
	auto result = context.evaluator.evaluate (vote.id);
	ASSERT_EQ (ballot::error_consensus::election_ended, result.code);
	ASSERT_EQ (ballot::consensus_outcome::still_pending, result.outcome);
	ASSERT_TRUE (context.rounds.expire (vote.id));
	ASSERT_EQ (ballot::consensus_outcome::failed, context.evaluator.evaluate (vote.id).outcome);
}
