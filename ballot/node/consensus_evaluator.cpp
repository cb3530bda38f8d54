#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/node/consensus_evaluator.hpp>
#include <ballot/node/elections.hpp>
#include <ballot/node/round_manager.hpp>
#include <ballot/node/vote_store.hpp>

ballot::consensus_evaluator::consensus_evaluator (ballot::consensus_config const & config_a, ballot::vote_store & store_a, ballot::elections & elections_a, ballot::stats & stats_a, ballot::logger & logger_a) :
	config{ config_a },
	store{ store_a },
	elections{ elections_a },
	stats{ stats_a },
	logger{ logger_a }
{
}

ballot::evaluation_result ballot::consensus_evaluator::evaluate (ballot::vote_id vote_id, ballot::timestamp_t now)
{
	enum class transition
	{
		none,
		finalized,
		round_failed,
		vote_failed,
	};

	ballot::evaluation_result result;
	auto record = store.record (vote_id);
	if (!record)
	{
		result.code = ballot::error_consensus::unknown_vote;
		return result;
	}

	stats.inc (ballot::stat::type::evaluator, ballot::stat::detail::evaluate);

	transition transition_l{ transition::none };
	uint32_t round_number{ 0 };
	ballot::vote snapshot;
	{
		ballot::lock_guard<ballot::mutex> lock{ record->mutex };
		auto & vote = record->vote;

		switch (vote.status)
		{
			case ballot::vote_status::finalized:
				result.outcome = ballot::consensus_outcome::finalized;
				return result;
			case ballot::vote_status::failed:
			case ballot::vote_status::expired:
				result.outcome = ballot::consensus_outcome::failed;
				return result;
			case ballot::vote_status::pending:
				break;
		}

		auto round = vote.current_round ();
		if (round == nullptr)
		{
			return result;
		}
		if (!elections.active (vote.election))
		{
			// Rounds of ended elections are abandoned, the vote expires with the election
			result.code = ballot::error_consensus::election_ended;
			return result;
		}
		if (!round->open)
		{
			// Previous failure is already known, waiting for the next round
			result.outcome = ballot::consensus_outcome::failed;
			return result;
		}

		if (now - round->opened > config.round_timeout)
		{
			if (auto timed_out = round->time_out_pending (now); timed_out > 0)
			{
				stats.add (ballot::stat::type::evaluator, ballot::stat::detail::timed_out, timed_out);
				logger.debug (ballot::log::type::evaluator, "Timed out {} entries of round {} for vote {}", timed_out, round->number, vote.id);
			}
		}

		vote.confirmation_count = ballot::round_manager::confirmations (vote);
		round_number = round->number;

		if (vote.confirmation_count >= vote.required_confirmations)
		{
			debug_assert (ballot::valid_change (vote.status, ballot::vote_status::finalized));
			ballot::round_manager::close_round (vote, now);
			vote.status = ballot::vote_status::finalized;
			transition_l = transition::finalized;
			result.outcome = ballot::consensus_outcome::finalized;
		}
		else if (round->settled ())
		{
			ballot::round_manager::close_round (vote, now);
			if (round->number >= config.max_rounds)
			{
				vote.status = ballot::vote_status::failed;
				transition_l = transition::vote_failed;
			}
			else
			{
				transition_l = transition::round_failed;
			}
			result.outcome = ballot::consensus_outcome::failed;
		}
		if (transition_l != transition::none)
		{
			snapshot = vote;
		}
	}

	stats.inc (ballot::stat::type::evaluator, ballot::to_stat_detail (result.outcome));

	switch (transition_l)
	{
		case transition::none:
			break;
		case transition::finalized:
		{
			auto duration = std::chrono::duration_cast<std::chrono::milliseconds> (now - snapshot.created);
			stats.sample (ballot::stat::sample::vote_finalize_duration, duration.count ());
			logger.info (ballot::log::type::evaluator, "Vote {} finalized in round {} with {}/{} confirmations", snapshot.id, round_number, snapshot.confirmation_count, snapshot.required_confirmations);
			vote_finalized.notify (snapshot);
			break;
		}
		case transition::round_failed:
			stats.inc (ballot::stat::type::evaluator, ballot::stat::detail::round_failed);
			logger.info (ballot::log::type::evaluator, "Round {} of vote {} failed with {}/{} confirmations", round_number, snapshot.id, snapshot.confirmation_count, snapshot.required_confirmations);
			round_failed.notify (snapshot, round_number);
			break;
		case transition::vote_failed:
			stats.inc (ballot::stat::type::evaluator, ballot::stat::detail::vote_failed);
			logger.warn (ballot::log::type::evaluator, "Vote {} failed, all {} rounds exhausted", snapshot.id, round_number);
			vote_failed.notify (snapshot);
			break;
	}
	return result;
}
