#pragma once

#include <ballot/lib/observer_set.hpp>
#include <ballot/node/fwd.hpp>
#include <ballot/secure/common.hpp>

#include <chrono>
#include <system_error>

namespace ballot
{
class evaluation_result final
{
public:
	ballot::consensus_outcome outcome{ ballot::consensus_outcome::still_pending };
	/** Set when the vote could not be evaluated, outcome is still_pending in that case */
	std::error_code code;
};

/**
 * Decides whether the current round of a vote reached quorum.
 * Evaluation is idempotent, a finalized vote keeps evaluating to finalized and observers only fire on the transition.
 */
class consensus_evaluator final
{
public:
	consensus_evaluator (ballot::consensus_config const &, ballot::vote_store &, ballot::elections &, ballot::stats &, ballot::logger &);

	ballot::evaluation_result evaluate (ballot::vote_id, ballot::timestamp_t now = std::chrono::system_clock::now ());

public: // Events, notified outside of the vote lock
	ballot::observer_set<ballot::vote const &> vote_finalized;
	/** A round settled without quorum while rounds remain, arguments are the vote and the failed round number */
	ballot::observer_set<ballot::vote const &, uint32_t> round_failed;
	/** The last allowed round failed, the vote is now failed */
	ballot::observer_set<ballot::vote const &> vote_failed;

private: // Dependencies
	ballot::consensus_config const & config;
	ballot::vote_store & store;
	ballot::elections & elections;
	ballot::stats & stats;
	ballot::logger & logger;
};
}
