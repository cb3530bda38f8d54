#pragma once

#include <ballot/lib/errors.hpp>
#include <ballot/node/fwd.hpp>
#include <ballot/secure/common.hpp>

#include <chrono>
#include <optional>
#include <system_error>

namespace ballot
{
class consensus_config final
{
public:
	ballot::error serialize (ballot::tomlconfig &) const;
	ballot::error deserialize (ballot::tomlconfig &);

public:
	/** Quorum every new vote is created with */
	uint32_t required_confirmations{ 3 };
	/** Failed rounds after which a vote is given up and marked failed */
	uint32_t max_rounds{ 3 };
	/** Entries still pending this long after the round opened are timed out */
	std::chrono::milliseconds round_timeout{ 30 * 1000 };
	/** How often open rounds are checked for timeouts */
	std::chrono::milliseconds sweep_interval{ 1000 };
};

class round_result final
{
public:
	std::error_code code;
	ballot::consensus_round round;
};

/**
 * Opens confirmation rounds for votes and records node confirmations into them.
 * Every operation holds the lock of the vote it works on for its whole duration.
 */
class round_manager final
{
public:
	round_manager (ballot::consensus_config const &, ballot::vote_store &, ballot::node_registry &, ballot::elections &, ballot::stats &, ballot::logger &);

	/**
	 * Closes the current round of \p vote and opens the next one with the best active nodes of the election.
	 * When \p expected_round is set the round is only opened if the vote is still in that round, which makes concurrent reopen attempts collapse into one.
	 * @returns error_consensus::insufficient_nodes when no node is active, the vote is left untouched
	 * @returns error_consensus::round_exhausted when max_rounds rounds were already opened
	 */
	ballot::round_result open_round (ballot::vote_id vote, std::optional<uint32_t> expected_round = std::nullopt);

	/**
	 * Applies \p outcome to the pending entry of \p node in the current round and recomputes the confirmation count.
	 * Repeating a confirmation already applied is a no-op.
	 * @returns error_consensus::unknown_round_entry for stale or unknown entries, error_consensus::election_ended once the election is over
	 */
	std::error_code record_confirmation (ballot::vote_id vote, ballot::node_id const & node, ballot::confirmation outcome);

	/**
	 * Abandons the current round and moves a pending vote to expired
	 * @returns true if the vote changed
	 */
	bool expire (ballot::vote_id vote, ballot::timestamp_t now = std::chrono::system_clock::now ());

	/** Gives up a pending vote whose next round could not be opened, returns true if the vote changed */
	bool fail (ballot::vote_id vote, ballot::timestamp_t now = std::chrono::system_clock::now ());

	/** Number of confirmed entries in the current round */
	static uint32_t confirmations (ballot::vote const &);
	/** Times out leftover entries and closes the current round, returns the number of timed out entries */
	static size_t close_round (ballot::vote &, ballot::timestamp_t now);

private: // Dependencies
	ballot::consensus_config const & config;
	ballot::vote_store & store;
	ballot::node_registry & registry;
	ballot::elections & elections;
	ballot::stats & stats;
	ballot::logger & logger;

private:
	bool terminate (ballot::vote_id, ballot::vote_status, ballot::timestamp_t now);
	/** error_consensus::election_ended or election_not_active unless votes of \p election may progress */
	std::error_code check_election (ballot::election_id election) const;
};
}
