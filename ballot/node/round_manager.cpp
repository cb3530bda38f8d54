#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/lib/tomlconfig.hpp>
#include <ballot/node/elections.hpp>
#include <ballot/node/node_registry.hpp>
#include <ballot/node/round_manager.hpp>
#include <ballot/node/vote_store.hpp>

#include <algorithm>

ballot::round_manager::round_manager (ballot::consensus_config const & config_a, ballot::vote_store & store_a, ballot::node_registry & registry_a, ballot::elections & elections_a, ballot::stats & stats_a, ballot::logger & logger_a) :
	config{ config_a },
	store{ store_a },
	registry{ registry_a },
	elections{ elections_a },
	stats{ stats_a },
	logger{ logger_a }
{
}

std::error_code ballot::round_manager::check_election (ballot::election_id election) const
{
	auto status = elections.status (election);
	if (!status)
	{
		return ballot::error_consensus::unknown_election;
	}
	switch (*status)
	{
		case ballot::election_status::active:
			return {};
		case ballot::election_status::completed:
			return ballot::error_consensus::election_ended;
		case ballot::election_status::upcoming:
			break;
	}
	return ballot::error_consensus::election_not_active;
}

ballot::round_result ballot::round_manager::open_round (ballot::vote_id vote_id, std::optional<uint32_t> expected_round)
{
	ballot::round_result result;

	auto record = store.record (vote_id);
	if (!record)
	{
		result.code = ballot::error_consensus::unknown_vote;
		return result;
	}

	ballot::lock_guard<ballot::mutex> lock{ record->mutex };
	auto & vote = record->vote;

	if (vote.status != ballot::vote_status::pending)
	{
		result.code = ballot::error_consensus::vote_not_pending;
		return result;
	}
	if (auto code = check_election (vote.election))
	{
		result.code = code;
		return result;
	}
	if (expected_round && *expected_round != vote.round_number ())
	{
		stats.inc (ballot::stat::type::round_manager, ballot::stat::detail::stale);
		result.code = ballot::error_consensus::round_superseded;
		return result;
	}
	if (vote.round_number () >= config.max_rounds)
	{
		stats.inc (ballot::stat::type::round_manager, ballot::stat::detail::round_exhausted);
		result.code = ballot::error_consensus::round_exhausted;
		return result;
	}

	auto nodes = registry.select_active_nodes (vote.election, vote.required_confirmations);
	if (nodes.empty ())
	{
		stats.inc (ballot::stat::type::round_manager, ballot::stat::detail::insufficient_nodes);
		logger.warn (ballot::log::type::round_manager, "No active nodes for vote {} in election {}", vote.id, vote.election);
		result.code = ballot::error_consensus::insufficient_nodes;
		return result;
	}
	if (nodes.size () < vote.required_confirmations)
	{
		// The round can still settle, it just cannot reach quorum unless nodes are added
		logger.debug (ballot::log::type::round_manager, "Only {} of {} nodes available for vote {}", nodes.size (), vote.required_confirmations, vote.id);
	}

	auto now = std::chrono::system_clock::now ();
	if (vote.current_round () != nullptr)
	{
		close_round (vote, now);
	}

	ballot::consensus_round round;
	round.number = vote.round_number () + 1;
	round.open = true;
	round.opened = now;
	for (auto const & node : nodes)
	{
		round.entries.push_back ({ node.id, ballot::entry_status::pending, ballot::signature_token (vote.fingerprint, node.id), now });
	}
	vote.rounds.push_back (round);
	vote.confirmation_count = 0;

	stats.inc (ballot::stat::type::round_manager, ballot::stat::detail::round_opened);
	logger.debug (ballot::log::type::round_manager, "Opened round {} for vote {} with {} nodes", round.number, vote.id, round.entries.size ());
	logger.trace (ballot::log::type::round_manager, ballot::log::detail::round_opened, "Round {} for vote {}: {}", round.number, vote.id,
	ballot::util::join (round.entries, ", ", [] (auto const & entry) { return entry.node; }));

	result.round = std::move (round);
	return result;
}

std::error_code ballot::round_manager::record_confirmation (ballot::vote_id vote_id, ballot::node_id const & node, ballot::confirmation outcome)
{
	auto record = store.record (vote_id);
	if (!record)
	{
		return ballot::error_consensus::unknown_vote;
	}

	ballot::lock_guard<ballot::mutex> lock{ record->mutex };
	auto & vote = record->vote;

	if (auto code = check_election (vote.election); code == ballot::error_consensus::election_ended)
	{
		stats.inc (ballot::stat::type::round_manager, ballot::stat::detail::election_ended_confirmation);
		logger.debug (ballot::log::type::round_manager, "Dropped confirmation from {} for vote {}, election {} ended", node, vote.id, vote.election);
		return code;
	}

	auto round = vote.current_round ();
	auto entry = round != nullptr ? round->find (node) : nullptr;
	if (entry == nullptr)
	{
		stats.inc (ballot::stat::type::round_manager, ballot::stat::detail::unknown_round_entry);
		logger.debug (ballot::log::type::round_manager, "No entry for node {} in the current round of vote {}", node, vote.id);
		return ballot::error_consensus::unknown_round_entry;
	}

	auto status = ballot::to_entry_status (outcome);
	if (entry->status == status)
	{
		stats.inc (ballot::stat::type::round_manager, ballot::stat::detail::duplicate);
		return {};
	}
	if (entry->status != ballot::entry_status::pending || !round->open || vote.status != ballot::vote_status::pending)
	{
		stats.inc (ballot::stat::type::round_manager, ballot::stat::detail::unknown_round_entry);
		logger.debug (ballot::log::type::round_manager, "Stale {} from node {} for round {} of vote {} (entry: {})", ballot::to_string (outcome), node, round->number, vote.id, ballot::to_string (entry->status));
		return ballot::error_consensus::unknown_round_entry;
	}

	entry->status = status;
	entry->timestamp = std::chrono::system_clock::now ();
	vote.confirmation_count = confirmations (vote);

	stats.inc (ballot::stat::type::round_manager, outcome == ballot::confirmation::confirmed ? ballot::stat::detail::confirmed : ballot::stat::detail::rejected);
	logger.trace (ballot::log::type::round_manager, ballot::log::detail::confirmation_recorded, "Node {} {} round {} of vote {} ({}/{})", node, ballot::to_string (outcome), round->number, vote.id, vote.confirmation_count, vote.required_confirmations);
	return {};
}

bool ballot::round_manager::expire (ballot::vote_id vote_id, ballot::timestamp_t now)
{
	auto result = terminate (vote_id, ballot::vote_status::expired, now);
	if (result)
	{
		stats.inc (ballot::stat::type::round_manager, ballot::stat::detail::vote_expired);
	}
	return result;
}

bool ballot::round_manager::fail (ballot::vote_id vote_id, ballot::timestamp_t now)
{
	auto result = terminate (vote_id, ballot::vote_status::failed, now);
	if (result)
	{
		stats.inc (ballot::stat::type::round_manager, ballot::stat::detail::vote_failed);
	}
	return result;
}

bool ballot::round_manager::terminate (ballot::vote_id vote_id, ballot::vote_status status, ballot::timestamp_t now)
{
	auto record = store.record (vote_id);
	if (!record)
	{
		return false;
	}

	ballot::lock_guard<ballot::mutex> lock{ record->mutex };
	auto & vote = record->vote;
	if (!ballot::valid_change (vote.status, status))
	{
		return false;
	}
	close_round (vote, now);
	vote.status = status;
	return true;
}

uint32_t ballot::round_manager::confirmations (ballot::vote const & vote)
{
	auto round = vote.current_round ();
	return round != nullptr ? static_cast<uint32_t> (round->count (ballot::entry_status::confirmed)) : 0;
}

size_t ballot::round_manager::close_round (ballot::vote & vote, ballot::timestamp_t now)
{
	size_t result = 0;
	auto round = vote.current_round ();
	if (round != nullptr && round->open)
	{
		result = round->time_out_pending (now);
		round->open = false;
	}
	return result;
}

/*
 * consensus_config
 */

ballot::error ballot::consensus_config::serialize (ballot::tomlconfig & toml) const
{
	toml.put ("required_confirmations", required_confirmations, "Number of node confirmations a vote needs to be finalized.\ntype:uint32");
	toml.put ("max_rounds", max_rounds, "Maximum number of confirmation rounds per vote. A vote whose last round fails is marked failed.\ntype:uint32");
	toml.put ("round_timeout", round_timeout.count (), "Entries of a round still pending after this long are timed out.\ntype:milliseconds");
	toml.put ("sweep_interval", sweep_interval.count (), "How often open rounds are checked for timeouts.\ntype:milliseconds");

	return toml.get_error ();
}

ballot::error ballot::consensus_config::deserialize (ballot::tomlconfig & toml)
{
	toml.get ("required_confirmations", required_confirmations);
	toml.get ("max_rounds", max_rounds);
	toml.get_duration ("round_timeout", round_timeout);
	toml.get_duration ("sweep_interval", sweep_interval);

	if (required_confirmations == 0)
	{
		toml.get_error ().set ("required_confirmations must be greater than 0");
	}
	if (max_rounds == 0)
	{
		toml.get_error ().set ("max_rounds must be greater than 0");
	}

	return toml.get_error ();
}
