#include <ballot/lib/thread_roles.hpp>
#include <ballot/node/cache.hpp>
#include <ballot/node/coordinator.hpp>

#include <fmt/format.h>

ballot::coordinator::coordinator (ballot::node_config const & config_a, ballot::notification_sink & sink_a, ballot::cache_invalidator & cache_a, std::string identifier_a) :
	config{ config_a },
	logger{ identifier_a },
	stats{ config.stats_config },
	elections{ stats, logger },
	registry{ config.registry, stats, logger },
	store{ stats, logger },
	rounds{ config.consensus, store, registry, elections, stats, logger },
	evaluator{ config.consensus, store, elections, stats, logger },
	queue{ config.evaluation_queue, stats, logger },
	notifier{ config.notifications, sink_a, stats, logger },
	audit{ stats, logger },
	simulator{ config.simulator, stats, logger },
	sink{ sink_a },
	cache{ cache_a },
	id{ identifier_a },
	solicitor{ config.simulator.enable ? static_cast<ballot::confirmation_solicitor &> (simulator) : manual }
{
	simulator.respond = [this] (ballot::vote_id vote, ballot::node_id const & node, ballot::confirmation outcome) {
		return record_confirmation (vote, node, outcome);
	};
	simulator.heartbeat = [this] (ballot::node_id const & node, double response_time_ms) {
		return heartbeat (node, response_time_ms);
	};

	evaluator.vote_finalized.add ([this] (ballot::vote const & vote) {
		audit.append (ballot::audit_action::vote_finalized, std::to_string (vote.id), vote.fingerprint.to_string ());
		invalidate (vote);
		publish (ballot::notification_type::finalized, vote, vote.round_number ());
	});
	evaluator.round_failed.add ([this] (ballot::vote const & vote, uint32_t round) {
		invalidate (vote);
		publish (ballot::notification_type::round_failed, vote, round);
		stats.inc (ballot::stat::type::coordinator, ballot::stat::detail::reopen_round);
		schedule_open (vote.id, round);
	});
	evaluator.vote_failed.add ([this] (ballot::vote const & vote) {
		audit.append (ballot::audit_action::vote_failed, std::to_string (vote.id), "rounds exhausted");
		invalidate (vote);
		publish (ballot::notification_type::vote_failed, vote, vote.round_number (), ballot::make_error_code (ballot::error_consensus::round_exhausted).message ());
	});
	queue.dead_lettered.add ([this] (ballot::dead_letter const & letter) {
		if (auto vote = store.get (letter.vote))
		{
			publish (ballot::notification_type::evaluation_error, *vote, letter.round, letter.name + ": " + letter.error);
		}
		if (letter.name == "open_round")
		{
			give_up (letter.vote, letter.round, letter.error);
		}
	});
}

ballot::coordinator::~coordinator ()
{
	debug_assert (!sweep_thread.joinable ());
}

void ballot::coordinator::start ()
{
	debug_assert (!sweep_thread.joinable ());

	notifier.start ();
	queue.start ();
	registry.start ();
	simulator.start ();

	sweep_thread = std::thread ([this] () {
		ballot::thread_role::set (ballot::thread_role::name::coordinator_sweep);
		run_sweep ();
	});

	logger.info (ballot::log::type::coordinator, "Coordinator started (quorum: {}, max rounds: {}, simulator: {})", config.consensus.required_confirmations, config.consensus.max_rounds, config.simulator.enable);
}

void ballot::coordinator::stop ()
{
	{
		ballot::lock_guard<ballot::mutex> lock{ mutex };
		stopped = true;
	}
	condition.notify_all ();
	if (sweep_thread.joinable ())
	{
		sweep_thread.join ();
	}

	simulator.stop ();
	registry.stop ();
	queue.stop ();
	notifier.stop ();

	logger.info (ballot::log::type::coordinator, "Coordinator stopped");
}

std::string ballot::coordinator::identifier () const
{
	return id;
}

ballot::election ballot::coordinator::create_election (std::string const & name, std::optional<uint32_t> replication_factor)
{
	auto election = elections.create (name, replication_factor.value_or (config.elections.replication_factor));
	for (uint32_t i = 0; i < election.replication_factor; ++i)
	{
		auto node = registry.add (election.id, config.elections.node_address (election.id, i));
		if (config.simulator.enable)
		{
			simulator.track (node.id);
		}
	}
	audit.append (ballot::audit_action::election_created, std::to_string (election.id), name);
	invalidate (election.id);
	return election;
}

std::error_code ballot::coordinator::start_election (ballot::election_id election)
{
	auto result = elections.start (election);
	if (!result)
	{
		audit.append (ballot::audit_action::election_started, std::to_string (election));
		invalidate (election);

		ballot::notification notification{ ballot::notification_type::election_started, election };
		notifier.publish (notification);
	}
	return result;
}

std::error_code ballot::coordinator::end_election (ballot::election_id election)
{
	auto result = elections.end (election);
	if (result)
	{
		return result;
	}

	auto deactivated = registry.deactivate (election);
	size_t expired = 0;
	auto now = std::chrono::system_clock::now ();
	for (auto vote_id : store.list (election))
	{
		if (expire (vote_id, now))
		{
			++expired;
		}
	}
	audit.append (ballot::audit_action::election_ended, std::to_string (election), fmt::format ("expired votes: {}", expired));
	invalidate (election);

	ballot::notification notification{ ballot::notification_type::election_ended, election };
	notification.message = fmt::format ("{} votes expired", expired);
	notifier.publish (notification);

	logger.info (ballot::log::type::coordinator, "Election {} ended, {} nodes deactivated, {} pending votes expired", election, deactivated, expired);
	return result;
}

ballot::cast_result ballot::coordinator::cast_vote (std::string const & voter, std::string const & candidate, ballot::election_id election)
{
	ballot::cast_result result;

	auto status = elections.status (election);
	if (!status)
	{
		result.code = ballot::error_consensus::unknown_election;
	}
	else if (*status != ballot::election_status::active)
	{
		result.code = ballot::error_consensus::election_not_active;
	}
	else
	{
		auto inserted = store.create (voter, candidate, election, config.consensus.required_confirmations);
		result.code = inserted.code;
		if (!inserted.code)
		{
			result.vote = inserted.vote.id;
			result.fingerprint = inserted.vote.fingerprint;
			result.status = inserted.vote.status;

			audit.append (ballot::audit_action::vote_cast, std::to_string (inserted.vote.id), inserted.vote.fingerprint.to_string ());
			invalidate (inserted.vote);
			schedule_open (inserted.vote.id, 0);
		}
	}

	if (result.code)
	{
		stats.inc (ballot::stat::type::coordinator, ballot::stat::detail::vote_rejected);
		logger.debug (ballot::log::type::coordinator, "Vote from {} in election {} refused: {}", voter, election, result.code.message ());
	}
	else
	{
		stats.inc (ballot::stat::type::coordinator, ballot::stat::detail::vote_cast);
	}
	return result;
}

std::error_code ballot::coordinator::record_confirmation (ballot::vote_id vote_id, ballot::node_id const & node, ballot::confirmation outcome)
{
	auto result = rounds.record_confirmation (vote_id, node, outcome);
	if (!result)
	{
		if (auto vote = store.get (vote_id))
		{
			invalidate (*vote);
			schedule_evaluation (vote_id, vote->round_number ());
		}
	}
	return result;
}

std::error_code ballot::coordinator::heartbeat (ballot::node_id const & node, double response_time_ms)
{
	return registry.record_heartbeat (node, response_time_ms);
}

ballot::evaluation_result ballot::coordinator::evaluate (ballot::vote_id vote)
{
	return evaluator.evaluate (vote);
}

void ballot::coordinator::schedule_open (ballot::vote_id vote, uint32_t current_round)
{
	queue.push ("open_round", vote, current_round + 1, [this, vote, current_round] () {
		open_round (vote, current_round);
	});
}

void ballot::coordinator::open_round (ballot::vote_id vote_id, uint32_t current_round)
{
	auto result = rounds.open_round (vote_id, current_round);
	if (!result.code)
	{
		if (auto vote = store.get (vote_id))
		{
			invalidate (*vote);
			solicitor.solicit (*vote, result.round);
		}
		return;
	}

	if (result.code == ballot::error_consensus::insufficient_nodes)
	{
		// Transient, the queue retries with backoff until nodes report back
		throw std::system_error (result.code);
	}
	if (result.code == ballot::error_consensus::round_exhausted)
	{
		give_up (vote_id, current_round, result.code.message ());
		return;
	}
	if (result.code == ballot::error_consensus::election_ended)
	{
		// Cast while the election was being ended, after its pending votes were collected
		if (expire (vote_id, std::chrono::system_clock::now ()))
		{
			logger.debug (ballot::log::type::coordinator, "Vote {} expired before its first round, election ended", vote_id);
		}
		return;
	}
	logger.debug (ballot::log::type::coordinator, "Round {} for vote {} not opened: {}", current_round + 1, vote_id, result.code.message ());
}

void ballot::coordinator::schedule_evaluation (ballot::vote_id vote, uint32_t round)
{
	queue.push ("evaluate", vote, round, [this, vote] () {
		auto result = evaluator.evaluate (vote);
		if (result.code && result.code != ballot::error_consensus::election_ended)
		{
			throw std::system_error (result.code);
		}
	});
}

void ballot::coordinator::give_up (ballot::vote_id vote_id, uint32_t round, std::string const & reason)
{
	if (rounds.fail (vote_id))
	{
		if (auto vote = store.get (vote_id))
		{
			logger.warn (ballot::log::type::coordinator, "Vote {} failed, round {} could not be opened: {}", vote_id, round, reason);
			audit.append (ballot::audit_action::vote_failed, std::to_string (vote_id), reason);
			invalidate (*vote);
			publish (ballot::notification_type::vote_failed, *vote, round, reason);
		}
	}
}

bool ballot::coordinator::expire (ballot::vote_id vote_id, ballot::timestamp_t now)
{
	auto result = rounds.expire (vote_id, now);
	if (result)
	{
		if (auto vote = store.get (vote_id))
		{
			audit.append (ballot::audit_action::vote_expired, std::to_string (vote_id));
			invalidate (*vote);
			publish (ballot::notification_type::vote_expired, *vote, vote->round_number ());
		}
	}
	return result;
}

void ballot::coordinator::publish (ballot::notification_type type, ballot::vote const & vote, uint32_t round, std::string message)
{
	ballot::notification notification{ type, vote.election, vote.id, round, std::move (message) };
	notifier.publish (notification);
}

void ballot::coordinator::invalidate (ballot::vote const & vote)
{
	cache.invalidate (ballot::cache_keys::vote_status (vote.id));
	cache.invalidate (ballot::cache_keys::voter_elections (vote.voter));
	invalidate (vote.election);
}

void ballot::coordinator::invalidate (ballot::election_id election)
{
	cache.invalidate (ballot::cache_keys::election_stats_of (election));
	cache.invalidate (ballot::cache_keys::election_stats);
}

std::optional<ballot::vote_status_report> ballot::coordinator::vote_status (ballot::vote_id vote_id) const
{
	if (auto vote = store.get (vote_id))
	{
		return ballot::vote_status_report::from (*vote);
	}
	return std::nullopt;
}

std::vector<ballot::node_summary> ballot::coordinator::election_node_statuses (ballot::election_id election) const
{
	std::vector<ballot::node_summary> result;
	for (auto const & node : registry.nodes (election))
	{
		result.push_back (ballot::node_summary::from (node));
	}
	return result;
}

std::optional<ballot::election_stats> ballot::coordinator::election_stats (ballot::election_id election) const
{
	if (!elections.get (election))
	{
		return std::nullopt;
	}
	ballot::election_stats result;
	result.election = election;
	for (auto vote_id : store.list (election))
	{
		if (auto vote = store.get (vote_id))
		{
			result.add (vote->status);
		}
	}
	return result;
}

std::vector<ballot::election_id> ballot::coordinator::voter_elections (std::string const & voter) const
{
	return store.elections_of (voter);
}

void ballot::coordinator::run_sweep ()
{
	ballot::unique_lock<ballot::mutex> lock{ mutex };
	while (!stopped)
	{
		condition.wait_for (lock, config.consensus.sweep_interval, [this] { return stopped; });
		if (!stopped)
		{
			lock.unlock ();
			sweep (std::chrono::system_clock::now ());
			lock.lock ();
		}
	}
}

size_t ballot::coordinator::sweep (ballot::timestamp_t now)
{
	stats.inc (ballot::stat::type::coordinator, ballot::stat::detail::sweep);

	size_t result = 0;
	for (auto const & election : elections.list ())
	{
		if (election.status != ballot::election_status::active)
		{
			continue;
		}
		for (auto vote_id : store.list (election.id))
		{
			auto vote = store.get (vote_id);
			if (!vote || vote->status != ballot::vote_status::pending)
			{
				continue;
			}
			auto round = vote->current_round ();
			if (round != nullptr && round->open && now - round->opened > config.consensus.round_timeout)
			{
				stats.inc (ballot::stat::type::round_manager, ballot::stat::detail::round_timeout);
				schedule_evaluation (vote_id, round->number);
				++result;
			}
		}
	}
	return result;
}
