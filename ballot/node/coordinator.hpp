#pragma once

#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/node/audit_log.hpp>
#include <ballot/node/confirmation_solicitor.hpp>
#include <ballot/node/consensus_evaluator.hpp>
#include <ballot/node/elections.hpp>
#include <ballot/node/evaluation_queue.hpp>
#include <ballot/node/node_registry.hpp>
#include <ballot/node/nodeconfig.hpp>
#include <ballot/node/notifications.hpp>
#include <ballot/node/query.hpp>
#include <ballot/node/round_manager.hpp>
#include <ballot/node/simulator.hpp>
#include <ballot/node/vote_store.hpp>

#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace ballot
{
/** Acknowledgement returned to the voter, finalization happens asynchronously */
class cast_result final
{
public:
	std::error_code code;
	ballot::vote_id vote{ 0 };
	ballot::hash256 fingerprint;
	ballot::vote_status status{ ballot::vote_status::pending };
};

/**
 * Single authoritative coordinator owning every consensus component.
 * Request paths (casting, confirmations, heartbeats) return immediately, rounds are opened and evaluated on the evaluation queue.
 */
class coordinator final
{
public:
	coordinator (ballot::node_config const &, ballot::notification_sink &, ballot::cache_invalidator &, std::string identifier = "");
	~coordinator ();

	void start ();
	void stop ();

	/** Creates an upcoming election and registers its nodes, \p replication_factor defaults to the configured one */
	ballot::election create_election (std::string const & name, std::optional<uint32_t> replication_factor = std::nullopt);
	std::error_code start_election (ballot::election_id);
	/** Completes the election, deactivates its nodes and expires votes still pending */
	std::error_code end_election (ballot::election_id);

	/**
	 * Stores a pending vote and schedules its first round
	 * @returns error_consensus::duplicate_vote, unknown_election or election_not_active in `code` when the vote is refused
	 */
	ballot::cast_result cast_vote (std::string const & voter, std::string const & candidate, ballot::election_id election);
	/** Applies a node answer and schedules evaluation of the vote */
	std::error_code record_confirmation (ballot::vote_id, ballot::node_id const &, ballot::confirmation);
	std::error_code heartbeat (ballot::node_id const &, double response_time_ms);
	/** Synchronous evaluation, the same as what the evaluation queue runs */
	ballot::evaluation_result evaluate (ballot::vote_id);

	std::optional<ballot::vote_status_report> vote_status (ballot::vote_id) const;
	std::vector<ballot::node_summary> election_node_statuses (ballot::election_id) const;
	std::optional<ballot::election_stats> election_stats (ballot::election_id) const;
	std::vector<ballot::election_id> voter_elections (std::string const & voter) const;

	std::string identifier () const;

public:
	ballot::node_config const config;
	ballot::logger logger;
	ballot::stats stats;
	ballot::elections elections;
	ballot::node_registry registry;
	ballot::vote_store store;
	ballot::round_manager rounds;
	ballot::consensus_evaluator evaluator;
	ballot::evaluation_queue queue;
	ballot::notifier notifier;
	ballot::audit_log audit;
	ballot::confirmation_simulator simulator;

private: // Dependencies
	ballot::notification_sink & sink;
	ballot::cache_invalidator & cache;

private:
	void schedule_open (ballot::vote_id, uint32_t current_round);
	void schedule_evaluation (ballot::vote_id, uint32_t round);
	void open_round (ballot::vote_id, uint32_t current_round);
	void give_up (ballot::vote_id, uint32_t round, std::string const & reason);
	/** Moves a pending vote of an ended election to expired and announces it, false if it was already terminal */
	bool expire (ballot::vote_id, ballot::timestamp_t now);
	void publish (ballot::notification_type, ballot::vote const &, uint32_t round = 0, std::string message = "");
	void invalidate (ballot::vote const &);
	void invalidate (ballot::election_id);

	void run_sweep ();
	/** Schedules evaluation of votes whose open round timed out, returns the number of votes scheduled */
	size_t sweep (ballot::timestamp_t now);

	std::string const id;
	ballot::manual_solicitor manual;
	ballot::confirmation_solicitor & solicitor;

	bool stopped{ false };
	ballot::condition_variable condition;
	mutable ballot::mutex mutex{ "coordinator" };
	std::thread sweep_thread;
};
}
