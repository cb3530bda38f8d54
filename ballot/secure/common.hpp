#pragma once

#include <ballot/lib/numbers.hpp>
#include <ballot/lib/stats_enums.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ballot
{
class random_generator;

using election_id = uint64_t;
using vote_id = uint64_t;
using node_id = std::string;
using timestamp_t = std::chrono::system_clock::time_point;

enum class node_status
{
	active,
	inactive,
	unreachable,
};

/** pending -> finalized on quorum, pending -> failed when rounds run out, pending -> expired when the election ends */
enum class vote_status
{
	pending,
	finalized,
	failed,
	expired,
};

enum class entry_status
{
	pending,
	confirmed,
	rejected,
	timed_out,
};

/** Result of evaluating the current round of a vote */
enum class consensus_outcome
{
	still_pending,
	finalized,
	failed,
};

enum class election_status
{
	upcoming,
	active,
	completed,
};

/** What a node reports back for its entry */
enum class confirmation
{
	confirmed,
	rejected,
};

std::string_view to_string (ballot::node_status);
std::string_view to_string (ballot::vote_status);
std::string_view to_string (ballot::entry_status);
std::string_view to_string (ballot::consensus_outcome);
std::string_view to_string (ballot::election_status);
std::string_view to_string (ballot::confirmation);

ballot::stat::detail to_stat_detail (ballot::consensus_outcome);
ballot::entry_status to_entry_status (ballot::confirmation);

bool is_terminal (ballot::vote_status);
/** Only transitions out of pending are allowed and every non-pending status is terminal */
bool valid_change (ballot::vote_status from, ballot::vote_status to);

class election final
{
public:
	ballot::election_id id{ 0 };
	std::string name;
	ballot::election_status status{ ballot::election_status::upcoming };
	uint32_t replication_factor{ 0 };
	ballot::timestamp_t created{};
};

class election_node final
{
public:
	ballot::node_id id;
	ballot::election_id election{ 0 };
	std::string address;
	ballot::node_status status{ ballot::node_status::active };
	ballot::timestamp_t last_heartbeat{};
	/** Exponential moving average of reported response times */
	double response_time_ms{ 0.0 };
	double uptime_percentage{ 100.0 };
	uint64_t heartbeats{ 0 };
};

class consensus_log_entry final
{
public:
	ballot::node_id node;
	ballot::entry_status status{ ballot::entry_status::pending };
	std::string signature;
	ballot::timestamp_t timestamp{};
};

class consensus_round final
{
public:
	uint32_t number{ 0 };
	bool open{ true };
	ballot::timestamp_t opened{};
	std::vector<ballot::consensus_log_entry> entries;

	size_t count (ballot::entry_status) const;
	/** True when no entry is pending anymore */
	bool settled () const;
	ballot::consensus_log_entry * find (ballot::node_id const &);
	ballot::consensus_log_entry const * find (ballot::node_id const &) const;
	/** Moves every pending entry to timed_out, returns the number of entries changed */
	size_t time_out_pending (ballot::timestamp_t now);
};

class vote final
{
public:
	ballot::vote_id id{ 0 };
	std::string voter;
	std::string candidate;
	ballot::election_id election{ 0 };
	ballot::vote_status status{ ballot::vote_status::pending };
	uint32_t required_confirmations{ 3 };
	uint32_t confirmation_count{ 0 };
	uint64_t nonce{ 0 };
	ballot::hash256 fingerprint;
	ballot::timestamp_t created{};
	/** Every round ever opened for this vote, the last one is the current round */
	std::vector<ballot::consensus_round> rounds;

	ballot::consensus_round * current_round ();
	ballot::consensus_round const * current_round () const;
	uint32_t round_number () const;
};

/**
 * Content fingerprint of a vote. The nonce makes fingerprints of identical choices cast at different times differ,
 * which allows replay detection but not content equality checks.
 */
ballot::hash256 compute_fingerprint (std::string const & voter, std::string const & candidate, ballot::election_id election, uint64_t nonce);

/**
 * Proof token stored with a log entry, "sig_<fingerprint>_<node id>".
 * This is a placeholder for a real signing scheme, it is deterministic and provides no cryptographic guarantee.
 */
std::string signature_token (ballot::hash256 const & fingerprint, ballot::node_id const & node);

/** Random identifier formatted as a version 4 uuid */
ballot::node_id generate_node_id (ballot::random_generator &);
}
