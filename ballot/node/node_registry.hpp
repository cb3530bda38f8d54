#pragma once

#include <ballot/lib/errors.hpp>
#include <ballot/lib/locks.hpp>
#include <ballot/lib/random.hpp>
#include <ballot/lib/utility.hpp>
#include <ballot/node/fwd.hpp>
#include <ballot/secure/common.hpp>

#include <boost/circular_buffer.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index_container.hpp>

#include <chrono>
#include <optional>
#include <system_error>
#include <thread>
#include <vector>

namespace mi = boost::multi_index;

namespace ballot
{
class node_registry_config final
{
public:
	ballot::error serialize (ballot::tomlconfig &) const;
	ballot::error deserialize (ballot::tomlconfig &);

public:
	/** Heartbeats are expected at least this often */
	std::chrono::milliseconds heartbeat_interval{ 1000 };
	/** Nodes silent for longer than this are marked unreachable */
	std::chrono::milliseconds heartbeat_timeout{ 5000 };
	std::chrono::milliseconds sweep_interval{ 1000 };
	/** Number of expected heartbeats the uptime percentage is computed over */
	size_t uptime_window{ 100 };
};

/**
 * Tracks election nodes, their liveness and health metrics.
 * Nodes are never removed, ending an election marks its nodes inactive.
 */
class node_registry final
{
public:
	node_registry (node_registry_config const &, ballot::stats &, ballot::logger &);
	~node_registry ();

	void start ();
	void stop ();

	/** Weight of the newest sample in the response time moving average */
	static double constexpr response_time_smoothing{ 0.2 };

	/** Registers a new active node for \p election */
	ballot::election_node add (ballot::election_id election, std::string const & address, ballot::timestamp_t now = std::chrono::system_clock::now ());

	/**
	 * Up to \p count active nodes of \p election, best response time first, then most recent heartbeat, then lowest id.
	 * Returns fewer nodes when not enough are active.
	 */
	std::vector<ballot::election_node> select_active_nodes (ballot::election_id election, size_t count) const;

	/**
	 * Marks the node active and folds \p response_time_ms into its metrics
	 * @returns error_consensus::unknown_node or error_consensus::election_ended for nodes of an ended election
	 */
	std::error_code record_heartbeat (ballot::node_id const & node, double response_time_ms, ballot::timestamp_t now = std::chrono::system_clock::now ());

	/** Marks active nodes whose last heartbeat is older than the timeout unreachable, returns the number of nodes changed */
	size_t mark_unreachable (ballot::timestamp_t now = std::chrono::system_clock::now ());

	/** Marks every node of \p election inactive, heartbeats are refused afterwards */
	size_t deactivate (ballot::election_id election);

	std::optional<ballot::election_node> get (ballot::node_id const & node) const;
	std::vector<ballot::election_node> nodes (ballot::election_id election) const;
	size_t size () const;
	size_t count (ballot::election_id election, ballot::node_status status) const;

private: // Dependencies
	node_registry_config const & config;
	ballot::stats & stats;
	ballot::logger & logger;

private:
	void run ();

	class entry final
	{
	public:
		ballot::node_id id;
		ballot::election_id election;
		ballot::election_node node;
		/** Heartbeat received (true) or missed (false) per expected interval */
		boost::circular_buffer<bool> window;
	};

	void update_uptime (entry &, ballot::timestamp_t now) const;

	// clang-format off
	class tag_id {};
	class tag_election {};

	using ordered_nodes = boost::multi_index_container<entry,
	mi::indexed_by<
		mi::ordered_unique<mi::tag<tag_id>,
			mi::member<entry, ballot::node_id, &entry::id>>,
		mi::hashed_non_unique<mi::tag<tag_election>,
			mi::member<entry, ballot::election_id, &entry::election>>
	>>;
	// clang-format on

	ordered_nodes nodes_m;
	ballot::random_generator random;

	bool stopped{ false };
	ballot::condition_variable condition;
	mutable ballot::mutex mutex{ "node_registry" };
	std::thread thread;
};
}
