#pragma once

#include <ballot/secure/common.hpp>

#include <boost/property_tree/ptree_fwd.hpp>

#include <string>
#include <vector>

namespace ballot
{
/** Log entry together with the round it belongs to */
class vote_status_entry final
{
public:
	uint32_t round{ 0 };
	ballot::consensus_log_entry entry;
};

/** Read only view of a vote for dashboards */
class vote_status_report final
{
public:
	ballot::vote_id vote{ 0 };
	ballot::election_id election{ 0 };
	ballot::vote_status status{ ballot::vote_status::pending };
	uint32_t confirmation_count{ 0 };
	uint32_t required_confirmations{ 0 };
	uint32_t round{ 0 };
	ballot::hash256 fingerprint;
	/** Entries of every round, oldest round first */
	std::vector<ballot::vote_status_entry> log_entries;

	static vote_status_report from (ballot::vote const &);
	boost::property_tree::ptree to_ptree () const;
};

class node_summary final
{
public:
	ballot::node_id id;
	std::string address;
	ballot::node_status status{ ballot::node_status::active };
	ballot::timestamp_t last_heartbeat{};
	double response_time_ms{ 0.0 };
	double uptime_percentage{ 0.0 };

	static node_summary from (ballot::election_node const &);
	boost::property_tree::ptree to_ptree () const;
};

boost::property_tree::ptree to_ptree (std::vector<ballot::node_summary> const &);

class election_stats final
{
public:
	ballot::election_id election{ 0 };
	uint64_t total{ 0 };
	uint64_t finalized{ 0 };
	uint64_t pending{ 0 };
	uint64_t failed{ 0 };
	uint64_t expired{ 0 };

	void add (ballot::vote_status);
	boost::property_tree::ptree to_ptree () const;
};
}
