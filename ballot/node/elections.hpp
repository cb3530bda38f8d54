#pragma once

#include <ballot/lib/errors.hpp>
#include <ballot/lib/locks.hpp>
#include <ballot/node/fwd.hpp>
#include <ballot/secure/common.hpp>

#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace ballot
{
/** How the nodes of a new election are set up */
class elections_config final
{
public:
	ballot::error serialize (ballot::tomlconfig &) const;
	ballot::error deserialize (ballot::tomlconfig &);

	/** Address of the \p index th node of an election */
	std::string node_address (ballot::election_id, uint32_t index) const;

public:
	/** Number of election nodes registered when an election is created */
	uint32_t replication_factor{ 3 };
	std::string host{ "127.0.0.1" };
	uint16_t port_base{ 7100 };
};

/** Election lifecycle, upcoming -> active -> completed */
class elections final
{
public:
	elections (ballot::stats &, ballot::logger &);

	ballot::election create (std::string const & name, uint32_t replication_factor);
	/** @returns error_consensus::unknown_election or error_consensus::invalid_transition unless the election is upcoming */
	std::error_code start (ballot::election_id);
	/** @returns error_consensus::unknown_election or error_consensus::invalid_transition unless the election is active */
	std::error_code end (ballot::election_id);

	std::optional<ballot::election> get (ballot::election_id) const;
	std::optional<ballot::election_status> status (ballot::election_id) const;
	bool active (ballot::election_id) const;
	std::vector<ballot::election> list () const;
	size_t size () const;

private: // Dependencies
	ballot::stats & stats;
	ballot::logger & logger;

private:
	std::error_code change (ballot::election_id, ballot::election_status from, ballot::election_status to);

	std::map<ballot::election_id, ballot::election> elections_m;
	ballot::election_id next_id{ 1 };
	mutable ballot::mutex mutex{ "elections" };
};
}
