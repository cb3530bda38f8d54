#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/lib/tomlconfig.hpp>
#include <ballot/node/elections.hpp>

ballot::elections::elections (ballot::stats & stats_a, ballot::logger & logger_a) :
	stats{ stats_a },
	logger{ logger_a }
{
}

ballot::election ballot::elections::create (std::string const & name, uint32_t replication_factor)
{
	ballot::election result;
	{
		ballot::lock_guard<ballot::mutex> lock{ mutex };
		result.id = next_id++;
		result.name = name;
		result.status = ballot::election_status::upcoming;
		result.replication_factor = replication_factor;
		result.created = std::chrono::system_clock::now ();
		elections_m.emplace (result.id, result);
	}
	stats.inc (ballot::stat::type::elections, ballot::stat::detail::election_created);
	logger.info (ballot::log::type::elections, "Created election {} \"{}\" with replication factor {}", result.id, name, replication_factor);
	return result;
}

std::error_code ballot::elections::start (ballot::election_id id)
{
	auto result = change (id, ballot::election_status::upcoming, ballot::election_status::active);
	if (!result)
	{
		stats.inc (ballot::stat::type::elections, ballot::stat::detail::election_started);
		logger.info (ballot::log::type::elections, "Election {} started", id);
	}
	return result;
}

std::error_code ballot::elections::end (ballot::election_id id)
{
	auto result = change (id, ballot::election_status::active, ballot::election_status::completed);
	if (!result)
	{
		stats.inc (ballot::stat::type::elections, ballot::stat::detail::election_ended);
		logger.info (ballot::log::type::elections, "Election {} ended", id);
	}
	return result;
}

std::error_code ballot::elections::change (ballot::election_id id, ballot::election_status from, ballot::election_status to)
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	auto existing = elections_m.find (id);
	if (existing == elections_m.end ())
	{
		return ballot::error_consensus::unknown_election;
	}
	if (existing->second.status != from)
	{
		return ballot::error_consensus::invalid_transition;
	}
	existing->second.status = to;
	return {};
}

std::optional<ballot::election> ballot::elections::get (ballot::election_id id) const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	if (auto existing = elections_m.find (id); existing != elections_m.end ())
	{
		return existing->second;
	}
	return std::nullopt;
}

std::optional<ballot::election_status> ballot::elections::status (ballot::election_id id) const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	if (auto existing = elections_m.find (id); existing != elections_m.end ())
	{
		return existing->second.status;
	}
	return std::nullopt;
}

bool ballot::elections::active (ballot::election_id id) const
{
	return status (id) == ballot::election_status::active;
}

std::vector<ballot::election> ballot::elections::list () const
{
	std::vector<ballot::election> result;
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	for (auto const & [id, election] : elections_m)
	{
		result.push_back (election);
	}
	return result;
}

size_t ballot::elections::size () const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	return elections_m.size ();
}

/*
 * elections_config
 */

std::string ballot::elections_config::node_address (ballot::election_id, uint32_t index) const
{
	return host + ":" + std::to_string (port_base + index);
}

ballot::error ballot::elections_config::serialize (ballot::tomlconfig & toml) const
{
	toml.put ("replication_factor", replication_factor, "Number of election nodes registered for every new election.\ntype:uint32");
	toml.put ("host", host, "Host of the election nodes.\ntype:string");
	toml.put ("port_base", port_base, "Port of the first election node, following nodes use consecutive ports.\ntype:uint16");

	return toml.get_error ();
}

ballot::error ballot::elections_config::deserialize (ballot::tomlconfig & toml)
{
	toml.get ("replication_factor", replication_factor);
	toml.get ("host", host);
	toml.get ("port_base", port_base);

	if (replication_factor == 0)
	{
		toml.get_error ().set ("replication_factor must be greater than 0");
	}
	if (host.empty ())
	{
		toml.get_error ().set ("host must not be empty");
	}

	return toml.get_error ();
}
