#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/lib/thread_roles.hpp>
#include <ballot/lib/tomlconfig.hpp>
#include <ballot/node/node_registry.hpp>

#include <algorithm>
#include <cmath>

ballot::node_registry::node_registry (node_registry_config const & config_a, ballot::stats & stats_a, ballot::logger & logger_a) :
	config{ config_a },
	stats{ stats_a },
	logger{ logger_a }
{
}

ballot::node_registry::~node_registry ()
{
	debug_assert (!thread.joinable ());
}

void ballot::node_registry::start ()
{
	debug_assert (!thread.joinable ());

	thread = std::thread ([this] () {
		ballot::thread_role::set (ballot::thread_role::name::registry_sweep);
		run ();
	});
}

void ballot::node_registry::stop ()
{
	{
		ballot::lock_guard<ballot::mutex> lock{ mutex };
		stopped = true;
	}
	condition.notify_all ();
	if (thread.joinable ())
	{
		thread.join ();
	}
}

void ballot::node_registry::run ()
{
	ballot::unique_lock<ballot::mutex> lock{ mutex };
	while (!stopped)
	{
		condition.wait_for (lock, config.sweep_interval, [this] { return stopped; });
		if (!stopped)
		{
			lock.unlock ();
			mark_unreachable ();
			lock.lock ();
		}
	}
}

ballot::election_node ballot::node_registry::add (ballot::election_id election, std::string const & address, ballot::timestamp_t now)
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };

	ballot::election_node node;
	do
	{
		node.id = ballot::generate_node_id (random);
	} while (nodes_m.get<tag_id> ().count (node.id) > 0);
	node.election = election;
	node.address = address;
	node.status = ballot::node_status::active;
	node.last_heartbeat = now;

	nodes_m.insert (entry{ node.id, election, node, boost::circular_buffer<bool> (std::max<size_t> (config.uptime_window, 1)) });
	stats.inc (ballot::stat::type::node_registry, ballot::stat::detail::node_registered);
	logger.debug (ballot::log::type::node_registry, "Registered node {} ({}) for election {}", node.id, address, election);

	return node;
}

std::vector<ballot::election_node> ballot::node_registry::select_active_nodes (ballot::election_id election, size_t count) const
{
	std::vector<ballot::election_node> result;
	{
		ballot::lock_guard<ballot::mutex> lock{ mutex };
		auto [begin, end] = nodes_m.get<tag_election> ().equal_range (election);
		for (auto it = begin; it != end; ++it)
		{
			if (it->node.status == ballot::node_status::active)
			{
				result.push_back (it->node);
			}
		}
	}

	std::sort (result.begin (), result.end (), [] (ballot::election_node const & lhs, ballot::election_node const & rhs) {
		if (lhs.response_time_ms != rhs.response_time_ms)
		{
			return lhs.response_time_ms < rhs.response_time_ms;
		}
		if (lhs.last_heartbeat != rhs.last_heartbeat)
		{
			return lhs.last_heartbeat > rhs.last_heartbeat;
		}
		return lhs.id < rhs.id;
	});
	if (result.size () > count)
	{
		result.resize (count);
	}

	stats.add (ballot::stat::type::node_registry, ballot::stat::detail::selected, result.size ());
	if (result.size () < count)
	{
		stats.inc (ballot::stat::type::node_registry, ballot::stat::detail::insufficient);
	}
	return result;
}

std::error_code ballot::node_registry::record_heartbeat (ballot::node_id const & node, double response_time_ms, ballot::timestamp_t now)
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };

	auto & index = nodes_m.get<tag_id> ();
	auto existing = index.find (node);
	if (existing == index.end ())
	{
		stats.inc (ballot::stat::type::node_registry, ballot::stat::detail::unknown);
		return ballot::error_consensus::unknown_node;
	}
	if (existing->node.status == ballot::node_status::inactive)
	{
		stats.inc (ballot::stat::type::node_registry, ballot::stat::detail::heartbeat_rejected);
		return ballot::error_consensus::election_ended;
	}

	index.modify (existing, [this, response_time_ms, now] (entry & entry_a) {
		auto & node_l = entry_a.node;
		update_uptime (entry_a, now);
		if (node_l.heartbeats == 0)
		{
			node_l.response_time_ms = response_time_ms;
		}
		else
		{
			node_l.response_time_ms = response_time_smoothing * response_time_ms + (1.0 - response_time_smoothing) * node_l.response_time_ms;
		}
		if (node_l.status == ballot::node_status::unreachable)
		{
			logger.info (ballot::log::type::node_registry, "Node {} is reachable again", node_l.id);
		}
		node_l.status = ballot::node_status::active;
		node_l.last_heartbeat = now;
		++node_l.heartbeats;
	});

	stats.inc (ballot::stat::type::node_registry, ballot::stat::detail::heartbeat);
	stats.sample (ballot::stat::sample::heartbeat_response_time, static_cast<int64_t> (response_time_ms));
	logger.trace (ballot::log::type::node_registry, ballot::log::detail::heartbeat, "Heartbeat from {} ({}ms)", node, response_time_ms);
	return {};
}

void ballot::node_registry::update_uptime (entry & entry_a, ballot::timestamp_t now) const
{
	auto & node_l = entry_a.node;
	auto gap = now > node_l.last_heartbeat ? now - node_l.last_heartbeat : ballot::timestamp_t::duration::zero ();
	auto interval = std::chrono::duration_cast<ballot::timestamp_t::duration> (config.heartbeat_interval);
	if (interval.count () > 0 && gap > interval)
	{
		// Every expected interval elapsed without a heartbeat counts as a miss
		auto intervals = static_cast<size_t> (std::ceil (static_cast<double> (gap.count ()) / interval.count ()));
		auto missed = std::min (intervals - 1, entry_a.window.capacity ());
		for (size_t i = 0; i < missed; ++i)
		{
			entry_a.window.push_back (false);
		}
	}
	entry_a.window.push_back (true);

	auto received = std::count (entry_a.window.begin (), entry_a.window.end (), true);
	node_l.uptime_percentage = 100.0 * received / entry_a.window.size ();
}

size_t ballot::node_registry::mark_unreachable (ballot::timestamp_t now)
{
	std::vector<ballot::node_id> changed;
	{
		ballot::lock_guard<ballot::mutex> lock{ mutex };
		auto & index = nodes_m.get<tag_id> ();
		for (auto it = index.begin (), end = index.end (); it != end; ++it)
		{
			if (it->node.status == ballot::node_status::active && now - it->node.last_heartbeat > config.heartbeat_timeout)
			{
				index.modify (it, [] (entry & entry_a) {
					entry_a.node.status = ballot::node_status::unreachable;
				});
				changed.push_back (it->id);
			}
		}
	}

	for (auto const & node : changed)
	{
		stats.inc (ballot::stat::type::node_registry, ballot::stat::detail::node_unreachable);
		logger.warn (ballot::log::type::node_registry, "Node {} missed heartbeats for more than {}ms, marked unreachable", node, config.heartbeat_timeout.count ());
	}
	return changed.size ();
}

size_t ballot::node_registry::deactivate (ballot::election_id election)
{
	size_t result = 0;
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	auto & index = nodes_m.get<tag_election> ();
	auto [begin, end] = index.equal_range (election);
	for (auto it = begin; it != end; ++it)
	{
		if (it->node.status != ballot::node_status::inactive)
		{
			index.modify (it, [] (entry & entry_a) {
				entry_a.node.status = ballot::node_status::inactive;
			});
			++result;
		}
	}
	stats.add (ballot::stat::type::node_registry, ballot::stat::detail::node_inactive, result);
	return result;
}

std::optional<ballot::election_node> ballot::node_registry::get (ballot::node_id const & node) const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	auto existing = nodes_m.get<tag_id> ().find (node);
	if (existing != nodes_m.get<tag_id> ().end ())
	{
		return existing->node;
	}
	return std::nullopt;
}

std::vector<ballot::election_node> ballot::node_registry::nodes (ballot::election_id election) const
{
	std::vector<ballot::election_node> result;
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	auto [begin, end] = nodes_m.get<tag_election> ().equal_range (election);
	for (auto it = begin; it != end; ++it)
	{
		result.push_back (it->node);
	}
	std::sort (result.begin (), result.end (), [] (auto const & lhs, auto const & rhs) { return lhs.address < rhs.address; });
	return result;
}

size_t ballot::node_registry::size () const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	return nodes_m.size ();
}

size_t ballot::node_registry::count (ballot::election_id election, ballot::node_status status) const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	auto [begin, end] = nodes_m.get<tag_election> ().equal_range (election);
	return std::count_if (begin, end, [status] (auto const & entry_a) { return entry_a.node.status == status; });
}

/*
 * node_registry_config
 */

ballot::error ballot::node_registry_config::serialize (ballot::tomlconfig & toml) const
{
	toml.put ("heartbeat_interval", heartbeat_interval.count (), "Interval at which election nodes are expected to send heartbeats. Used for the uptime percentage.\ntype:milliseconds");
	toml.put ("heartbeat_timeout", heartbeat_timeout.count (), "Nodes without a heartbeat for longer than this are marked unreachable and no longer selected for rounds.\ntype:milliseconds");
	toml.put ("sweep_interval", sweep_interval.count (), "How often to check for unreachable nodes.\ntype:milliseconds");
	toml.put ("uptime_window", uptime_window, "Number of expected heartbeats the uptime percentage is computed over.\ntype:uint64");

	return toml.get_error ();
}

ballot::error ballot::node_registry_config::deserialize (ballot::tomlconfig & toml)
{
	toml.get_duration ("heartbeat_interval", heartbeat_interval);
	toml.get_duration ("heartbeat_timeout", heartbeat_timeout);
	toml.get_duration ("sweep_interval", sweep_interval);
	toml.get ("uptime_window", uptime_window);
	if (uptime_window == 0)
	{
		toml.get_error ().set ("uptime_window must be greater than 0");
	}

	return toml.get_error ();
}
