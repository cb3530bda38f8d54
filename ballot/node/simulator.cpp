#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/lib/thread_roles.hpp>
#include <ballot/lib/tomlconfig.hpp>
#include <ballot/node/simulator.hpp>

ballot::confirmation_simulator::confirmation_simulator (ballot::simulator_config const & config_a, ballot::stats & stats_a, ballot::logger & logger_a) :
	config{ config_a },
	stats{ stats_a },
	logger{ logger_a }
{
}

ballot::confirmation_simulator::~confirmation_simulator ()
{
	debug_assert (!thread.joinable ());
}

void ballot::confirmation_simulator::start ()
{
	debug_assert (!thread.joinable ());
	debug_assert (respond && heartbeat);

	if (!config.enable)
	{
		return;
	}

	thread = std::thread ([this] () {
		ballot::thread_role::set (ballot::thread_role::name::confirmation_simulator);
		run ();
	});
}

void ballot::confirmation_simulator::stop ()
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

void ballot::confirmation_simulator::solicit (ballot::vote const & vote, ballot::consensus_round const & round)
{
	auto deadline = std::chrono::steady_clock::now () + config.confirmation_delay;
	{
		ballot::lock_guard<ballot::mutex> lock{ mutex };
		for (auto const & entry : round.entries)
		{
			solicitations.emplace (deadline, solicitation{ vote.id, entry.node });
		}
	}
	stats.inc (ballot::stat::type::confirmation_simulator, ballot::stat::detail::solicit);
	condition.notify_all ();
}

void ballot::confirmation_simulator::track (ballot::node_id const & node)
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	nodes.insert (node);
}

size_t ballot::confirmation_simulator::tracked () const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	return nodes.size ();
}

size_t ballot::confirmation_simulator::pending () const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	return solicitations.size ();
}

void ballot::confirmation_simulator::run ()
{
	ballot::unique_lock<ballot::mutex> lock{ mutex };
	while (!stopped)
	{
		auto wakeup = next_heartbeat;
		if (!solicitations.empty ())
		{
			wakeup = std::min (wakeup, solicitations.begin ()->first);
		}
		condition.wait_until (lock, wakeup, [this, wakeup] {
			return stopped || std::chrono::steady_clock::now () >= wakeup || (!solicitations.empty () && solicitations.begin ()->first < wakeup);
		});
		if (!stopped)
		{
			answer (lock);
			send_heartbeats (lock);
		}
	}
}

void ballot::confirmation_simulator::answer (ballot::unique_lock<ballot::mutex> & lock)
{
	debug_assert (lock.owns_lock ());

	auto now = std::chrono::steady_clock::now ();
	while (!stopped && !solicitations.empty () && solicitations.begin ()->first <= now)
	{
		auto item = solicitations.begin ()->second;
		solicitations.erase (solicitations.begin ());
		auto outcome = pick_outcome ();

		lock.unlock ();
		stats.inc (ballot::stat::type::confirmation_simulator, outcome == ballot::confirmation::confirmed ? ballot::stat::detail::simulated_confirm : ballot::stat::detail::simulated_reject);
		if (auto ec = respond (item.vote, item.node, outcome))
		{
			logger.debug (ballot::log::type::simulator, "Simulated {} from node {} for vote {} refused: {}", ballot::to_string (outcome), item.node, item.vote, ec.message ());
		}
		lock.lock ();
	}
}

void ballot::confirmation_simulator::send_heartbeats (ballot::unique_lock<ballot::mutex> & lock)
{
	debug_assert (lock.owns_lock ());

	auto now = std::chrono::steady_clock::now ();
	if (now < next_heartbeat)
	{
		return;
	}
	next_heartbeat = now + config.heartbeat_interval;

	std::vector<std::pair<ballot::node_id, double>> beats;
	for (auto const & node : nodes)
	{
		auto response_time = config.response_time_min < config.response_time_max ? random.random (config.response_time_min, config.response_time_max) : config.response_time_min;
		beats.emplace_back (node, static_cast<double> (response_time));
	}

	lock.unlock ();
	std::vector<ballot::node_id> refused;
	for (auto const & [node, response_time] : beats)
	{
		if (heartbeat (node, response_time))
		{
			refused.push_back (node);
		}
	}
	lock.lock ();

	for (auto const & node : refused)
	{
		nodes.erase (node);
	}
	if (!refused.empty ())
	{
		logger.debug (ballot::log::type::simulator, "Stopped heartbeats for {} nodes", refused.size ());
	}
}

ballot::confirmation ballot::confirmation_simulator::pick_outcome ()
{
	if (config.rejection_ratio <= 0.0)
	{
		return ballot::confirmation::confirmed;
	}
	auto roll = random.random (0, 10000);
	return roll < static_cast<int> (config.rejection_ratio * 10000) ? ballot::confirmation::rejected : ballot::confirmation::confirmed;
}

/*
 * simulator_config
 */

ballot::error ballot::simulator_config::serialize (ballot::tomlconfig & toml) const
{
	toml.put ("enable", enable, "Answer confirmation requests and send heartbeats on behalf of the election nodes. For testing and demonstrations only.\ntype:bool");
	toml.put ("confirmation_delay", confirmation_delay.count (), "Delay after which simulated nodes answer a confirmation request.\ntype:milliseconds");
	toml.put ("rejection_ratio", rejection_ratio, "Share of simulated answers that reject the vote, between 0 and 1.\ntype:double");
	toml.put ("heartbeat_interval", heartbeat_interval.count (), "Interval of simulated node heartbeats.\ntype:milliseconds");
	toml.put ("response_time_min", response_time_min, "Lower bound of simulated response times.\ntype:uint32,milliseconds");
	toml.put ("response_time_max", response_time_max, "Upper bound of simulated response times.\ntype:uint32,milliseconds");

	return toml.get_error ();
}

ballot::error ballot::simulator_config::deserialize (ballot::tomlconfig & toml)
{
	toml.get ("enable", enable);
	toml.get_duration ("confirmation_delay", confirmation_delay);
	toml.get ("rejection_ratio", rejection_ratio);
	toml.get_duration ("heartbeat_interval", heartbeat_interval);
	toml.get ("response_time_min", response_time_min);
	toml.get ("response_time_max", response_time_max);

	if (rejection_ratio < 0.0 || rejection_ratio > 1.0)
	{
		toml.get_error ().set ("rejection_ratio must be in the range [0, 1]");
	}
	if (response_time_max < response_time_min)
	{
		toml.get_error ().set ("response_time_max must not be lower than response_time_min");
	}

	return toml.get_error ();
}
