#include <ballot/lib/env.hpp>
#include <ballot/secure/utility.hpp>
#include <ballot/test_common/system.hpp>

#include <algorithm>
#include <thread>

using namespace std::chrono_literals;

std::string ballot::error_system_messages::message (int ev) const
{
	switch (static_cast<ballot::error_system> (ev))
	{
		case ballot::error_system::generic:
			return "Unknown error";
		case ballot::error_system::deadline_expired:
			return "Deadline expired";
	}

	return "Invalid error code";
}

/*
 * recording_sink
 */

void ballot::test::recording_sink::notify (std::string const & topic, ballot::notification const & notification)
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	notifications.emplace_back (topic, notification);
}

std::vector<std::pair<std::string, ballot::notification>> ballot::test::recording_sink::received () const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	return notifications;
}

size_t ballot::test::recording_sink::count (std::string const & topic, ballot::notification_type type) const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	return std::count_if (notifications.begin (), notifications.end (), [&topic, type] (auto const & item) {
		return item.first == topic && item.second.type == type;
	});
}

size_t ballot::test::recording_sink::size () const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	return notifications.size ();
}

/*
 * recording_cache
 */

void ballot::test::recording_cache::invalidate (std::string const & key)
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	keys.push_back (key);
}

size_t ballot::test::recording_cache::count (std::string const & key) const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	return std::count (keys.begin (), keys.end (), key);
}

/*
 * system
 */

ballot::test::system::system ()
{
	if (auto scale = ballot::env::get<double> ("DEADLINE_SCALE_FACTOR"))
	{
		deadline_scaling_factor = *scale;
	}
}

ballot::test::system::~system ()
{
	// Only stop system in destructor to avoid confusing and random bugs when debugging assertions that hit deadline expired condition
	stop ();

	// Since it's sometimes useful to see log files after test failures, an environment variable is supported to retain the files.
	if (!ballot::env::get<bool> ("TEST_KEEP_TMPDIRS").value_or (false))
	{
		ballot::remove_temporary_directories ();
	}
}

ballot::coordinator & ballot::test::system::add_coordinator ()
{
	return add_coordinator (default_config ());
}

ballot::coordinator & ballot::test::system::add_coordinator (ballot::node_config const & config_a)
{
	auto coordinator = std::make_unique<ballot::coordinator> (config_a, sink, cache, "coordinator" + std::to_string (coordinators.size ()));
	coordinator->start ();
	coordinators.push_back (std::move (coordinator));
	return *coordinators.back ();
}

ballot::coordinator & ballot::test::system::coordinator (std::size_t index) const
{
	debug_assert (index < coordinators.size ());
	return *coordinators[index];
}

ballot::node_config ballot::test::system::default_config () const
{
	ballot::node_config config;
	config.registry.heartbeat_timeout = 1h;
	config.registry.sweep_interval = 100ms;
	config.evaluation_queue.initial_delay = 10ms;
	config.evaluation_queue.max_delay = 100ms;
	config.evaluation_queue.jitter = 0.0;
	config.consensus.sweep_interval = 100ms;
	config.simulator.enable = false;
	return config;
}

void ballot::test::system::stop ()
{
	for (auto & coordinator : coordinators)
	{
		coordinator->stop ();
	}
}

void ballot::test::system::deadline_set (std::chrono::duration<double, std::nano> const & delta_a)
{
	deadline = std::chrono::steady_clock::now () + delta_a * deadline_scaling_factor;
}

std::error_code ballot::test::system::poll (std::chrono::nanoseconds const & wait_time)
{
	std::this_thread::sleep_for (wait_time);

	std::error_code ec;
	if (std::chrono::steady_clock::now () > deadline)
	{
		ec = ballot::error_system::deadline_expired;
	}
	return ec;
}

std::vector<ballot::node_id> ballot::test::round_nodes (ballot::coordinator & coordinator, ballot::vote_id vote_id)
{
	std::vector<ballot::node_id> result;
	if (auto vote = coordinator.store.get (vote_id))
	{
		if (auto round = vote->current_round ())
		{
			for (auto const & entry : round->entries)
			{
				result.push_back (entry.node);
			}
		}
	}
	return result;
}

uint32_t ballot::test::round_number (ballot::coordinator & coordinator, ballot::vote_id vote_id)
{
	auto vote = coordinator.store.get (vote_id);
	return vote ? vote->round_number () : 0;
}

ballot::vote_status ballot::test::status (ballot::coordinator & coordinator, ballot::vote_id vote_id)
{
	auto vote = coordinator.store.get (vote_id);
	debug_assert (vote);
	return vote->status;
}

void ballot::test::rewrite_audit_entry (ballot::audit_log & audit, uint64_t sequence, std::string details)
{
	ballot::lock_guard<ballot::mutex> lock{ audit.mutex };
	release_assert (sequence < audit.chain.size ());
	audit.chain[sequence].details = std::move (details);
}
