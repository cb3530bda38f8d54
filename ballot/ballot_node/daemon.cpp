#include <ballot/ballot_node/daemon.hpp>
#include <ballot/lib/config.hpp>
#include <ballot/lib/signal_manager.hpp>
#include <ballot/lib/utility.hpp>
#include <ballot/node/cache.hpp>
#include <ballot/node/coordinator.hpp>
#include <ballot/node/daemonconfig.hpp>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <csignal>
#include <future>
#include <iostream>
#include <mutex>
#include <thread>

#include <fmt/chrono.h>

void ballot::daemon::run (std::filesystem::path const & data_path, std::vector<std::string> const & config_overrides)
{
	ballot::logger::initialize (ballot::load_log_config (ballot::log_config::daemon_default (), data_path, config_overrides), data_path);

	logger.info (ballot::log::type::daemon, "Daemon started");

	std::filesystem::create_directories (data_path);
	std::error_code error_chmod;
	ballot::set_secure_perm_directory (data_path, error_chmod);

	ballot::daemon_config config{ data_path };
	auto error = ballot::read_node_config_toml (data_path, config, config_overrides);
	if (!error)
	{
		try
		{
			std::time_t date_time = std::time (nullptr);
			logger.info (ballot::log::type::daemon, "Version: {}", BALLOT_VERSION_STRING);
			logger.info (ballot::log::type::daemon, "Data path: '{}'", data_path.string ());
			logger.info (ballot::log::type::daemon, "Build info: {}", BUILD_INFO);
			logger.info (ballot::log::type::daemon, "Start time: {:%c} UTC", fmt::gmtime (date_time));

			ballot::log_sink sink{ logger };
			ballot::stats cache_stats;
			ballot::status_cache cache{ cache_stats };
			ballot::coordinator coordinator{ config.node, sink, cache };
			coordinator.start ();

			std::promise<void> stop_requested;
			auto stopped = stop_requested.get_future ();
			std::once_flag once;

			ballot::signal_manager sigman;
			auto handler = [this, &stop_requested, &once] (int signum) {
				std::call_once (once, [this, &stop_requested, signum] () {
					logger.warn (ballot::log::type::daemon, "{} received, stopping...", ballot::to_signal_name (signum));
					stop_requested.set_value ();
				});
			};
			// keep trapping Ctrl-C to avoid a second Ctrl-C interrupting the shutdown started by the first
			sigman.register_signal_handler (SIGINT, handler, true);
			sigman.register_signal_handler (SIGTERM, handler, false);

			stopped.wait ();
			coordinator.stop ();
		}
		catch (std::runtime_error const & e)
		{
			logger.critical (ballot::log::type::daemon, "Error while running coordinator: {}", e.what ());
		}
	}
	else
	{
		logger.critical (ballot::log::type::daemon, "Error deserializing config: {}", error.get_message ());
	}

	logger.info (ballot::log::type::daemon, "Daemon exiting");
}

int ballot::daemon::simulate (std::filesystem::path const & data_path, std::vector<std::string> const & config_overrides, unsigned voters, unsigned nodes)
{
	ballot::daemon_config config{ data_path };
	auto error = ballot::read_node_config_toml (data_path, config, config_overrides);
	if (error)
	{
		std::cerr << "Error deserializing config: " << error.get_message () << std::endl;
		return 1;
	}
	config.node.simulator.enable = true;

	ballot::log_sink sink{ logger };
	ballot::stats cache_stats;
	ballot::status_cache cache{ cache_stats };
	ballot::coordinator coordinator{ config.node, sink, cache, "simulation" };
	coordinator.start ();

	auto election = coordinator.create_election ("simulation", nodes);
	auto started = coordinator.start_election (election.id);
	release_assert (!started, started.message ());

	for (unsigned i = 0; i < voters; ++i)
	{
		auto result = coordinator.cast_vote (fmt::format ("voter_{}", i), fmt::format ("candidate_{}", i % 3), election.id);
		if (result.code)
		{
			logger.warn (ballot::log::type::daemon, "Vote of voter_{} refused: {}", i, result.code.message ());
		}
	}

	// Every round can take up to the confirmation delay plus a retry backoff, leave room for all of them
	auto const & consensus = config.node.consensus;
	auto budget = (config.node.simulator.confirmation_delay + consensus.round_timeout + config.node.evaluation_queue.max_delay) * consensus.max_rounds;
	auto deadline = std::chrono::steady_clock::now () + budget;
	while (std::chrono::steady_clock::now () < deadline)
	{
		auto stats = coordinator.election_stats (election.id);
		if (stats && stats->pending == 0)
		{
			break;
		}
		std::this_thread::sleep_for (100ms);
	}

	auto ended = coordinator.end_election (election.id);
	release_assert (!ended, ended.message ());

	boost::property_tree::ptree result;
	if (auto stats = coordinator.election_stats (election.id))
	{
		result.add_child ("election", stats->to_ptree ());
	}
	result.add_child ("nodes", ballot::to_ptree (coordinator.election_node_statuses (election.id)));
	result.put ("audit_entries", coordinator.audit.size ());
	result.put ("audit_verified", !coordinator.audit.verify ().has_value ());
	result.add_child ("stats", coordinator.stats.to_ptree ());

	coordinator.stop ();

	boost::property_tree::write_json (std::cout, result);
	return 0;
}
