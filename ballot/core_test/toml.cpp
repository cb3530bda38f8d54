#include <ballot/lib/config.hpp>
#include <ballot/lib/tomlconfig.hpp>
#include <ballot/node/daemonconfig.hpp>
#include <ballot/secure/utility.hpp>
#include <ballot/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>

using namespace std::chrono_literals;

/** Empty config file should match a default config object */
TEST (toml, daemon_config_deserialize_defaults)
{
	std::stringstream ss;
	ss << R"toml(
	[node]
	[node.registry]
	[node.consensus]
	[node.evaluation_queue]
	[node.notifications]
	[node.simulator]
	[node.elections]
	[node.statistics]
	)toml";

	ballot::tomlconfig t;
	t.read (ss);
	ballot::daemon_config conf;
	ballot::daemon_config defaults;
	conf.deserialize_toml (t);

	ASSERT_FALSE (t.get_error ()) << t.get_error ().get_message ();

	ASSERT_EQ (conf.node.registry.heartbeat_interval, defaults.node.registry.heartbeat_interval);
	ASSERT_EQ (conf.node.registry.heartbeat_timeout, defaults.node.registry.heartbeat_timeout);
	ASSERT_EQ (conf.node.registry.uptime_window, defaults.node.registry.uptime_window);
	ASSERT_EQ (conf.node.consensus.required_confirmations, defaults.node.consensus.required_confirmations);
	ASSERT_EQ (conf.node.consensus.max_rounds, defaults.node.consensus.max_rounds);
	ASSERT_EQ (conf.node.consensus.round_timeout, defaults.node.consensus.round_timeout);
	ASSERT_EQ (conf.node.evaluation_queue.max_attempts, defaults.node.evaluation_queue.max_attempts);
	ASSERT_EQ (conf.node.evaluation_queue.initial_delay, defaults.node.evaluation_queue.initial_delay);
	ASSERT_EQ (conf.node.notifications.admin_broadcast, defaults.node.notifications.admin_broadcast);
	ASSERT_EQ (conf.node.simulator.enable, defaults.node.simulator.enable);
	ASSERT_EQ (conf.node.elections.replication_factor, defaults.node.elections.replication_factor);
	ASSERT_EQ (conf.node.elections.port_base, defaults.node.elections.port_base);
	ASSERT_EQ (conf.node.stats_config.max_samples, defaults.node.stats_config.max_samples);
}

/** Deserialize a config with all values set to non-defaults */
TEST (toml, daemon_config_deserialize_no_defaults)
{
	std::stringstream ss;
	ss << R"toml(
	[node.registry]
	heartbeat_interval = 500
	heartbeat_timeout = 2500
	sweep_interval = 250
	uptime_window = 20

	[node.consensus]
	required_confirmations = 5
	max_rounds = 4
	round_timeout = 10000
	sweep_interval = 200

	[node.evaluation_queue]
	threads = 4
	initial_delay = 50
	max_delay = 2000
	backoff_multiplier = 3.0
	jitter = 0.2
	max_attempts = 7
	dead_letter_capacity = 16

	[node.notifications]
	threads = 2
	admin_broadcast = false

	[node.simulator]
	enable = true
	confirmation_delay = 100
	rejection_ratio = 0.25
	heartbeat_interval = 300
	response_time_min = 1
	response_time_max = 9

	[node.elections]
	replication_factor = 7
	host = "10.0.0.1"
	port_base = 9000

	[node.statistics]
	max_samples = 999
	)toml";

	ballot::tomlconfig toml;
	toml.read (ss);
	ballot::daemon_config conf;
	conf.deserialize_toml (toml);

	ASSERT_FALSE (toml.get_error ()) << toml.get_error ().get_message ();

	auto const & node = conf.node;
	ASSERT_EQ (500ms, node.registry.heartbeat_interval);
	ASSERT_EQ (2500ms, node.registry.heartbeat_timeout);
	ASSERT_EQ (250ms, node.registry.sweep_interval);
	ASSERT_EQ (20, node.registry.uptime_window);
	ASSERT_EQ (5, node.consensus.required_confirmations);
	ASSERT_EQ (4, node.consensus.max_rounds);
	ASSERT_EQ (10000ms, node.consensus.round_timeout);
	ASSERT_EQ (200ms, node.consensus.sweep_interval);
	ASSERT_EQ (4, node.evaluation_queue.threads);
	ASSERT_EQ (50ms, node.evaluation_queue.initial_delay);
	ASSERT_EQ (2000ms, node.evaluation_queue.max_delay);
	ASSERT_DOUBLE_EQ (3.0, node.evaluation_queue.backoff_multiplier);
	ASSERT_DOUBLE_EQ (0.2, node.evaluation_queue.jitter);
	ASSERT_EQ (7, node.evaluation_queue.max_attempts);
	ASSERT_EQ (16, node.evaluation_queue.dead_letter_capacity);
	ASSERT_EQ (2, node.notifications.threads);
	ASSERT_FALSE (node.notifications.admin_broadcast);
	ASSERT_TRUE (node.simulator.enable);
	ASSERT_EQ (100ms, node.simulator.confirmation_delay);
	ASSERT_DOUBLE_EQ (0.25, node.simulator.rejection_ratio);
	ASSERT_EQ (300ms, node.simulator.heartbeat_interval);
	ASSERT_EQ (1, node.simulator.response_time_min);
	ASSERT_EQ (9, node.simulator.response_time_max);
	ASSERT_EQ (7, node.elections.replication_factor);
	ASSERT_EQ ("10.0.0.1", node.elections.host);
	ASSERT_EQ (9000, node.elections.port_base);
	ASSERT_EQ (999, node.stats_config.max_samples);
}

/** Serialized defaults read back unchanged */
TEST (toml, daemon_config_serialize)
{
	ballot::tomlconfig toml;
	ballot::daemon_config config;
	config.node.consensus.required_confirmations = 4;
	config.node.elections.host = "192.168.1.1";
	ASSERT_FALSE (config.serialize_toml (toml));

	std::stringstream ss;
	toml.write (ss);
	ballot::tomlconfig read;
	read.read (ss);
	ballot::daemon_config other;
	ASSERT_FALSE (other.deserialize_toml (read));
	ASSERT_EQ (4, other.node.consensus.required_confirmations);
	ASSERT_EQ ("192.168.1.1", other.node.elections.host);
	ASSERT_EQ (config.node.registry.heartbeat_timeout, other.node.registry.heartbeat_timeout);
}

TEST (toml, consensus_config_invalid)
{
	std::stringstream ss;
	ss << R"toml(
	[node.consensus]
	required_confirmations = 0
	)toml";

	ballot::tomlconfig toml;
	toml.read (ss);
	ballot::daemon_config conf;
	conf.deserialize_toml (toml);
	ASSERT_TRUE (toml.get_error ());
	ASSERT_EQ ("required_confirmations must be greater than 0", toml.get_error ().get_message ());
}

TEST (toml, registry_config_invalid)
{
	std::stringstream ss;
	ss << R"toml(
	[node.registry]
	heartbeat_interval = 5000
	heartbeat_timeout = 1000
	)toml";

	ballot::tomlconfig toml;
	toml.read (ss);
	ballot::daemon_config conf;
	conf.deserialize_toml (toml);
	ASSERT_TRUE (toml.get_error ());
	ASSERT_EQ ("registry.heartbeat_timeout must be greater than registry.heartbeat_interval", toml.get_error ().get_message ());
}

TEST (toml, invalid_type)
{
	std::stringstream ss;
	ss << R"toml(
	[node.consensus]
	max_rounds = "many"
	)toml";

	ballot::tomlconfig toml;
	toml.read (ss);
	ballot::daemon_config conf;
	conf.deserialize_toml (toml);
	ASSERT_TRUE (toml.get_error ());
	ASSERT_EQ ("max_rounds is not a 32-bit unsigned integer", toml.get_error ().get_message ());
	ASSERT_EQ (3, conf.node.consensus.max_rounds);
}

/** Command line overrides take precedence over the file */
TEST (toml, read_node_config_overrides)
{
	auto path = ballot::unique_path ();
	{
		std::ofstream file (ballot::get_node_toml_config_path (path));
		file << "[node.consensus]\nrequired_confirmations = 4\nmax_rounds = 2\n";
	}
	ballot::daemon_config config{ path };
	auto error = ballot::read_node_config_toml (path, config, { "node.consensus.max_rounds=6" });
	ASSERT_FALSE (error) << error.get_message ();
	ASSERT_EQ (4, config.node.consensus.required_confirmations);
	ASSERT_EQ (6, config.node.consensus.max_rounds);
}

/** Running without a config file uses the defaults */
TEST (toml, read_node_config_missing)
{
	auto path = ballot::unique_path ();
	ballot::daemon_config config{ path };
	auto error = ballot::read_node_config_toml (path, config);
	ASSERT_FALSE (error) << error.get_message ();
	ASSERT_EQ (3, config.node.consensus.required_confirmations);
}
