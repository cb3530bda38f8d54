#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/node/node_registry.hpp>
#include <ballot/test_common/testutil.hpp>

#include <gtest/gtest.h>

using namespace std::chrono_literals;

TEST (node_registry, add)
{
	ballot::node_registry_config config;
	ballot::stats stats;
	ballot::logger logger;
	ballot::node_registry registry{ config, stats, logger };
	auto node = registry.add (1, "127.0.0.1:7100");
	ASSERT_EQ (36, node.id.size ());
	ASSERT_EQ ('4', node.id[14]);
	ASSERT_EQ (ballot::node_status::active, node.status);
	ASSERT_EQ (1, registry.size ());
	auto existing = registry.get (node.id);
	ASSERT_TRUE (existing);
	ASSERT_EQ ("127.0.0.1:7100", existing->address);
	ASSERT_EQ (1, existing->election);
	ASSERT_FALSE (registry.get ("missing"));
	ASSERT_EQ (1, stats.count (ballot::stat::type::node_registry, ballot::stat::detail::node_registered));
}

// Nodes are ordered by response time, then most recent heartbeat, then id
TEST (node_registry, select_order)
{
	ballot::node_registry_config config;
	ballot::stats stats;
	ballot::logger logger;
	ballot::node_registry registry{ config, stats, logger };
	auto now = std::chrono::system_clock::now ();
	auto node1 = registry.add (1, "a", now);
	auto node2 = registry.add (1, "b", now);
	auto node3 = registry.add (1, "c", now);
	registry.add (2, "other", now);
	ASSERT_NO_ERROR (registry.record_heartbeat (node1.id, 30.0, now + 100ms));
	ASSERT_NO_ERROR (registry.record_heartbeat (node2.id, 10.0, now + 100ms));
	ASSERT_NO_ERROR (registry.record_heartbeat (node3.id, 20.0, now + 100ms));
	auto selected = registry.select_active_nodes (1, 3);
	ASSERT_EQ (3, selected.size ());
	ASSERT_EQ (node2.id, selected[0].id);
	ASSERT_EQ (node3.id, selected[1].id);
	ASSERT_EQ (node1.id, selected[2].id);
	auto two = registry.select_active_nodes (1, 2);
	ASSERT_EQ (2, two.size ());
	ASSERT_EQ (node2.id, two[0].id);
	ASSERT_EQ (node3.id, two[1].id);
}

TEST (node_registry, select_order_tie)
{
	ballot::node_registry_config config;
	ballot::stats stats;
	ballot::logger logger;
	ballot::node_registry registry{ config, stats, logger };
	auto now = std::chrono::system_clock::now ();
	auto node1 = registry.add (1, "a", now);
	auto node2 = registry.add (1, "b", now);
	ASSERT_NO_ERROR (registry.record_heartbeat (node1.id, 10.0, now + 100ms));
	ASSERT_NO_ERROR (registry.record_heartbeat (node2.id, 10.0, now + 200ms));
	auto selected = registry.select_active_nodes (1, 2);
	ASSERT_EQ (2, selected.size ());
	// Same response time, most recent heartbeat first
	ASSERT_EQ (node2.id, selected[0].id);
	ASSERT_EQ (node1.id, selected[1].id);
}

TEST (node_registry, select_fewer_than_requested)
{
	ballot::node_registry_config config;
	config.heartbeat_timeout = 5s;
	ballot::stats stats;
	ballot::logger logger;
	ballot::node_registry registry{ config, stats, logger };
	auto now = std::chrono::system_clock::now ();
	auto node1 = registry.add (1, "a", now);
	auto node2 = registry.add (1, "b", now);
	auto node3 = registry.add (1, "c", now);
	ASSERT_NO_ERROR (registry.record_heartbeat (node1.id, 40.0, now + 4s));
	ASSERT_NO_ERROR (registry.record_heartbeat (node2.id, 15.0, now + 4s));
	ASSERT_EQ (1, registry.mark_unreachable (now + 6s));
	ASSERT_EQ (ballot::node_status::unreachable, registry.get (node3.id)->status);
	auto selected = registry.select_active_nodes (1, 3);
	ASSERT_EQ (2, selected.size ());
	ASSERT_EQ (node2.id, selected[0].id);
	ASSERT_EQ (node1.id, selected[1].id);
	ASSERT_EQ (1, stats.count (ballot::stat::type::node_registry, ballot::stat::detail::insufficient));
}

TEST (node_registry, select_empty)
{
	ballot::node_registry_config config;
	ballot::stats stats;
	ballot::logger logger;
	ballot::node_registry registry{ config, stats, logger };
	ASSERT_TRUE (registry.select_active_nodes (1, 3).empty ());
}

TEST (node_registry, response_time_average)
{
	ballot::node_registry_config config;
	ballot::stats stats;
	ballot::logger logger;
	ballot::node_registry registry{ config, stats, logger };
	auto now = std::chrono::system_clock::now ();
	auto node = registry.add (1, "a", now);
	// The first sample is taken as is
	ASSERT_NO_ERROR (registry.record_heartbeat (node.id, 100.0, now + 100ms));
	ASSERT_DOUBLE_EQ (100.0, registry.get (node.id)->response_time_ms);
	ASSERT_NO_ERROR (registry.record_heartbeat (node.id, 50.0, now + 200ms));
	ASSERT_DOUBLE_EQ (90.0, registry.get (node.id)->response_time_ms);
	ASSERT_NO_ERROR (registry.record_heartbeat (node.id, 40.0, now + 300ms));
	ASSERT_DOUBLE_EQ (80.0, registry.get (node.id)->response_time_ms);
	ASSERT_EQ (3, registry.get (node.id)->heartbeats);
}

TEST (node_registry, unreachable_recovers)
{
	ballot::node_registry_config config;
	config.heartbeat_timeout = 5s;
	ballot::stats stats;
	ballot::logger logger;
	ballot::node_registry registry{ config, stats, logger };
	auto now = std::chrono::system_clock::now ();
	auto node = registry.add (1, "a", now);
	ASSERT_EQ (0, registry.mark_unreachable (now + 4s));
	ASSERT_EQ (1, registry.mark_unreachable (now + 6s));
	ASSERT_EQ (0, registry.mark_unreachable (now + 7s));
	ASSERT_EQ (1, registry.count (1, ballot::node_status::unreachable));
	ASSERT_TRUE (registry.select_active_nodes (1, 1).empty ());
	ASSERT_NO_ERROR (registry.record_heartbeat (node.id, 10.0, now + 8s));
	ASSERT_EQ (ballot::node_status::active, registry.get (node.id)->status);
	ASSERT_EQ (1, registry.select_active_nodes (1, 1).size ());
}

TEST (node_registry, uptime)
{
	ballot::node_registry_config config;
	config.heartbeat_interval = 1s;
	ballot::stats stats;
	ballot::logger logger;
	ballot::node_registry registry{ config, stats, logger };
	auto now = std::chrono::system_clock::now ();
	auto node = registry.add (1, "a", now);
	ASSERT_DOUBLE_EQ (100.0, registry.get (node.id)->uptime_percentage);
	ASSERT_NO_ERROR (registry.record_heartbeat (node.id, 10.0, now + 500ms));
	ASSERT_DOUBLE_EQ (100.0, registry.get (node.id)->uptime_percentage);
	// Two expected heartbeats missed before this one
	ASSERT_NO_ERROR (registry.record_heartbeat (node.id, 10.0, now + 3500ms));
	ASSERT_DOUBLE_EQ (50.0, registry.get (node.id)->uptime_percentage);
}

TEST (node_registry, uptime_window)
{
	ballot::node_registry_config config;
	config.heartbeat_interval = 1s;
	config.uptime_window = 2;
	ballot::stats stats;
	ballot::logger logger;
	ballot::node_registry registry{ config, stats, logger };
	auto now = std::chrono::system_clock::now ();
	auto node = registry.add (1, "a", now);
	ASSERT_NO_ERROR (registry.record_heartbeat (node.id, 10.0, now + 10s));
	ASSERT_DOUBLE_EQ (50.0, registry.get (node.id)->uptime_percentage);
	// Older misses fall out of the window
	ASSERT_NO_ERROR (registry.record_heartbeat (node.id, 10.0, now + 10500ms));
	ASSERT_DOUBLE_EQ (100.0, registry.get (node.id)->uptime_percentage);
}

TEST (node_registry, heartbeat_unknown)
{
	ballot::node_registry_config config;
	ballot::stats stats;
	ballot::logger logger;
	ballot::node_registry registry{ config, stats, logger };
	ASSERT_EQ (ballot::error_consensus::unknown_node, registry.record_heartbeat ("missing", 10.0));
}

TEST (node_registry, deactivate)
{
	ballot::node_registry_config config;
	ballot::stats stats;
	ballot::logger logger;
	ballot::node_registry registry{ config, stats, logger };
	auto node1 = registry.add (1, "a");
	registry.add (1, "b");
	auto node3 = registry.add (2, "c");
	ASSERT_EQ (2, registry.deactivate (1));
	ASSERT_EQ (0, registry.deactivate (1));
	ASSERT_EQ (2, registry.count (1, ballot::node_status::inactive));
	ASSERT_TRUE (registry.select_active_nodes (1, 3).empty ());
	ASSERT_EQ (ballot::error_consensus::election_ended, registry.record_heartbeat (node1.id, 10.0));
	ASSERT_EQ (ballot::node_status::inactive, registry.get (node1.id)->status);
	ASSERT_NO_ERROR (registry.record_heartbeat (node3.id, 10.0));
	// Inactive nodes are never marked unreachable
	ASSERT_EQ (1, registry.mark_unreachable (std::chrono::system_clock::now () + 1h));
}

TEST (node_registry, sweep_thread)
{
	ballot::node_registry_config config;
	config.heartbeat_interval = 10ms;
	config.heartbeat_timeout = 50ms;
	config.sweep_interval = 10ms;
	ballot::stats stats;
	ballot::logger logger;
	ballot::node_registry registry{ config, stats, logger };
	ballot::test::start_stop_guard guard{ registry };
	auto node = registry.add (1, "a");
	auto deadline = std::chrono::steady_clock::now () + 5s;
	while (registry.get (node.id)->status != ballot::node_status::unreachable && std::chrono::steady_clock::now () < deadline)
	{
		std::this_thread::sleep_for (10ms);
	}
	ASSERT_EQ (ballot::node_status::unreachable, registry.get (node.id)->status);
	ASSERT_LE (1, stats.count (ballot::stat::type::node_registry, ballot::stat::detail::node_unreachable));
}
