#pragma once

#include <ballot/lib/errors.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/node/elections.hpp>
#include <ballot/node/evaluation_queue.hpp>
#include <ballot/node/node_registry.hpp>
#include <ballot/node/notifications.hpp>
#include <ballot/node/round_manager.hpp>
#include <ballot/node/simulator.hpp>

namespace ballot
{
class tomlconfig;

/**
 * Coordinator configuration
 */
class node_config
{
public:
	ballot::error serialize_toml (ballot::tomlconfig &) const;
	ballot::error deserialize_toml (ballot::tomlconfig &);

	ballot::node_registry_config registry;
	ballot::consensus_config consensus;
	ballot::evaluation_queue_config evaluation_queue;
	ballot::notifications_config notifications;
	ballot::simulator_config simulator;
	ballot::elections_config elections;
	ballot::stats_config stats_config;
};
}
