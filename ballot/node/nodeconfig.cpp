#include <ballot/lib/tomlconfig.hpp>
#include <ballot/node/nodeconfig.hpp>

ballot::error ballot::node_config::serialize_toml (ballot::tomlconfig & toml) const
{
	ballot::tomlconfig registry_l;
	registry.serialize (registry_l);
	toml.put_child ("registry", registry_l);

	ballot::tomlconfig consensus_l;
	consensus.serialize (consensus_l);
	toml.put_child ("consensus", consensus_l);

	ballot::tomlconfig evaluation_queue_l;
	evaluation_queue.serialize (evaluation_queue_l);
	toml.put_child ("evaluation_queue", evaluation_queue_l);

	ballot::tomlconfig notifications_l;
	notifications.serialize (notifications_l);
	toml.put_child ("notifications", notifications_l);

	ballot::tomlconfig simulator_l;
	simulator.serialize (simulator_l);
	toml.put_child ("simulator", simulator_l);

	ballot::tomlconfig elections_l;
	elections.serialize (elections_l);
	toml.put_child ("elections", elections_l);

	ballot::tomlconfig stats_l;
	stats_config.serialize_toml (stats_l);
	toml.put_child ("statistics", stats_l);

	return toml.get_error ();
}

ballot::error ballot::node_config::deserialize_toml (ballot::tomlconfig & toml)
{
	try
	{
		if (toml.has_key ("registry"))
		{
			auto config_l = toml.get_required_child ("registry");
			registry.deserialize (config_l);
		}

		if (toml.has_key ("consensus"))
		{
			auto config_l = toml.get_required_child ("consensus");
			consensus.deserialize (config_l);
		}

		if (toml.has_key ("evaluation_queue"))
		{
			auto config_l = toml.get_required_child ("evaluation_queue");
			evaluation_queue.deserialize (config_l);
		}

		if (toml.has_key ("notifications"))
		{
			auto config_l = toml.get_required_child ("notifications");
			notifications.deserialize (config_l);
		}

		if (toml.has_key ("simulator"))
		{
			auto config_l = toml.get_required_child ("simulator");
			simulator.deserialize (config_l);
		}

		if (toml.has_key ("elections"))
		{
			auto config_l = toml.get_required_child ("elections");
			elections.deserialize (config_l);
		}

		if (toml.has_key ("statistics"))
		{
			auto config_l = toml.get_required_child ("statistics");
			stats_config.deserialize_toml (config_l);
		}

		if (registry.heartbeat_timeout <= registry.heartbeat_interval)
		{
			toml.get_error ().set ("registry.heartbeat_timeout must be greater than registry.heartbeat_interval");
		}
	}
	catch (std::runtime_error const & ex)
	{
		toml.get_error ().set (ex.what ());
	}

	return toml.get_error ();
}
