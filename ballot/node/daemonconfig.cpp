#include <ballot/lib/config.hpp>
#include <ballot/lib/tomlconfig.hpp>
#include <ballot/node/daemonconfig.hpp>

ballot::daemon_config::daemon_config (std::filesystem::path const & data_path_a) :
	data_path{ data_path_a }
{
}

ballot::error ballot::daemon_config::serialize_toml (ballot::tomlconfig & toml)
{
	ballot::tomlconfig node_l;
	node.serialize_toml (node_l);
	toml.put_child ("node", node_l);

	return toml.get_error ();
}

ballot::error ballot::daemon_config::deserialize_toml (ballot::tomlconfig & toml)
{
	auto node_l (toml.get_optional_child ("node"));
	if (!toml.get_error () && node_l)
	{
		node.deserialize_toml (*node_l);
	}

	return toml.get_error ();
}

ballot::error ballot::read_node_config_toml (std::filesystem::path const & data_path_a, ballot::daemon_config & config_a, std::vector<std::string> const & config_overrides)
{
	ballot::error error;
	auto toml_config_path = ballot::get_node_toml_config_path (data_path_a);

	// Parse and deserialize
	ballot::tomlconfig toml;
	auto config_overrides_stream = ballot::config_overrides (config_overrides);

	// Make sure we don't create an empty toml file if it doesn't exist. Running without a toml file is the default.
	if (std::filesystem::exists (toml_config_path))
	{
		error = toml.read (config_overrides_stream, toml_config_path);
	}
	else
	{
		error = toml.read (config_overrides_stream);
	}

	if (!error)
	{
		error = config_a.deserialize_toml (toml);
	}

	return error;
}
