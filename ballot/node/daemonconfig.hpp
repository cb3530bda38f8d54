#pragma once

#include <ballot/lib/errors.hpp>
#include <ballot/node/nodeconfig.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace ballot
{
class tomlconfig;

class daemon_config
{
public:
	daemon_config () = default;
	explicit daemon_config (std::filesystem::path const & data_path);

	ballot::error deserialize_toml (ballot::tomlconfig &);
	ballot::error serialize_toml (ballot::tomlconfig &);

	ballot::node_config node;
	std::filesystem::path data_path;
};

ballot::error read_node_config_toml (std::filesystem::path const &, ballot::daemon_config & config_a, std::vector<std::string> const & config_overrides = std::vector<std::string> ());
}
