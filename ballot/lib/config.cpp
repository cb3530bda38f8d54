#include <ballot/lib/config.hpp>

std::filesystem::path ballot::get_node_toml_config_path (std::filesystem::path const & data_path)
{
	return data_path / "config-node.toml";
}

std::stringstream ballot::config_overrides (std::vector<std::string> const & config_overrides)
{
	std::stringstream config_overrides_stream;
	for (auto const & entry : config_overrides)
	{
		config_overrides_stream << entry << std::endl;
	}
	config_overrides_stream << std::endl;
	return config_overrides_stream;
}
