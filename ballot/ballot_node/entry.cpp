#include <ballot/ballot_node/daemon.hpp>
#include <ballot/lib/config.hpp>
#include <ballot/lib/logging.hpp>
#include <ballot/lib/tomlconfig.hpp>
#include <ballot/lib/utility.hpp>
#include <ballot/node/daemonconfig.hpp>
#include <ballot/secure/utility.hpp>

#include <boost/program_options.hpp>

#include <iostream>

int main (int argc, char * const * argv)
{
	ballot::set_umask (); // Make sure the process umask is set before any files are created
	ballot::logger::initialize (ballot::log_config::cli_default ());

	boost::program_options::options_description description ("Command line options");
	// clang-format off
	description.add_options ()
		("help", "Print out options")
		("version", "Prints out version")
		("data_path", boost::program_options::value<std::string> (), "Use the supplied path as the data directory")
		("config", boost::program_options::value<std::vector<std::string>>()->multitoken(), "Pass configuration values. This takes precedence over any values in the configuration file. This option can be repeated multiple times.")
		("generate_config", boost::program_options::value<std::string> (), "Write configuration to stdout, populated with defaults suitable for this system. Pass the configuration type node or log. See also use_defaults.")
		("use_defaults", "If present, the generate_config command will generate uncommented entries")
		("daemon", "Start coordinator daemon")
		("simulate", "Run a single election with simulated nodes and print the resulting statistics as JSON")
		("voters", boost::program_options::value<unsigned> ()->default_value (10), "Defines the number of voters for --simulate")
		("nodes", boost::program_options::value<unsigned> ()->default_value (5), "Defines the number of election nodes for --simulate");
	// clang-format on

	boost::program_options::options_description sorted ("Command line options");
	ballot::sort_options_description (description, sorted);

	boost::program_options::variables_map vm;
	try
	{
		boost::program_options::store (boost::program_options::parse_command_line (argc, argv, description), vm);
	}
	catch (boost::program_options::error const & err)
	{
		std::cerr << err.what () << std::endl;
		return 1;
	}
	boost::program_options::notify (vm);
	int result (0);

	auto data_path_it = vm.find ("data_path");
	std::filesystem::path data_path ((data_path_it != vm.end ()) ? std::filesystem::path (data_path_it->second.as<std::string> ()) : ballot::working_path ());

	std::vector<std::string> config_overrides;
	if (auto config = vm.find ("config"); config != vm.end ())
	{
		config_overrides = config->second.as<std::vector<std::string>> ();
	}

	if (vm.count ("daemon") > 0)
	{
		ballot::daemon daemon;
		daemon.run (data_path, config_overrides);
	}
	else if (vm.count ("simulate") > 0)
	{
		auto voters = vm["voters"].as<unsigned> ();
		auto nodes = vm["nodes"].as<unsigned> ();
		if (nodes == 0)
		{
			std::cerr << "--nodes must be greater than 0" << std::endl;
			result = -1;
		}
		else
		{
			ballot::daemon daemon;
			result = daemon.simulate (data_path, config_overrides, voters, nodes);
		}
	}
	else if (vm.count ("generate_config"))
	{
		auto type = vm["generate_config"].as<std::string> ();
		ballot::tomlconfig toml;
		bool valid_type = false;
		if (type == "node")
		{
			valid_type = true;
			ballot::daemon_config config{ data_path };
			config.serialize_toml (toml);
		}
		else if (type == "log")
		{
			valid_type = true;
			ballot::log_config config = ballot::log_config::sample_config ();
			config.serialize_toml (toml);
		}
		else
		{
			std::cerr << "Invalid configuration type " << type << ". Must be node or log." << std::endl;
			result = -1;
		}

		if (valid_type)
		{
			std::cout << "# This is an example configuration file for the ballot coordinator.\n#\n"
					  << "# Fields may need to be defined in the context of a [category] above them.\n"
					  << "# The desired configuration changes should be placed in config-" << type << ".toml in the data path.\n"
					  << "# To change a value from its default, uncomment (erasing #) the corresponding field.\n"
					  << "# It is not recommended to uncomment every field, as the default value for important fields may change in the future. Only change what you need.\n";

			std::cout << toml.to_string (!vm.count ("use_defaults")) << std::endl;
		}
	}
	else if (vm.count ("version"))
	{
		std::cout << "Version " << BALLOT_VERSION_STRING << "\n"
				  << "Build Info " << BUILD_INFO << std::endl;
	}
	else
	{
		// Regardless how the options were added, output the options in alphabetical order so they are easy to find.
		std::cout << sorted << std::endl;
		result = (vm.count ("help") > 0) ? 0 : -1;
	}

	return result;
}
