#pragma once

#include <ballot/lib/logging.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace ballot
{
class daemon
{
	ballot::logger logger{ "daemon" };

public:
	/** Runs a coordinator until SIGINT or SIGTERM */
	void run (std::filesystem::path const &, std::vector<std::string> const & config_overrides);

	/**
	 * Runs one election end to end with simulated nodes and prints its outcome as JSON
	 * @returns process exit code
	 */
	int simulate (std::filesystem::path const &, std::vector<std::string> const & config_overrides, unsigned voters, unsigned nodes);
};
}
