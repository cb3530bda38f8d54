#pragma once

#include <ballot/lib/errors.hpp>
#include <ballot/lib/tomlconfig.hpp>

#include <boost/config.hpp>
#include <boost/version.hpp>

#include <chrono>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::chrono_literals;

#define xstr(a) ver_str (a)
#define ver_str(a) #a

/**
 * Returns build version information
 */
char const * const BALLOT_VERSION_STRING = xstr (TAG_VERSION_STRING);

char const * const BUILD_INFO = xstr (BOOST_COMPILER) " \"BOOST " xstr (BOOST_VERSION) "\" BUILT " xstr (__DATE__);

namespace ballot
{
std::filesystem::path get_node_toml_config_path (std::filesystem::path const & data_path);

/** Joins `key=value` overrides into a stream which takes precedence over the file contents */
std::stringstream config_overrides (std::vector<std::string> const & config_overrides);

/**
 * Loads `config_filename` from `data_path` with command line overrides applied, leaving `fallback` for anything missing.
 * A missing file is not an error, running without one is the default.
 * @throws std::runtime_error if the file cannot be parsed or deserialized
 */
template <typename T>
T load_config_file (T fallback, std::string const & config_filename, std::filesystem::path const & data_path, std::vector<std::string> const & config_overrides_a)
{
	auto toml_config_path = data_path / config_filename;

	ballot::tomlconfig toml;
	auto overrides_stream = ballot::config_overrides (config_overrides_a);

	ballot::error error;
	if (std::filesystem::exists (toml_config_path))
	{
		error = toml.read (overrides_stream, toml_config_path);
	}
	else
	{
		error = toml.read (overrides_stream);
	}

	T config = fallback;
	if (!error)
	{
		error = config.deserialize_toml (toml);
	}
	if (error)
	{
		throw std::runtime_error (error.get_message ());
	}
	return config;
}
}
