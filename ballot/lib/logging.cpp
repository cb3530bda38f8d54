#include <ballot/lib/config.hpp>
#include <ballot/lib/enum_util.hpp>
#include <ballot/lib/env.hpp>
#include <ballot/lib/logging.hpp>
#include <ballot/lib/logging_enums.hpp>
#include <ballot/lib/utility.hpp>

#include <fmt/chrono.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <iostream>

/*
 * logger
 */

bool ballot::logger::global_initialized{ false };
ballot::log_config ballot::logger::global_config{};
std::vector<spdlog::sink_ptr> ballot::logger::global_sinks{};

void ballot::logger::initialize (ballot::log_config fallback, std::optional<std::filesystem::path> data_path, std::vector<std::string> const & config_overrides)
{
	// Only load log config from file if data_path is available (i.e. not running in cli mode)
	ballot::log_config config = data_path ? ballot::load_log_config (fallback, *data_path, config_overrides) : fallback;
	initialize_common (config, data_path);
	global_initialized = true;
}

void ballot::logger::initialize_for_tests (ballot::log_config fallback)
{
	auto config = ballot::load_log_config (std::move (fallback), /* load log config from current workdir */ std::filesystem::current_path ());
	initialize_common (config, /* store log file in current workdir */ std::filesystem::current_path ());

	// Several coordinators share one test process, the logger name carries the coordinator identifier
	for (auto & sink : global_sinks)
	{
		sink->set_pattern ("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
	}

	global_initialized = true;
}

// Using std::cerr here, since logging may not be initialized yet
void ballot::logger::initialize_common (ballot::log_config const & config, std::optional<std::filesystem::path> data_path)
{
	global_config = config;

	spdlog::set_automatic_registration (false);
	spdlog::set_level (to_spdlog_level (config.default_level));

	global_sinks.clear ();

	if (config.console.enable)
	{
		if (!config.console.to_cerr)
		{
			if (config.console.colors)
			{
				auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt> ();
				global_sinks.push_back (console_sink);
			}
			else
			{
				auto console_sink = std::make_shared<spdlog::sinks::stdout_sink_mt> ();
				global_sinks.push_back (console_sink);
			}
		}
		else
		{
			if (config.console.colors)
			{
				std::cerr << "WARNING: Logging to cerr is enabled, console colors will be disabled" << std::endl;
			}

			auto cerr_sink = std::make_shared<spdlog::sinks::stderr_sink_mt> ();
			global_sinks.push_back (cerr_sink);
		}
	}

	if (config.file.enable)
	{
		// File logging requires a data path
		release_assert (data_path);

		auto now = std::chrono::system_clock::now ();
		auto time = std::chrono::system_clock::to_time_t (now);

		auto filename = fmt::format ("log_{:%Y-%m-%d_%H-%M}-{:%S}", fmt::localtime (time), now.time_since_epoch ());
		std::replace (filename.begin (), filename.end (), '.', '_');

		std::filesystem::path log_path{ data_path.value () / "log" / (filename + ".log") };
		log_path = std::filesystem::absolute (log_path);

		std::cerr << "Logging to file: " << log_path.string () << std::endl;

		// If either max_size or rotation_count is 0, then disable file rotation
		if (config.file.max_size == 0 || config.file.rotation_count == 0)
		{
			std::cerr << "WARNING: Log file rotation is disabled, log file size may grow without bound" << std::endl;

			auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt> (log_path.string (), true);
			global_sinks.push_back (file_sink);
		}
		else
		{
			auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt> (log_path.string (), config.file.max_size, config.file.rotation_count);
			global_sinks.push_back (file_sink);
		}
	}
}

void ballot::logger::flush ()
{
	for (auto & sink : global_sinks)
	{
		sink->flush ();
	}
}

ballot::logger::logger (std::string identifier) :
	identifier{ std::move (identifier) }
{
	release_assert (global_initialized, "logging should be initialized before creating a logger");
}

ballot::logger::~logger ()
{
	flush ();
}

spdlog::logger & ballot::logger::get_logger (ballot::log::type type, ballot::log::detail detail)
{
	// Two steps to avoid exclusively locking the mutex in the common case
	{
		std::shared_lock lock{ mutex };

		if (auto it = spd_loggers.find ({ type, detail }); it != spd_loggers.end ())
		{
			return *it->second;
		}
	}
	{
		std::unique_lock lock{ mutex };

		auto [it, inserted] = spd_loggers.emplace (std::make_pair (type, detail), make_logger ({ type, detail }));
		return *it->second;
	}
}

std::shared_ptr<spdlog::logger> ballot::logger::make_logger (ballot::log::logger_id logger_id)
{
	auto const & config = global_config;
	auto const & sinks = global_sinks;

	// Named `identifier::type[::detail]` when the coordinator has an identifier
	auto name = identifier.empty () ? to_string (logger_id) : fmt::format ("{}::{}", identifier, to_string (logger_id));
	auto spd_logger = std::make_shared<spdlog::logger> (name, sinks.begin (), sinks.end ());

	spd_logger->set_level (to_spdlog_level (find_level (logger_id)));
	spd_logger->flush_on (to_spdlog_level (config.flush_level));

	return spd_logger;
}

ballot::log::level ballot::logger::find_level (ballot::log::logger_id logger_id) const
{
	auto const & config = global_config;
	auto const & [type, detail] = logger_id;

	if (auto it = config.levels.find (logger_id); it != config.levels.end ())
	{
		return it->second;
	}
	if (auto it = config.levels.find ({ type, ballot::log::detail::all }); it != config.levels.end ())
	{
		return it->second;
	}
	return config.default_level;
}

spdlog::level::level_enum ballot::logger::to_spdlog_level (ballot::log::level level)
{
	switch (level)
	{
		case ballot::log::level::off:
			return spdlog::level::off;
		case ballot::log::level::critical:
			return spdlog::level::critical;
		case ballot::log::level::error:
			return spdlog::level::err;
		case ballot::log::level::warn:
			return spdlog::level::warn;
		case ballot::log::level::info:
			return spdlog::level::info;
		case ballot::log::level::debug:
			return spdlog::level::debug;
		case ballot::log::level::trace:
			return spdlog::level::trace;
	}
	debug_assert (false, "Invalid log level");
	return spdlog::level::off;
}

/*
 * logging config presets
 */

ballot::log_config ballot::log_config::cli_default ()
{
	log_config config{};
	config.default_level = ballot::log::level::critical;
	config.console.colors = false; // to avoid printing warning about cerr and colors
	config.console.to_cerr = true; // Keep stdout free for CLI output
	config.file.enable = false;
	return config;
}

ballot::log_config ballot::log_config::daemon_default ()
{
	log_config config{};
	config.default_level = ballot::log::level::info;
	return config;
}

ballot::log_config ballot::log_config::tests_default ()
{
	log_config config{};
	config.default_level = ballot::log::level::off;
	config.file.enable = false;
	return config;
}

ballot::log_config ballot::log_config::sample_config ()
{
	log_config config{};
	config.default_level = ballot::log::level::info;
	config.levels = default_levels (ballot::log::level::info);
	return config;
}

/*
 * logging config
 */

ballot::error ballot::log_config::serialize_toml (ballot::tomlconfig & toml) const
{
	ballot::tomlconfig config_toml;
	serialize (config_toml);
	toml.put_child ("log", config_toml);

	return toml.get_error ();
}

ballot::error ballot::log_config::deserialize_toml (ballot::tomlconfig & toml)
{
	try
	{
		auto logging_l = toml.get_optional_child ("log");
		if (logging_l)
		{
			deserialize (*logging_l);
		}
	}
	catch (std::invalid_argument const & ex)
	{
		toml.get_error ().set (ex.what ());
	}

	return toml.get_error ();
}

void ballot::log_config::serialize (ballot::tomlconfig & toml) const
{
	toml.put ("default_level", std::string{ to_string (default_level) });

	ballot::tomlconfig console_config;
	console_config.put ("enable", console.enable);
	console_config.put ("to_cerr", console.to_cerr);
	console_config.put ("colors", console.colors);
	toml.put_child ("console", console_config);

	ballot::tomlconfig file_config;
	file_config.put ("enable", file.enable);
	file_config.put ("max_size", file.max_size);
	file_config.put ("rotation_count", file.rotation_count);
	toml.put_child ("file", file_config);

	ballot::tomlconfig levels_config;
	for (auto const & [logger_id, level] : levels)
	{
		levels_config.put (to_string (logger_id), std::string{ to_string (level) });
	}
	toml.put_child ("levels", levels_config);
}

void ballot::log_config::deserialize (ballot::tomlconfig & toml)
{
	if (toml.has_key ("default_level"))
	{
		std::string default_level_l;
		toml.get ("default_level", default_level_l);
		default_level = ballot::log::parse_level (default_level_l);
	}

	if (toml.has_key ("console"))
	{
		auto console_config = toml.get_required_child ("console");
		console_config.get ("enable", console.enable);
		console_config.get ("to_cerr", console.to_cerr);
		console_config.get ("colors", console.colors);
	}

	if (toml.has_key ("file"))
	{
		auto file_config = toml.get_required_child ("file");
		file_config.get ("enable", file.enable);
		file_config.get ("max_size", file.max_size);
		file_config.get ("rotation_count", file.rotation_count);
	}

	if (toml.has_key ("levels"))
	{
		auto levels_config = toml.get_required_child ("levels");
		for (auto & entry : *levels_config.get_tree ())
		{
			try
			{
				auto const & name_str = entry.first;
				std::string level_str;
				levels_config.get (name_str, level_str);
				auto logger_level = ballot::log::parse_level (level_str);
				auto logger_id = ballot::log::parse_logger_id (name_str);

				levels[logger_id] = logger_level;
			}
			catch (std::invalid_argument const & ex)
			{
				// Ignore but warn about invalid logger names
				std::cerr << "Problem processing log config: " << ex.what () << std::endl;
			}
		}
	}
}

std::map<ballot::log::logger_id, ballot::log::level> ballot::log_config::default_levels (ballot::log::level default_level)
{
	std::map<ballot::log::logger_id, ballot::log::level> result;
	for (auto const & type : ballot::log::all_types ())
	{
		result.emplace (std::make_pair (type, ballot::log::detail::all), default_level);
	}
	return result;
}

/*
 * config loading
 */

// Using std::cerr here, since logging may not be initialized yet
ballot::log_config ballot::load_log_config (ballot::log_config fallback, const std::filesystem::path & data_path, const std::vector<std::string> & config_overrides)
{
	const std::string config_filename = "config-log.toml";
	try
	{
		auto config = ballot::load_config_file<ballot::log_config> (fallback, config_filename, data_path, config_overrides);

		// Default log level from environment, e.g. "BALLOT_LOG=debug"
		if (auto env_level = ballot::env::get ("BALLOT_LOG"))
		{
			try
			{
				auto level = ballot::log::parse_level (*env_level);
				config.default_level = level;

				std::cerr << "Using default log level from BALLOT_LOG environment variable: " << to_string (level) << std::endl;
			}
			catch (std::invalid_argument const & ex)
			{
				std::cerr << "Invalid log level from BALLOT_LOG environment variable: " << ex.what () << std::endl;
			}
		}

		// Per logger levels from environment, e.g. "BALLOT_LOG_LEVELS=evaluator=debug,node_registry=trace"
		if (auto env_levels = ballot::env::get ("BALLOT_LOG_LEVELS"))
		{
			std::map<ballot::log::logger_id, ballot::log::level> levels;
			for (auto const & env_level_str : ballot::util::split (*env_levels, ","))
			{
				try
				{
					auto arr = ballot::util::split (env_level_str, "=");
					if (arr.size () != 2)
					{
						throw std::invalid_argument ("Invalid entry: " + env_level_str);
					}

					auto logger_id = ballot::log::parse_logger_id (arr[0]);
					auto logger_level = ballot::log::parse_level (arr[1]);

					levels[logger_id] = logger_level;

					std::cerr << "Using logger log level from BALLOT_LOG_LEVELS environment variable: " << to_string (logger_id) << "=" << to_string (logger_level) << std::endl;
				}
				catch (std::invalid_argument const & ex)
				{
					std::cerr << "Invalid log level from BALLOT_LOG_LEVELS environment variable: " << ex.what () << std::endl;
				}
			}

			for (auto const & [logger_id, level] : levels)
			{
				config.levels[logger_id] = level;
			}
		}

		return config;
	}
	catch (std::runtime_error const & ex)
	{
		std::cerr << "Unable to load log config. Using defaults. Error: " << ex.what () << std::endl;
	}
	return fallback;
}

std::string ballot::log::to_string (ballot::log::logger_id logger_id)
{
	auto const & [type, detail] = logger_id;
	if (detail == ballot::log::detail::all)
	{
		return fmt::format ("{}", to_string (type));
	}
	return fmt::format ("{}::{}", to_string (type), to_string (detail));
}

/**
 * Parse `logger_name[::logger_detail]` into a pair of `log::type` and `log::detail`
 * @throw std::invalid_argument if `logger_name` or `logger_detail` are invalid
 */
ballot::log::logger_id ballot::log::parse_logger_id (const std::string & logger_name)
{
	auto parts = ballot::util::split (logger_name, "::");
	if (parts.size () == 1)
	{
		return { ballot::log::parse_type (parts[0]), ballot::log::detail::all };
	}
	if (parts.size () == 2)
	{
		return { ballot::log::parse_type (parts[0]), ballot::log::parse_detail (parts[1]) };
	}
	throw std::invalid_argument ("Invalid logger name: " + logger_name);
}
