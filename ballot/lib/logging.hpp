#pragma once

#include <ballot/lib/logging_enums.hpp>
#include <ballot/lib/tomlconfig.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <fmt/ostream.h>
#include <spdlog/spdlog.h>

namespace ballot::log
{
using logger_id = std::pair<ballot::log::type, ballot::log::detail>;

std::string to_string (logger_id);
logger_id parse_logger_id (std::string const &);
}

namespace ballot
{
class log_config final
{
public:
	ballot::error serialize_toml (ballot::tomlconfig &) const;
	ballot::error deserialize_toml (ballot::tomlconfig &);

private:
	void serialize (ballot::tomlconfig &) const;
	void deserialize (ballot::tomlconfig &);

public:
	ballot::log::level default_level{ ballot::log::level::info };
	ballot::log::level flush_level{ ballot::log::level::error };

	std::map<ballot::log::logger_id, ballot::log::level> levels;

	struct console_config
	{
		bool enable{ true };
		bool colors{ true };
		bool to_cerr{ false };
	};

	struct file_config
	{
		bool enable{ true };
		std::size_t max_size{ 32 * 1024 * 1024 };
		std::size_t rotation_count{ 4 };
	};

	console_config console;
	file_config file;

public: // Predefined defaults
	static log_config cli_default ();
	static log_config daemon_default ();
	static log_config tests_default ();
	static log_config sample_config (); // For auto-generated sample config files

private:
	/// Returns placeholder log levels for all loggers
	static std::map<ballot::log::logger_id, ballot::log::level> default_levels (ballot::log::level);
};

ballot::log_config load_log_config (ballot::log_config fallback, std::filesystem::path const & data_path, std::vector<std::string> const & config_overrides = {});

class logger final
{
public:
	explicit logger (std::string identifier = "");
	~logger ();

	// Disallow copies
	logger (logger const &) = delete;

public:
	static void initialize (ballot::log_config fallback, std::optional<std::filesystem::path> data_path = std::nullopt, std::vector<std::string> const & config_overrides = {});
	static void initialize_for_tests (ballot::log_config fallback);

private:
	static bool global_initialized;
	static ballot::log_config global_config;
	static std::vector<spdlog::sink_ptr> global_sinks;

	static void initialize_common (ballot::log_config const &, std::optional<std::filesystem::path> data_path);
	static void flush ();

public:
	template <class... Args>
	void debug (ballot::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).debug (fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void info (ballot::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).info (fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void warn (ballot::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).warn (fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void error (ballot::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).error (fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void critical (ballot::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).critical (fmt, std::forward<Args> (args)...);
	}

	/** Logs at trace level through the `type::detail` logger, so single events can be enabled independently */
	template <class... Args>
	void trace (ballot::log::type type, ballot::log::detail detail, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type, detail).trace (fmt, std::forward<Args> (args)...);
	}

private:
	const std::string identifier;

	std::map<ballot::log::logger_id, std::shared_ptr<spdlog::logger>> spd_loggers;
	std::shared_mutex mutex;

private:
	spdlog::logger & get_logger (ballot::log::type, ballot::log::detail = ballot::log::detail::all);
	std::shared_ptr<spdlog::logger> make_logger (ballot::log::logger_id);
	ballot::log::level find_level (ballot::log::logger_id) const;

	static spdlog::level::level_enum to_spdlog_level (ballot::log::level);
};
}
