#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include <magic_enum.hpp>

namespace ballot::log
{
enum class level
{
	trace,
	debug,
	info,
	warn,
	error,
	critical,
	off,
};

enum class type
{
	all = 0, // reserved

	daemon,
	signal_manager,

	// consensus
	coordinator,
	elections,
	node_registry,
	vote_store,
	round_manager,
	evaluator,
	evaluation_queue,
	notifications,
	audit_log,
	simulator,

	_last // Must be the last enum
};

enum class detail
{
	all = 0, // reserved

	// node_registry
	heartbeat,

	// round_manager
	round_opened,
	confirmation_recorded,

	// evaluation_queue
	task_retry,

	// notifications
	notification_sent,

	_last // Must be the last enum
};
}

namespace ballot::log
{
std::string_view to_string (ballot::log::type);
std::string_view to_string (ballot::log::detail);
std::string_view to_string (ballot::log::level);

/// @throw std::invalid_argument if the input string does not match a log::level
ballot::log::level parse_level (std::string_view);

/// @throw std::invalid_argument if the input string does not match a log::type
ballot::log::type parse_type (std::string_view);

/// @throw std::invalid_argument if the input string does not match a log::detail
ballot::log::detail parse_detail (std::string_view);

std::vector<ballot::log::level> const & all_levels ();
std::vector<ballot::log::type> const & all_types ();
}

// Ensure that the enum_range is large enough to hold all values (including future ones)
template <>
struct magic_enum::customize::enum_range<ballot::log::type>
{
	static constexpr int min = 0;
	static constexpr int max = 128;
};

template <>
struct magic_enum::customize::enum_range<ballot::log::detail>
{
	static constexpr int min = 0;
	static constexpr int max = 128;
};
