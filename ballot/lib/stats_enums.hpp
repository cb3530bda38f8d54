#pragma once

#include <cstdint>
#include <string_view>

#include <magic_enum.hpp>

namespace ballot::stat
{
/** Primary statistics type */
enum class type
{
	_invalid = 0, // Default value, should not be used

	elections,
	node_registry,
	vote_store,
	round_manager,
	evaluator,
	evaluation_queue,
	notifications,
	coordinator,
	confirmation_simulator,
	audit_log,
};

/** Optional detail type */
enum class detail
{
	_invalid = 0, // Default value, should not be used

	all = 1,

	// common
	test,
	failed,
	duplicate,
	unknown,
	stale,

	// elections
	election_created,
	election_started,
	election_ended,

	// node_registry
	node_registered,
	heartbeat,
	heartbeat_rejected,
	node_unreachable,
	node_inactive,
	selected,
	insufficient,

	// vote_store
	vote_created,
	duplicate_vote,

	// round_manager
	round_opened,
	round_closed,
	round_timeout,
	insufficient_nodes,
	round_exhausted,
	confirmed,
	rejected,
	timed_out,
	unknown_round_entry,
	election_ended_confirmation,

	// evaluator
	evaluate,
	still_pending,
	finalized,
	round_failed,
	vote_failed,
	vote_expired,

	// evaluation_queue
	task_scheduled,
	task_completed,
	task_retry,
	task_exception,
	dead_letter,

	// notifications
	notify,
	delivered,
	delivery_failed,
	cache_invalidate,

	// coordinator
	vote_cast,
	vote_rejected,
	reopen_round,
	sweep,

	// confirmation_simulator
	solicit,
	simulated_confirm,
	simulated_reject,

	// audit_log
	append,
	verify_failed,

	_last // Must be the last enum
};

/** Direction of the stat. If the direction is irrelevant, use in */
enum class dir
{
	in,
	out,

	_last // Must be the last enum
};

enum class sample
{
	_invalid = 0, // Default value, should not be used

	heartbeat_response_time,
	vote_finalize_duration,

	_last // Must be the last enum
};
}

namespace ballot
{
std::string_view to_string (stat::type);
std::string_view to_string (stat::detail);
std::string_view to_string (stat::dir);
std::string_view to_string (stat::sample);
}

// Ensure that the enum_range is large enough to hold all values (including future ones)
template <>
struct magic_enum::customize::enum_range<ballot::stat::type>
{
	static constexpr int min = 0;
	static constexpr int max = 128;
};

template <>
struct magic_enum::customize::enum_range<ballot::stat::detail>
{
	static constexpr int min = 0;
	static constexpr int max = 256;
};
