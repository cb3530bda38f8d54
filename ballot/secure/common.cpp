#include <ballot/lib/enum_util.hpp>
#include <ballot/lib/random.hpp>
#include <ballot/secure/common.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <limits>

std::string_view ballot::to_string (ballot::node_status status)
{
	return ballot::enum_util::name (status);
}

std::string_view ballot::to_string (ballot::vote_status status)
{
	return ballot::enum_util::name (status);
}

std::string_view ballot::to_string (ballot::entry_status status)
{
	return ballot::enum_util::name (status);
}

std::string_view ballot::to_string (ballot::consensus_outcome outcome)
{
	return ballot::enum_util::name (outcome);
}

std::string_view ballot::to_string (ballot::election_status status)
{
	return ballot::enum_util::name (status);
}

std::string_view ballot::to_string (ballot::confirmation confirmation)
{
	return ballot::enum_util::name (confirmation);
}

ballot::stat::detail ballot::to_stat_detail (ballot::consensus_outcome outcome)
{
	switch (outcome)
	{
		case ballot::consensus_outcome::still_pending:
			return ballot::stat::detail::still_pending;
		case ballot::consensus_outcome::finalized:
			return ballot::stat::detail::finalized;
		case ballot::consensus_outcome::failed:
			return ballot::stat::detail::failed;
	}
	debug_assert (false);
	return {};
}

ballot::entry_status ballot::to_entry_status (ballot::confirmation confirmation)
{
	switch (confirmation)
	{
		case ballot::confirmation::confirmed:
			return ballot::entry_status::confirmed;
		case ballot::confirmation::rejected:
			return ballot::entry_status::rejected;
	}
	debug_assert (false);
	return {};
}

bool ballot::is_terminal (ballot::vote_status status)
{
	return status != ballot::vote_status::pending;
}

bool ballot::valid_change (ballot::vote_status from, ballot::vote_status to)
{
	return !ballot::is_terminal (from) && ballot::is_terminal (to);
}

/*
 * consensus_round
 */

size_t ballot::consensus_round::count (ballot::entry_status status) const
{
	return std::count_if (entries.begin (), entries.end (), [status] (auto const & entry) { return entry.status == status; });
}

bool ballot::consensus_round::settled () const
{
	return count (ballot::entry_status::pending) == 0;
}

ballot::consensus_log_entry * ballot::consensus_round::find (ballot::node_id const & node)
{
	auto existing = std::find_if (entries.begin (), entries.end (), [&node] (auto const & entry) { return entry.node == node; });
	return existing != entries.end () ? &*existing : nullptr;
}

ballot::consensus_log_entry const * ballot::consensus_round::find (ballot::node_id const & node) const
{
	auto existing = std::find_if (entries.begin (), entries.end (), [&node] (auto const & entry) { return entry.node == node; });
	return existing != entries.end () ? &*existing : nullptr;
}

size_t ballot::consensus_round::time_out_pending (ballot::timestamp_t now)
{
	size_t result = 0;
	for (auto & entry : entries)
	{
		if (entry.status == ballot::entry_status::pending)
		{
			entry.status = ballot::entry_status::timed_out;
			entry.timestamp = now;
			++result;
		}
	}
	return result;
}

/*
 * vote
 */

ballot::consensus_round * ballot::vote::current_round ()
{
	return rounds.empty () ? nullptr : &rounds.back ();
}

ballot::consensus_round const * ballot::vote::current_round () const
{
	return rounds.empty () ? nullptr : &rounds.back ();
}

uint32_t ballot::vote::round_number () const
{
	return rounds.empty () ? 0 : rounds.back ().number;
}

ballot::hash256 ballot::compute_fingerprint (std::string const & voter, std::string const & candidate, ballot::election_id election, uint64_t nonce)
{
	auto election_l = std::to_string (election);
	auto nonce_l = std::to_string (nonce);
	return ballot::blake2b_digest ({ voter, candidate, election_l, nonce_l });
}

std::string ballot::signature_token (ballot::hash256 const & fingerprint, ballot::node_id const & node)
{
	return fmt::format ("sig_{}_{}", fingerprint.to_string (), node);
}

ballot::node_id ballot::generate_node_id (ballot::random_generator & random)
{
	auto word = [&random] () { return random.random (uint64_t{ 0 }, std::numeric_limits<uint64_t>::max ()); };
	auto high = word ();
	auto low = word ();
	// Version 4, variant 1
	high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
	low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
	return fmt::format ("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", high >> 32, (high >> 16) & 0xFFFF, high & 0xFFFF, low >> 48, low & 0xFFFFFFFFFFFFULL);
}
