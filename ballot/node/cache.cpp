#include <ballot/lib/stats.hpp>
#include <ballot/node/cache.hpp>

std::string ballot::cache_keys::vote_status (ballot::vote_id vote)
{
	return "vote_status_" + std::to_string (vote);
}

std::string ballot::cache_keys::election_stats_of (ballot::election_id election)
{
	return election_stats + "_" + std::to_string (election);
}

std::string ballot::cache_keys::voter_elections (std::string const & voter)
{
	return "voter_elections_" + voter;
}

ballot::status_cache::status_cache (ballot::stats & stats_a) :
	stats{ stats_a }
{
}

void ballot::status_cache::invalidate (std::string const & key)
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	if (entries.erase (key) > 0)
	{
		stats.inc (ballot::stat::type::notifications, ballot::stat::detail::cache_invalidate);
	}
}

std::optional<std::string> ballot::status_cache::get (std::string const & key) const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	if (auto existing = entries.find (key); existing != entries.end ())
	{
		return existing->second;
	}
	return std::nullopt;
}

void ballot::status_cache::put (std::string const & key, std::string value)
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	entries[key] = std::move (value);
}

size_t ballot::status_cache::size () const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	return entries.size ();
}
