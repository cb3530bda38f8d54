#pragma once

#include <ballot/lib/locks.hpp>
#include <ballot/node/fwd.hpp>
#include <ballot/secure/common.hpp>

#include <optional>
#include <string>
#include <unordered_map>

namespace ballot
{
/** External cache of dashboard views, entries are dropped synchronously whenever consensus state changes */
class cache_invalidator
{
public:
	virtual ~cache_invalidator () = default;
	virtual void invalidate (std::string const & key) = 0;
};

namespace cache_keys
{
	std::string vote_status (ballot::vote_id);
	/** Aggregate over all elections */
	std::string const election_stats{ "election_stats" };
	std::string election_stats_of (ballot::election_id);
	std::string voter_elections (std::string const & voter);
}

/** In process key/value cache for rendered status views */
class status_cache final : public cache_invalidator
{
public:
	explicit status_cache (ballot::stats &);

	void invalidate (std::string const & key) override;

	std::optional<std::string> get (std::string const & key) const;
	void put (std::string const & key, std::string value);
	size_t size () const;

private:
	ballot::stats & stats;
	std::unordered_map<std::string, std::string> entries;
	mutable ballot::mutex mutex{ "status_cache" };
};
}
