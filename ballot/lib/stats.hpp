#pragma once

#include <ballot/lib/errors.hpp>
#include <ballot/lib/locks.hpp>
#include <ballot/lib/stats_enums.hpp>
#include <ballot/lib/utility.hpp>

#include <boost/circular_buffer.hpp>
#include <boost/property_tree/ptree_fwd.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace ballot
{
class tomlconfig;

class stats_config final
{
public:
	ballot::error deserialize_toml (ballot::tomlconfig & toml);
	ballot::error serialize_toml (ballot::tomlconfig & toml) const;

public:
	/** Maximum number samples to keep in the ring buffer */
	size_t max_samples{ 1024 * 16 };
};

/**
 * Collects counts and samples for registry, round and evaluation activity.
 * Stats can be queried on a type level (such as round_manager) as well as a more
 * specific detail level (such as round_opened)
 */
class stats final
{
public:
	using counter_value_t = uint64_t;
	using sampler_value_t = int64_t;

public:
	explicit stats (ballot::stats_config = {});

	/** Clear all stats */
	void clear ();

	/** Increments the given counter */
	void inc (stat::type type, stat::detail detail, stat::dir dir = stat::dir::in)
	{
		add (type, detail, dir, 1);
	}

	/** Adds \p value to the given counter */
	void add (stat::type type, stat::detail detail, counter_value_t value)
	{
		add (type, detail, stat::dir::in, value);
	}

	void add (stat::type type, stat::detail detail, stat::dir dir, counter_value_t value);

	/** Returns current value for the given counter at the detail level */
	counter_value_t count (stat::type type, stat::detail detail, stat::dir dir = stat::dir::in) const;

	/** Returns current value for the given counter at the type level (sum of all details) */
	counter_value_t count (stat::type type, stat::dir dir = stat::dir::in) const;

	void sample (stat::sample sample, sampler_value_t value);

	/** Returns the last N samples, where N is `max_samples`. Samples are reset after each lookup. */
	std::vector<sampler_value_t> samples (stat::sample sample);

	/** Returns the number of seconds since clear() was last called, or startup if it's never called. */
	std::chrono::seconds last_reset ();

	/** Counters as a `type.detail.dir -> value` tree */
	boost::property_tree::ptree to_ptree () const;

	/** Return JSON string with all counters (convenience function for debugging) */
	std::string dump () const;

private:
	struct counter_key
	{
		stat::type type;
		stat::detail detail;
		stat::dir dir;

		auto operator<=> (const counter_key &) const = default;
	};

private:
	class counter_entry
	{
	public:
		counter_entry () = default;
		counter_entry (counter_entry const &) = delete;
		counter_entry & operator= (counter_entry const &) = delete;

	public:
		std::atomic<counter_value_t> value{ 0 };
	};

	class sampler_entry
	{
	public:
		explicit sampler_entry (size_t max_samples) :
			samples{ max_samples } {};

		sampler_entry (sampler_entry const &) = delete;
		sampler_entry & operator= (sampler_entry const &) = delete;

	public:
		void add (sampler_value_t value);
		std::vector<sampler_value_t> collect ();

	private:
		boost::circular_buffer<sampler_value_t> samples;
		mutable ballot::mutex mutex;
	};

	// Wrap in unique_ptrs because mutex/atomic members are not movable
	std::map<counter_key, std::unique_ptr<counter_entry>> counters;
	std::map<stat::sample, std::unique_ptr<sampler_entry>> samplers;

private:
	ballot::stats_config const config;

	/** Time of last clear() call */
	std::chrono::steady_clock::time_point timestamp{ std::chrono::steady_clock::now () };

	mutable std::shared_mutex mutex;
};
}
