#include <ballot/lib/stats.hpp>
#include <ballot/lib/tomlconfig.hpp>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <sstream>

ballot::stats::stats (ballot::stats_config config) :
	config{ std::move (config) }
{
}

void ballot::stats::clear ()
{
	std::lock_guard guard{ mutex };
	counters.clear ();
	samplers.clear ();
	timestamp = std::chrono::steady_clock::now ();
}

void ballot::stats::add (stat::type type, stat::detail detail, stat::dir dir, counter_value_t value)
{
	if (value == 0)
	{
		return;
	}

	// Updates need to happen while holding the mutex
	auto update_counter = [this] (ballot::stats::counter_key key, auto && updater) {
		counter_key all_key{ key.type, stat::detail::all, key.dir };

		// Two steps to avoid exclusively locking the mutex in the common case
		{
			std::shared_lock lock{ mutex };

			if (auto it = counters.find (key); it != counters.end ())
			{
				updater (*it->second);

				if (key != all_key)
				{
					auto it_all = counters.find (all_key);
					release_assert (it_all != counters.end ()); // The `all` counter is always created together
					updater (*it_all->second);
				}

				return;
			}
		}
		{
			std::unique_lock lock{ mutex };

			// Insertions will be ignored if the key already exists
			auto [it, inserted] = counters.emplace (key, std::make_unique<counter_entry> ());
			auto [it_all, inserted_all] = counters.emplace (all_key, std::make_unique<counter_entry> ());

			updater (*it->second);

			if (key != all_key)
			{
				updater (*it_all->second);
			}
		}
	};

	update_counter (counter_key{ type, detail, dir }, [value] (counter_entry & counter) {
		counter.value += value;
	});
}

auto ballot::stats::count (stat::type type, stat::detail detail, stat::dir dir) const -> counter_value_t
{
	std::shared_lock lock{ mutex };
	if (auto it = counters.find (counter_key{ type, detail, dir }); it != counters.end ())
	{
		return it->second->value;
	}
	return 0;
}

auto ballot::stats::count (stat::type type, stat::dir dir) const -> counter_value_t
{
	return count (type, stat::detail::all, dir);
}

void ballot::stats::sample (stat::sample sample, ballot::stats::sampler_value_t value)
{
	{
		std::shared_lock lock{ mutex };

		if (auto it = samplers.find (sample); it != samplers.end ())
		{
			it->second->add (value);
			return;
		}
	}
	{
		std::unique_lock lock{ mutex };

		auto [it, inserted] = samplers.emplace (sample, std::make_unique<sampler_entry> (config.max_samples));
		it->second->add (value);
	}
}

auto ballot::stats::samples (stat::sample sample) -> std::vector<sampler_value_t>
{
	std::shared_lock lock{ mutex };
	if (auto it = samplers.find (sample); it != samplers.end ())
	{
		return it->second->collect ();
	}
	return {};
}

std::chrono::seconds ballot::stats::last_reset ()
{
	std::shared_lock lock{ mutex };
	auto now (std::chrono::steady_clock::now ());
	return std::chrono::duration_cast<std::chrono::seconds> (now - timestamp);
}

boost::property_tree::ptree ballot::stats::to_ptree () const
{
	boost::property_tree::ptree tree;
	std::shared_lock lock{ mutex };
	for (auto const & [key, entry] : counters)
	{
		std::string path{ to_string (key.type) };
		path += '.';
		path += to_string (key.detail);
		path += '.';
		path += to_string (key.dir);
		tree.put (path, entry->value.load ());
	}
	return tree;
}

std::string ballot::stats::dump () const
{
	std::stringstream ostream;
	boost::property_tree::write_json (ostream, to_ptree ());
	return ostream.str ();
}

/*
 * stats::sampler_entry
 */

void ballot::stats::sampler_entry::add (ballot::stats::sampler_value_t value)
{
	ballot::lock_guard<ballot::mutex> guard{ mutex };
	samples.push_back (value);
}

auto ballot::stats::sampler_entry::collect () -> std::vector<sampler_value_t>
{
	ballot::lock_guard<ballot::mutex> guard{ mutex };
	std::vector<sampler_value_t> result{ samples.begin (), samples.end () };
	samples.clear ();
	return result;
}

/*
 * stats_config
 */

ballot::error ballot::stats_config::serialize_toml (ballot::tomlconfig & toml) const
{
	toml.put ("max_samples", max_samples, "Maximum number of samples to keep in the ring buffer.\ntype:uint64");
	return toml.get_error ();
}

ballot::error ballot::stats_config::deserialize_toml (ballot::tomlconfig & toml)
{
	toml.get ("max_samples", max_samples);
	return toml.get_error ();
}
