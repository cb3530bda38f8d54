#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/lib/tomlconfig.hpp>
#include <ballot/node/evaluation_queue.hpp>

#include <algorithm>
#include <cmath>

ballot::evaluation_queue::evaluation_queue (ballot::evaluation_queue_config const & config_a, ballot::stats & stats_a, ballot::logger & logger_a) :
	config{ config_a },
	stats{ stats_a },
	logger{ logger_a },
	workers{ std::max (config_a.threads, 1u), ballot::thread_role::name::evaluation },
	dead{ std::max<size_t> (config_a.dead_letter_capacity, 1) }
{
}

ballot::evaluation_queue::~evaluation_queue ()
{
	debug_assert (!workers.alive ());
}

void ballot::evaluation_queue::start ()
{
	workers.start ();
}

void ballot::evaluation_queue::stop ()
{
	workers.stop ();
}

void ballot::evaluation_queue::push (std::string name, ballot::vote_id vote, uint32_t round, task_t task)
{
	auto entry = std::make_shared<task_entry> (task_entry{ std::move (name), vote, round, std::move (task) });
	stats.inc (ballot::stat::type::evaluation_queue, ballot::stat::detail::task_scheduled);
	workers.push_task ([this, entry] () {
		execute (entry);
	});
}

void ballot::evaluation_queue::execute (std::shared_ptr<task_entry> const & entry)
{
	try
	{
		entry->task ();
		stats.inc (ballot::stat::type::evaluation_queue, ballot::stat::detail::task_completed);
	}
	catch (std::exception const & ex)
	{
		stats.inc (ballot::stat::type::evaluation_queue, ballot::stat::detail::task_exception);
		retry_or_dead_letter (entry, ex.what ());
	}
}

void ballot::evaluation_queue::retry_or_dead_letter (std::shared_ptr<task_entry> const & entry, std::string const & error)
{
	if (entry->attempt < config.max_attempts)
	{
		std::chrono::milliseconds delay;
		{
			ballot::lock_guard<ballot::mutex> lock{ mutex };
			delay = config.backoff (entry->attempt, random);
		}
		logger.debug (ballot::log::type::evaluation_queue, "Task {} for vote {} round {} failed (attempt {}/{}), retrying in {}ms: {}",
		entry->name, entry->vote, entry->round, entry->attempt, config.max_attempts, delay.count (), error);
		logger.trace (ballot::log::type::evaluation_queue, ballot::log::detail::task_retry, "Retry of {} for vote {}", entry->name, entry->vote);

		++entry->attempt;
		stats.inc (ballot::stat::type::evaluation_queue, ballot::stat::detail::task_retry);
		workers.add_timed_task (std::chrono::steady_clock::now () + delay, [this, entry] () {
			execute (entry);
		});
		return;
	}

	ballot::dead_letter letter{ entry->name, entry->vote, entry->round, entry->attempt, error, std::chrono::system_clock::now () };
	{
		ballot::lock_guard<ballot::mutex> lock{ mutex };
		dead.push_back (letter);
	}
	stats.inc (ballot::stat::type::evaluation_queue, ballot::stat::detail::dead_letter);
	logger.error (ballot::log::type::evaluation_queue, "Task {} for vote {} round {} given up after {} attempts: {}", entry->name, entry->vote, entry->round, entry->attempt, error);
	dead_lettered.notify (letter);
}

std::vector<ballot::dead_letter> ballot::evaluation_queue::dead_letters () const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	return { dead.begin (), dead.end () };
}

/*
 * evaluation_queue_config
 */

std::chrono::milliseconds ballot::evaluation_queue_config::backoff (size_t attempt, ballot::random_generator & random) const
{
	auto exponent = static_cast<double> (attempt > 0 ? attempt - 1 : 0);
	auto base = std::min (static_cast<double> (initial_delay.count ()) * std::pow (backoff_multiplier, exponent), static_cast<double> (max_delay.count ()));
	auto result = static_cast<int64_t> (base);
	auto spread = static_cast<int64_t> (base * jitter);
	if (spread > 0)
	{
		result += random.random (-spread, spread + 1);
	}
	return std::chrono::milliseconds{ std::clamp<int64_t> (result, 0, max_delay.count ()) };
}

ballot::error ballot::evaluation_queue_config::serialize (ballot::tomlconfig & toml) const
{
	toml.put ("threads", threads, "Number of threads running round opening and evaluation tasks.\ntype:uint64");
	toml.put ("initial_delay", initial_delay.count (), "Delay before the first retry of a failed task.\ntype:milliseconds");
	toml.put ("max_delay", max_delay.count (), "Upper bound for the delay between retries.\ntype:milliseconds");
	toml.put ("backoff_multiplier", backoff_multiplier, "Factor the retry delay grows by after each failed attempt.\ntype:double");
	toml.put ("jitter", jitter, "Random relative spread applied to retry delays, between 0 and 1.\ntype:double");
	toml.put ("max_attempts", max_attempts, "Attempts after which a task is given up and moved to the dead letter log.\ntype:uint64");
	toml.put ("dead_letter_capacity", dead_letter_capacity, "Number of given up tasks kept for inspection.\ntype:uint64");

	return toml.get_error ();
}

ballot::error ballot::evaluation_queue_config::deserialize (ballot::tomlconfig & toml)
{
	toml.get ("threads", threads);
	toml.get_duration ("initial_delay", initial_delay);
	toml.get_duration ("max_delay", max_delay);
	toml.get ("backoff_multiplier", backoff_multiplier);
	toml.get ("jitter", jitter);
	toml.get ("max_attempts", max_attempts);
	toml.get ("dead_letter_capacity", dead_letter_capacity);

	if (threads == 0)
	{
		toml.get_error ().set ("threads must be greater than 0");
	}
	if (max_delay < initial_delay)
	{
		toml.get_error ().set ("max_delay must not be lower than initial_delay");
	}
	if (backoff_multiplier < 1.0)
	{
		toml.get_error ().set ("backoff_multiplier must be at least 1");
	}
	if (jitter < 0.0 || jitter > 1.0)
	{
		toml.get_error ().set ("jitter must be in the range [0, 1]");
	}
	if (max_attempts == 0)
	{
		toml.get_error ().set ("max_attempts must be greater than 0");
	}

	return toml.get_error ();
}
