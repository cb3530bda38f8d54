#pragma once

#include <ballot/lib/errors.hpp>
#include <ballot/lib/locks.hpp>
#include <ballot/lib/observer_set.hpp>
#include <ballot/lib/random.hpp>
#include <ballot/lib/thread_pool.hpp>
#include <ballot/node/fwd.hpp>
#include <ballot/secure/common.hpp>

#include <boost/circular_buffer.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ballot
{
class evaluation_queue_config final
{
public:
	ballot::error serialize (ballot::tomlconfig &) const;
	ballot::error deserialize (ballot::tomlconfig &);

	/** Backoff before attempt number \p attempt + 1, exponential with jitter and capped at max_delay */
	std::chrono::milliseconds backoff (size_t attempt, ballot::random_generator &) const;

public:
	unsigned threads{ 2 };
	std::chrono::milliseconds initial_delay{ 100 };
	std::chrono::milliseconds max_delay{ 5000 };
	double backoff_multiplier{ 2.0 };
	/** Relative random spread applied to each delay */
	double jitter{ 0.1 };
	size_t max_attempts{ 5 };
	size_t dead_letter_capacity{ 1024 };
};

/** Task given up after exhausting its attempts */
class dead_letter final
{
public:
	std::string name;
	ballot::vote_id vote{ 0 };
	uint32_t round{ 0 };
	size_t attempts{ 0 };
	std::string error;
	ballot::timestamp_t time{};
};

/**
 * Background executor for consensus work (round opening, evaluation).
 * Delivery is at least once: a task signals a transient failure by throwing and is retried with backoff,
 * after max_attempts it is moved to the dead letter buffer and reported through `dead_lettered`.
 */
class evaluation_queue final
{
public:
	using task_t = std::function<void ()>;

	evaluation_queue (ballot::evaluation_queue_config const &, ballot::stats &, ballot::logger &);
	~evaluation_queue ();

	void start ();
	void stop ();

	/** Schedules \p task, \p vote and \p round identify it in logs and dead letters */
	void push (std::string name, ballot::vote_id vote, uint32_t round, task_t task);

	std::vector<ballot::dead_letter> dead_letters () const;

public: // Events
	ballot::observer_set<ballot::dead_letter const &> dead_lettered;

private: // Dependencies
	ballot::evaluation_queue_config const & config;
	ballot::stats & stats;
	ballot::logger & logger;

private:
	class task_entry final
	{
	public:
		std::string name;
		ballot::vote_id vote;
		uint32_t round;
		task_t task;
		size_t attempt{ 1 };
	};

	void execute (std::shared_ptr<task_entry> const &);
	void retry_or_dead_letter (std::shared_ptr<task_entry> const &, std::string const & error);

	ballot::thread_pool workers;
	boost::circular_buffer<ballot::dead_letter> dead;
	ballot::random_generator random;
	mutable ballot::mutex mutex{ "evaluation_queue" };
};
}
