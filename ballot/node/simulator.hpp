#pragma once

#include <ballot/lib/errors.hpp>
#include <ballot/lib/locks.hpp>
#include <ballot/lib/random.hpp>
#include <ballot/node/confirmation_solicitor.hpp>
#include <ballot/node/fwd.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <set>
#include <system_error>
#include <thread>

namespace ballot
{
class simulator_config final
{
public:
	ballot::error serialize (ballot::tomlconfig &) const;
	ballot::error deserialize (ballot::tomlconfig &);

public:
	bool enable{ false };
	/** Delay between a round opening and its nodes answering */
	std::chrono::milliseconds confirmation_delay{ 2000 };
	/** Share of answers that reject instead of confirm, between 0 and 1 */
	double rejection_ratio{ 0.0 };
	std::chrono::milliseconds heartbeat_interval{ 1000 };
	uint32_t response_time_min{ 5 };
	uint32_t response_time_max{ 50 };
};

/**
 * Stands in for remote election nodes: answers every solicitation after a fixed delay and keeps tracked nodes alive with heartbeats.
 * There is no node to node protocol behind it, real deployments replace it with a network solicitor.
 */
class confirmation_simulator final : public confirmation_solicitor
{
public:
	using respond_t = std::function<std::error_code (ballot::vote_id, ballot::node_id const &, ballot::confirmation)>;
	using heartbeat_t = std::function<std::error_code (ballot::node_id const &, double response_time_ms)>;

	confirmation_simulator (ballot::simulator_config const &, ballot::stats &, ballot::logger &);
	~confirmation_simulator ();

	void start ();
	void stop ();

	void solicit (ballot::vote const &, ballot::consensus_round const &) override;

	/** Sends periodic heartbeats for \p node until it is refused */
	void track (ballot::node_id const & node);
	size_t tracked () const;
	size_t pending () const;

public:
	respond_t respond;
	heartbeat_t heartbeat;

private: // Dependencies
	ballot::simulator_config const & config;
	ballot::stats & stats;
	ballot::logger & logger;

private:
	void run ();
	void answer (ballot::unique_lock<ballot::mutex> &);
	void send_heartbeats (ballot::unique_lock<ballot::mutex> &);
	ballot::confirmation pick_outcome ();

	class solicitation final
	{
	public:
		ballot::vote_id vote;
		ballot::node_id node;
	};

	std::multimap<std::chrono::steady_clock::time_point, solicitation> solicitations;
	std::set<ballot::node_id> nodes;
	std::chrono::steady_clock::time_point next_heartbeat{};
	ballot::random_generator random;

	bool stopped{ false };
	ballot::condition_variable condition;
	mutable ballot::mutex mutex{ "confirmation_simulator" };
	std::thread thread;
};
}
