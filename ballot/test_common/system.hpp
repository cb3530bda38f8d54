#pragma once

#include <ballot/lib/errors.hpp>
#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/node/cache.hpp>
#include <ballot/node/coordinator.hpp>
#include <ballot/node/notifications.hpp>

#include <chrono>
#include <memory>
#include <vector>

namespace ballot
{
/** Test-system related error codes */
enum class error_system
{
	generic = 1,
	deadline_expired
};

namespace test
{
	/** Keeps every delivered notification together with its topic */
	class recording_sink final : public ballot::notification_sink
	{
	public:
		void notify (std::string const & topic, ballot::notification const &) override;

		std::vector<std::pair<std::string, ballot::notification>> received () const;
		/** Notifications of \p type delivered to \p topic */
		size_t count (std::string const & topic, ballot::notification_type type) const;
		size_t size () const;

	private:
		std::vector<std::pair<std::string, ballot::notification>> notifications;
		mutable ballot::mutex mutex{ "recording_sink" };
	};

	/** Status cache recording every invalidated key */
	class recording_cache final : public ballot::cache_invalidator
	{
	public:
		void invalidate (std::string const & key) override;

		size_t count (std::string const & key) const;

	private:
		std::vector<std::string> keys;
		mutable ballot::mutex mutex{ "recording_cache" };
	};

	class system final
	{
	public:
		system ();
		~system ();

		/** Adds and starts a coordinator, the system owns and stops it */
		ballot::coordinator & add_coordinator ();
		ballot::coordinator & add_coordinator (ballot::node_config const &);
		/*
		 * Convenience function to get a reference to a coordinator at given index. Does bound checking.
		 */
		ballot::coordinator & coordinator (std::size_t index = 0) const;

		/**
		 * Sleeps for \p sleep_time, then checks the deadline
		 * @returns 0 or ballot::deadline_expired
		 */
		std::error_code poll (std::chrono::nanoseconds const & sleep_time = std::chrono::milliseconds (10));
		void stop ();
		void deadline_set (std::chrono::duration<double, std::nano> const & delta);

		/*
		 * Returns default config for a coordinator running in test environment: no simulator, quick retries, nodes never time out
		 */
		ballot::node_config default_config () const;

	public:
		ballot::test::recording_sink sink;
		ballot::test::recording_cache cache;
		ballot::logger logger{ "tests" };
		std::chrono::time_point<std::chrono::steady_clock, std::chrono::duration<double>> deadline{ std::chrono::steady_clock::time_point::max () };
		double deadline_scaling_factor{ 1.0 };
		std::vector<std::unique_ptr<ballot::coordinator>> coordinators;
	};

	/** Nodes of the current round of \p vote, empty if no round was opened yet */
	std::vector<ballot::node_id> round_nodes (ballot::coordinator &, ballot::vote_id);
	/** Current round number of \p vote, 0 if none */
	uint32_t round_number (ballot::coordinator &, ballot::vote_id);
	ballot::vote_status status (ballot::coordinator &, ballot::vote_id);
	/** Replaces the details of an audit entry without rehashing it */
	void rewrite_audit_entry (ballot::audit_log &, uint64_t sequence, std::string details);
}
}
REGISTER_ERROR_CODES (ballot, error_system);
