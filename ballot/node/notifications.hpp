#pragma once

#include <ballot/lib/errors.hpp>
#include <ballot/lib/observer_set.hpp>
#include <ballot/lib/thread_pool.hpp>
#include <ballot/node/fwd.hpp>
#include <ballot/secure/common.hpp>

#include <boost/property_tree/ptree.hpp>

#include <optional>
#include <string>

namespace ballot
{
enum class notification_type
{
	finalized,
	round_failed,
	vote_failed,
	vote_expired,
	/** A background consensus task gave up after all retries */
	evaluation_error,
	election_started,
	election_ended,
};

std::string_view to_string (ballot::notification_type);

/** Event payload delivered to every topic interested in it */
class notification final
{
public:
	ballot::notification_type type;
	ballot::election_id election{ 0 };
	std::optional<ballot::vote_id> vote;
	uint32_t round{ 0 };
	std::string message;
	ballot::timestamp_t timestamp{ std::chrono::system_clock::now () };

	boost::property_tree::ptree to_ptree () const;
	std::string to_json () const;
};

namespace topics
{
	/** Channel of a single vote, "vote_<id>" */
	std::string vote (ballot::vote_id);
	/** Channel of an election, "election_<id>" */
	std::string election (ballot::election_id);
	/** Broadcast channel for administrators */
	std::string const admin{ "admin_dashboard" };
}

/**
 * Delivery transport for notifications, e.g. a websocket server.
 * Implementations may throw, delivery failures are logged by the caller and never affect vote processing.
 */
class notification_sink
{
public:
	virtual ~notification_sink () = default;
	virtual void notify (std::string const & topic, ballot::notification const &) = 0;
};

/** Writes notifications to the log */
class log_sink final : public notification_sink
{
public:
	explicit log_sink (ballot::logger &);
	void notify (std::string const & topic, ballot::notification const &) override;

private:
	ballot::logger & logger;
};

/** Forwards notifications to in-process observers */
class observer_sink final : public notification_sink
{
public:
	void notify (std::string const & topic, ballot::notification const &) override;

	ballot::observer_set<std::string const &, ballot::notification const &> delivered;
};

class notifications_config final
{
public:
	ballot::error serialize (ballot::tomlconfig &) const;
	ballot::error deserialize (ballot::tomlconfig &);

public:
	unsigned threads{ 1 };
	/** Also publish every notification on the admin channel */
	bool admin_broadcast{ true };
};

/**
 * Publishes notifications to their vote, election and admin topics on a dedicated thread pool.
 * Publishing never blocks on the sink.
 */
class notifier final
{
public:
	notifier (ballot::notifications_config const &, ballot::notification_sink &, ballot::stats &, ballot::logger &);
	~notifier ();

	void start ();
	void stop ();

	void publish (ballot::notification const &);

	/** Topics \p notification is delivered to */
	std::vector<std::string> topics_for (ballot::notification const &) const;

private: // Dependencies
	ballot::notifications_config const & config;
	ballot::notification_sink & sink;
	ballot::stats & stats;
	ballot::logger & logger;

private:
	void deliver (ballot::notification const &);

	ballot::thread_pool workers;
};
}
