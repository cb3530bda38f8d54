#include <ballot/lib/enum_util.hpp>
#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/lib/tomlconfig.hpp>
#include <ballot/node/notifications.hpp>

#include <boost/property_tree/json_parser.hpp>

#include <sstream>

std::string_view ballot::to_string (ballot::notification_type type)
{
	return ballot::enum_util::name (type);
}

boost::property_tree::ptree ballot::notification::to_ptree () const
{
	boost::property_tree::ptree result;
	result.put ("type", ballot::to_string (type));
	result.put ("election", election);
	if (vote)
	{
		result.put ("vote", *vote);
	}
	if (round > 0)
	{
		result.put ("round", round);
	}
	if (!message.empty ())
	{
		result.put ("message", message);
	}
	result.put ("time", std::chrono::duration_cast<std::chrono::milliseconds> (timestamp.time_since_epoch ()).count ());
	return result;
}

std::string ballot::notification::to_json () const
{
	std::ostringstream stream;
	boost::property_tree::write_json (stream, to_ptree (), false);
	auto result = stream.str ();
	// write_json terminates with a newline
	if (!result.empty () && result.back () == '\n')
	{
		result.pop_back ();
	}
	return result;
}

std::string ballot::topics::vote (ballot::vote_id vote)
{
	return "vote_" + std::to_string (vote);
}

std::string ballot::topics::election (ballot::election_id election)
{
	return "election_" + std::to_string (election);
}

/*
 * log_sink
 */

ballot::log_sink::log_sink (ballot::logger & logger_a) :
	logger{ logger_a }
{
}

void ballot::log_sink::notify (std::string const & topic, ballot::notification const & notification)
{
	logger.info (ballot::log::type::notifications, "[{}] {}", topic, notification.to_json ());
}

/*
 * observer_sink
 */

void ballot::observer_sink::notify (std::string const & topic, ballot::notification const & notification)
{
	delivered.notify (topic, notification);
}

/*
 * notifier
 */

ballot::notifier::notifier (ballot::notifications_config const & config_a, ballot::notification_sink & sink_a, ballot::stats & stats_a, ballot::logger & logger_a) :
	config{ config_a },
	sink{ sink_a },
	stats{ stats_a },
	logger{ logger_a },
	workers{ std::max (config_a.threads, 1u), ballot::thread_role::name::notifications }
{
}

ballot::notifier::~notifier ()
{
	debug_assert (!workers.alive ());
}

void ballot::notifier::start ()
{
	workers.start ();
}

void ballot::notifier::stop ()
{
	workers.stop ();
}

void ballot::notifier::publish (ballot::notification const & notification)
{
	stats.inc (ballot::stat::type::notifications, ballot::stat::detail::notify);
	workers.push_task ([this, notification] () {
		deliver (notification);
	});
}

std::vector<std::string> ballot::notifier::topics_for (ballot::notification const & notification) const
{
	std::vector<std::string> result;
	if (notification.vote)
	{
		result.push_back (ballot::topics::vote (*notification.vote));
	}
	result.push_back (ballot::topics::election (notification.election));
	if (config.admin_broadcast)
	{
		result.push_back (ballot::topics::admin);
	}
	return result;
}

void ballot::notifier::deliver (ballot::notification const & notification)
{
	for (auto const & topic : topics_for (notification))
	{
		try
		{
			sink.notify (topic, notification);
			stats.inc (ballot::stat::type::notifications, ballot::stat::detail::delivered, ballot::stat::dir::out);
			logger.trace (ballot::log::type::notifications, ballot::log::detail::notification_sent, "Delivered {} to {}", ballot::to_string (notification.type), topic);
		}
		catch (std::exception const & ex)
		{
			stats.inc (ballot::stat::type::notifications, ballot::stat::detail::delivery_failed, ballot::stat::dir::out);
			logger.error (ballot::log::type::notifications, "Delivery of {} to {} failed: {}", ballot::to_string (notification.type), topic, ex.what ());
		}
	}
}

/*
 * notifications_config
 */

ballot::error ballot::notifications_config::serialize (ballot::tomlconfig & toml) const
{
	toml.put ("threads", threads, "Number of threads delivering notifications to the sink.\ntype:uint64");
	toml.put ("admin_broadcast", admin_broadcast, "Publish every notification on the admin_dashboard topic as well.\ntype:bool");
	return toml.get_error ();
}

ballot::error ballot::notifications_config::deserialize (ballot::tomlconfig & toml)
{
	toml.get ("threads", threads);
	toml.get ("admin_broadcast", admin_broadcast);

	if (threads == 0)
	{
		toml.get_error ().set ("threads must be greater than 0");
	}
	return toml.get_error ();
}
