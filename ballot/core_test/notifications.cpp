#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/node/notifications.hpp>
#include <ballot/test_common/system.hpp>
#include <ballot/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace std::chrono_literals;

namespace
{
/** Fails delivery to one topic */
class failing_sink final : public ballot::notification_sink
{
public:
	explicit failing_sink (std::string topic_a) :
		topic{ std::move (topic_a) }
	{
	}

	void notify (std::string const & topic_a, ballot::notification const & notification) override
	{
		if (topic_a == topic)
		{
			throw std::runtime_error ("connection closed");
		}
		inner.notify (topic_a, notification);
	}

	std::string topic;
	ballot::test::recording_sink inner;
};
}

TEST (notifications, topics)
{
	ASSERT_EQ ("vote_12", ballot::topics::vote (12));
	ASSERT_EQ ("election_3", ballot::topics::election (3));
	ASSERT_EQ ("admin_dashboard", ballot::topics::admin);
}

TEST (notifications, topics_for)
{
	ballot::notifications_config config;
	ballot::test::recording_sink sink;
	ballot::stats stats;
	ballot::logger logger;
	ballot::notifier notifier{ config, sink, stats, logger };
	ballot::notification vote_notification{ ballot::notification_type::finalized, 3, 12 };
	ASSERT_EQ ((std::vector<std::string>{ "vote_12", "election_3", "admin_dashboard" }), notifier.topics_for (vote_notification));
	// Election wide events have no vote topic
	ballot::notification election_notification{ ballot::notification_type::election_ended, 3 };
	ASSERT_EQ ((std::vector<std::string>{ "election_3", "admin_dashboard" }), notifier.topics_for (election_notification));
	config.admin_broadcast = false;
	ASSERT_EQ ((std::vector<std::string>{ "vote_12", "election_3" }), notifier.topics_for (vote_notification));
}

TEST (notifications, publish)
{
	ballot::test::system system;
	ballot::notifications_config config;
	ballot::test::recording_sink sink;
	ballot::stats stats;
	ballot::logger logger;
	ballot::notifier notifier{ config, sink, stats, logger };
	ballot::test::start_stop_guard guard{ notifier };
	notifier.publish ({ ballot::notification_type::finalized, 3, 12, 1 });
	ASSERT_TIMELY_EQ (5s, sink.size (), 3);
	ASSERT_EQ (1, sink.count ("vote_12", ballot::notification_type::finalized));
	ASSERT_EQ (1, sink.count ("election_3", ballot::notification_type::finalized));
	ASSERT_EQ (1, sink.count ("admin_dashboard", ballot::notification_type::finalized));
	ASSERT_EQ (3, stats.count (ballot::stat::type::notifications, ballot::stat::detail::delivered, ballot::stat::dir::out));
}

// A failing topic does not prevent delivery to the others
TEST (notifications, delivery_failure)
{
	ballot::test::system system;
	ballot::notifications_config config;
	failing_sink sink{ "election_3" };
	ballot::stats stats;
	ballot::logger logger;
	ballot::notifier notifier{ config, sink, stats, logger };
	ballot::test::start_stop_guard guard{ notifier };
	notifier.publish ({ ballot::notification_type::round_failed, 3, 12, 1 });
	ASSERT_TIMELY_EQ (5s, sink.inner.size (), 2);
	ASSERT_EQ (1, sink.inner.count ("vote_12", ballot::notification_type::round_failed));
	ASSERT_EQ (1, sink.inner.count ("admin_dashboard", ballot::notification_type::round_failed));
	ASSERT_TIMELY_EQ (5s, stats.count (ballot::stat::type::notifications, ballot::stat::detail::delivery_failed, ballot::stat::dir::out), 1);
}

TEST (notifications, observer_sink)
{
	ballot::observer_sink sink;
	std::vector<std::string> topics;
	sink.delivered.add ([&topics] (std::string const & topic, ballot::notification const & notification) {
		ASSERT_EQ (ballot::notification_type::vote_expired, notification.type);
		topics.push_back (topic);
	});
	sink.notify ("vote_1", { ballot::notification_type::vote_expired, 1, 1 });
	ASSERT_EQ (std::vector<std::string>{ "vote_1" }, topics);
}

TEST (notifications, json)
{
	ballot::notification notification{ ballot::notification_type::vote_failed, 3, 12, 2, "max rounds reached" };
	auto tree = notification.to_ptree ();
	ASSERT_EQ ("vote_failed", tree.get<std::string> ("type"));
	ASSERT_EQ (3, tree.get<uint64_t> ("election"));
	ASSERT_EQ (12, tree.get<uint64_t> ("vote"));
	ASSERT_EQ (2, tree.get<uint32_t> ("round"));
	ASSERT_EQ ("max rounds reached", tree.get<std::string> ("message"));
	auto json = notification.to_json ();
	ASSERT_NE (std::string::npos, json.find ("\"type\":\"vote_failed\""));
	ASSERT_NE ('\n', json.back ());
}
