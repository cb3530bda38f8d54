#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/node/audit_log.hpp>
#include <ballot/test_common/system.hpp>
#include <ballot/test_common/testutil.hpp>

#include <gtest/gtest.h>

TEST (audit_log, empty)
{
	ballot::stats stats;
	ballot::logger logger;
	ballot::audit_log audit{ stats, logger };
	ASSERT_EQ (0, audit.size ());
	ASSERT_FALSE (audit.verify ());
}

TEST (audit_log, chain)
{
	ballot::stats stats;
	ballot::logger logger;
	ballot::audit_log audit{ stats, logger };
	auto first = audit.append (ballot::audit_action::election_created, "1", "board");
	auto second = audit.append (ballot::audit_action::vote_cast, "1");
	auto third = audit.append (ballot::audit_action::vote_finalized, "1");
	ASSERT_EQ (0, first.sequence);
	ASSERT_EQ (2, third.sequence);
	ASSERT_TRUE (first.previous.is_zero ());
	ASSERT_EQ (first.hash, second.previous);
	ASSERT_EQ (second.hash, third.previous);
	ASSERT_EQ (first.digest (), first.hash);
	ASSERT_EQ (3, audit.entries ().size ());
	ASSERT_FALSE (audit.verify ());
}

TEST (audit_log, tamper)
{
	ballot::stats stats;
	ballot::logger logger;
	ballot::audit_log audit{ stats, logger };
	for (auto i = 0; i < 5; ++i)
	{
		audit.append (ballot::audit_action::vote_cast, std::to_string (i));
	}
	ASSERT_FALSE (audit.verify ());
	ballot::test::rewrite_audit_entry (audit, 2, "rewritten");
	auto broken = audit.verify ();
	ASSERT_TRUE (broken);
	ASSERT_EQ (2, *broken);
	ASSERT_EQ (1, stats.count (ballot::stat::type::audit_log, ballot::stat::detail::verify_failed));
}

TEST (audit_log, to_ptree)
{
	ballot::stats stats;
	ballot::logger logger;
	ballot::audit_log audit{ stats, logger };
	auto entry = audit.append (ballot::audit_action::election_ended, "4", "expired votes: 0");
	auto tree = entry.to_ptree ();
	ASSERT_EQ ("election_ended", tree.get<std::string> ("action"));
	ASSERT_EQ ("4", tree.get<std::string> ("subject"));
	ASSERT_EQ (entry.hash.to_string (), tree.get<std::string> ("hash"));
}
