#pragma once

#include <ballot/lib/locks.hpp>
#include <ballot/lib/numbers.hpp>
#include <ballot/node/fwd.hpp>
#include <ballot/secure/common.hpp>

#include <boost/property_tree/ptree_fwd.hpp>

#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace ballot
{
class audit_log;
namespace test
{
	void rewrite_audit_entry (ballot::audit_log &, uint64_t sequence, std::string details);
}

enum class audit_action
{
	election_created,
	election_started,
	election_ended,
	vote_cast,
	vote_finalized,
	vote_failed,
	vote_expired,
};

std::string_view to_string (ballot::audit_action);

class audit_entry final
{
public:
	uint64_t sequence{ 0 };
	ballot::audit_action action;
	/** Id of the election or vote the action applies to */
	std::string subject;
	std::string details;
	ballot::timestamp_t timestamp{};
	ballot::hash256 previous;
	ballot::hash256 hash;

	/** Digest of the entry content chained to the previous hash */
	ballot::hash256 digest () const;
	boost::property_tree::ptree to_ptree () const;
};

/** Append only log where every entry commits to its predecessor, tampering with any entry breaks the chain */
class audit_log final
{
public:
	audit_log (ballot::stats &, ballot::logger &);

	ballot::audit_entry append (ballot::audit_action, std::string subject, std::string details = "");

	/**
	 * Recomputes the chain
	 * @returns the sequence number of the first broken entry, or nullopt when the chain is intact
	 */
	std::optional<uint64_t> verify () const;

	std::vector<ballot::audit_entry> entries () const;
	size_t size () const;

private: // Dependencies
	ballot::stats & stats;
	ballot::logger & logger;

private:
	std::deque<ballot::audit_entry> chain;
	mutable ballot::mutex mutex{ "audit_log" };

	friend void ballot::test::rewrite_audit_entry (ballot::audit_log &, uint64_t, std::string);
};
}
