#include <ballot/node/query.hpp>

#include <boost/property_tree/ptree.hpp>

namespace
{
int64_t milliseconds_since_epoch (ballot::timestamp_t time)
{
	return std::chrono::duration_cast<std::chrono::milliseconds> (time.time_since_epoch ()).count ();
}
}

ballot::vote_status_report ballot::vote_status_report::from (ballot::vote const & vote)
{
	ballot::vote_status_report result;
	result.vote = vote.id;
	result.election = vote.election;
	result.status = vote.status;
	result.confirmation_count = vote.confirmation_count;
	result.required_confirmations = vote.required_confirmations;
	result.round = vote.round_number ();
	result.fingerprint = vote.fingerprint;
	for (auto const & round : vote.rounds)
	{
		for (auto const & entry : round.entries)
		{
			result.log_entries.push_back ({ round.number, entry });
		}
	}
	return result;
}

boost::property_tree::ptree ballot::vote_status_report::to_ptree () const
{
	boost::property_tree::ptree result;
	result.put ("vote", vote);
	result.put ("election", election);
	result.put ("status", ballot::to_string (status));
	result.put ("confirmation_count", confirmation_count);
	result.put ("required_confirmations", required_confirmations);
	result.put ("round", round);
	result.put ("fingerprint", fingerprint.to_string ());

	boost::property_tree::ptree entries_l;
	for (auto const & item : log_entries)
	{
		boost::property_tree::ptree entry_l;
		entry_l.put ("round", item.round);
		entry_l.put ("node", item.entry.node);
		entry_l.put ("status", ballot::to_string (item.entry.status));
		entry_l.put ("signature", item.entry.signature);
		entry_l.put ("time", milliseconds_since_epoch (item.entry.timestamp));
		entries_l.push_back (std::make_pair ("", entry_l));
	}
	result.add_child ("log_entries", entries_l);
	return result;
}

ballot::node_summary ballot::node_summary::from (ballot::election_node const & node)
{
	return { node.id, node.address, node.status, node.last_heartbeat, node.response_time_ms, node.uptime_percentage };
}

boost::property_tree::ptree ballot::node_summary::to_ptree () const
{
	boost::property_tree::ptree result;
	result.put ("id", id);
	result.put ("address", address);
	result.put ("status", ballot::to_string (status));
	result.put ("last_heartbeat", milliseconds_since_epoch (last_heartbeat));
	result.put ("response_time_ms", response_time_ms);
	result.put ("uptime_percentage", uptime_percentage);
	return result;
}

boost::property_tree::ptree ballot::to_ptree (std::vector<ballot::node_summary> const & nodes)
{
	boost::property_tree::ptree result;
	for (auto const & node : nodes)
	{
		result.push_back (std::make_pair ("", node.to_ptree ()));
	}
	return result;
}

void ballot::election_stats::add (ballot::vote_status status)
{
	++total;
	switch (status)
	{
		case ballot::vote_status::pending:
			++pending;
			break;
		case ballot::vote_status::finalized:
			++finalized;
			break;
		case ballot::vote_status::failed:
			++failed;
			break;
		case ballot::vote_status::expired:
			++expired;
			break;
	}
}

boost::property_tree::ptree ballot::election_stats::to_ptree () const
{
	boost::property_tree::ptree result;
	result.put ("election", election);
	result.put ("total", total);
	result.put ("finalized", finalized);
	result.put ("pending", pending);
	result.put ("failed", failed);
	result.put ("expired", expired);
	return result;
}
