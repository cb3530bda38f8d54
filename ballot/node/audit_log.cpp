#include <ballot/lib/enum_util.hpp>
#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/node/audit_log.hpp>

#include <boost/property_tree/ptree.hpp>

std::string_view ballot::to_string (ballot::audit_action action)
{
	return ballot::enum_util::name (action);
}

ballot::hash256 ballot::audit_entry::digest () const
{
	auto sequence_l = std::to_string (sequence);
	auto time_l = std::to_string (std::chrono::duration_cast<std::chrono::milliseconds> (timestamp.time_since_epoch ()).count ());
	auto previous_l = previous.to_string ();
	return ballot::blake2b_digest ({ previous_l, sequence_l, ballot::to_string (action), subject, details, time_l });
}

boost::property_tree::ptree ballot::audit_entry::to_ptree () const
{
	boost::property_tree::ptree result;
	result.put ("sequence", sequence);
	result.put ("action", ballot::to_string (action));
	result.put ("subject", subject);
	result.put ("details", details);
	result.put ("time", std::chrono::duration_cast<std::chrono::milliseconds> (timestamp.time_since_epoch ()).count ());
	result.put ("previous", previous.to_string ());
	result.put ("hash", hash.to_string ());
	return result;
}

ballot::audit_log::audit_log (ballot::stats & stats_a, ballot::logger & logger_a) :
	stats{ stats_a },
	logger{ logger_a }
{
}

ballot::audit_entry ballot::audit_log::append (ballot::audit_action action, std::string subject, std::string details)
{
	ballot::audit_entry entry;
	{
		ballot::lock_guard<ballot::mutex> lock{ mutex };
		entry.sequence = chain.size ();
		entry.action = action;
		entry.subject = std::move (subject);
		entry.details = std::move (details);
		entry.timestamp = std::chrono::system_clock::now ();
		if (!chain.empty ())
		{
			entry.previous = chain.back ().hash;
		}
		entry.hash = entry.digest ();
		chain.push_back (entry);
	}
	stats.inc (ballot::stat::type::audit_log, ballot::stat::detail::append);
	logger.debug (ballot::log::type::audit_log, "#{} {} {} {}", entry.sequence, ballot::to_string (action), entry.subject, entry.hash.to_string ());
	return entry;
}

std::optional<uint64_t> ballot::audit_log::verify () const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	ballot::hash256 previous;
	for (auto const & entry : chain)
	{
		if (entry.previous != previous || entry.digest () != entry.hash)
		{
			stats.inc (ballot::stat::type::audit_log, ballot::stat::detail::verify_failed);
			logger.error (ballot::log::type::audit_log, "Audit chain broken at entry {}", entry.sequence);
			return entry.sequence;
		}
		previous = entry.hash;
	}
	return std::nullopt;
}

std::vector<ballot::audit_entry> ballot::audit_log::entries () const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	return { chain.begin (), chain.end () };
}

size_t ballot::audit_log::size () const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	return chain.size ();
}
