#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/node/vote_store.hpp>

#include <algorithm>
#include <limits>
#include <tuple>

ballot::vote_record::vote_record (ballot::vote vote_a) :
	vote{ std::move (vote_a) }
{
}

ballot::vote_store::vote_store (ballot::stats & stats_a, ballot::logger & logger_a) :
	stats{ stats_a },
	logger{ logger_a }
{
}

ballot::vote_insertion_result ballot::vote_store::create (std::string const & voter, std::string const & candidate, ballot::election_id election, uint32_t required_confirmations)
{
	ballot::vote_insertion_result result;
	{
		ballot::lock_guard<ballot::mutex> lock{ mutex };

		auto & index = votes.get<tag_voter_election> ();
		if (index.find (std::make_tuple (voter, election)) != index.end ())
		{
			result.code = ballot::error_consensus::duplicate_vote;
		}
		else
		{
			auto & vote = result.vote;
			vote.id = next_id++;
			vote.voter = voter;
			vote.candidate = candidate;
			vote.election = election;
			vote.status = ballot::vote_status::pending;
			vote.required_confirmations = required_confirmations;
			vote.created = std::chrono::system_clock::now ();
			vote.nonce = random.random (uint64_t{ 0 }, std::numeric_limits<uint64_t>::max ()) ^ static_cast<uint64_t> (vote.created.time_since_epoch ().count ());
			vote.fingerprint = ballot::compute_fingerprint (voter, candidate, election, vote.nonce);

			auto [it, inserted] = votes.insert (entry{ vote.id, voter, election, std::make_shared<ballot::vote_record> (vote) });
			release_assert (inserted);
		}
	}

	if (result.code)
	{
		stats.inc (ballot::stat::type::vote_store, ballot::stat::detail::duplicate_vote);
		logger.debug (ballot::log::type::vote_store, "Rejected duplicate vote from {} in election {}", voter, election);
	}
	else
	{
		stats.inc (ballot::stat::type::vote_store, ballot::stat::detail::vote_created);
		logger.debug (ballot::log::type::vote_store, "Stored vote {} from {} in election {} (fingerprint: {})", result.vote.id, voter, election, result.vote.fingerprint.to_string ());
	}
	return result;
}

std::shared_ptr<ballot::vote_record> ballot::vote_store::record (ballot::vote_id vote) const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	auto existing = votes.get<tag_id> ().find (vote);
	if (existing != votes.get<tag_id> ().end ())
	{
		return existing->record;
	}
	return nullptr;
}

std::optional<ballot::vote> ballot::vote_store::get (ballot::vote_id vote) const
{
	if (auto record_l = record (vote))
	{
		ballot::lock_guard<ballot::mutex> lock{ record_l->mutex };
		return record_l->vote;
	}
	return std::nullopt;
}

std::optional<ballot::vote> ballot::vote_store::find (std::string const & voter, ballot::election_id election) const
{
	std::shared_ptr<ballot::vote_record> record_l;
	{
		ballot::lock_guard<ballot::mutex> lock{ mutex };
		auto & index = votes.get<tag_voter_election> ();
		if (auto existing = index.find (std::make_tuple (voter, election)); existing != index.end ())
		{
			record_l = existing->record;
		}
	}
	if (record_l)
	{
		ballot::lock_guard<ballot::mutex> lock{ record_l->mutex };
		return record_l->vote;
	}
	return std::nullopt;
}

std::vector<ballot::vote_id> ballot::vote_store::list (ballot::election_id election) const
{
	std::vector<ballot::vote_id> result;
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	auto [begin, end] = votes.get<tag_election> ().equal_range (election);
	for (auto it = begin; it != end; ++it)
	{
		result.push_back (it->id);
	}
	std::sort (result.begin (), result.end ());
	return result;
}

std::vector<ballot::election_id> ballot::vote_store::elections_of (std::string const & voter) const
{
	std::vector<ballot::election_id> result;
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	auto [begin, end] = votes.get<tag_voter> ().equal_range (voter);
	for (auto it = begin; it != end; ++it)
	{
		result.push_back (it->election);
	}
	std::sort (result.begin (), result.end ());
	return result;
}

size_t ballot::vote_store::size () const
{
	ballot::lock_guard<ballot::mutex> lock{ mutex };
	return votes.size ();
}
