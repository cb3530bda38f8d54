#pragma once

#include <ballot/lib/errors.hpp>
#include <ballot/lib/locks.hpp>
#include <ballot/lib/random.hpp>
#include <ballot/lib/utility.hpp>
#include <ballot/node/fwd.hpp>
#include <ballot/secure/common.hpp>

#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index_container.hpp>

#include <memory>
#include <optional>
#include <system_error>
#include <vector>

namespace mi = boost::multi_index;

namespace ballot
{
/**
 * A stored vote together with the lock serializing every change to it.
 * Round opening, confirmation recording and evaluation of one vote hold this lock, unrelated votes never contend.
 */
class vote_record final
{
public:
	explicit vote_record (ballot::vote);

	ballot::vote vote; // Guarded by mutex
	mutable ballot::mutex mutex{ "vote_record" };
};

class vote_insertion_result final
{
public:
	std::error_code code;
	ballot::vote vote;
};

/** Append only store of votes, enforcing one vote per (voter, election) */
class vote_store final
{
public:
	vote_store (ballot::stats &, ballot::logger &);

	/**
	 * Atomically inserts a new pending vote
	 * @returns error_consensus::duplicate_vote when \p voter already voted in \p election, nothing is mutated in that case
	 */
	ballot::vote_insertion_result create (std::string const & voter, std::string const & candidate, ballot::election_id election, uint32_t required_confirmations);

	/** Record for \p vote or nullptr. Callers must hold the record mutex while reading or changing the vote */
	std::shared_ptr<ballot::vote_record> record (ballot::vote_id vote) const;

	/** Consistent copy of the vote */
	std::optional<ballot::vote> get (ballot::vote_id vote) const;
	std::optional<ballot::vote> find (std::string const & voter, ballot::election_id election) const;
	/** Ids of all votes cast in \p election, oldest first */
	std::vector<ballot::vote_id> list (ballot::election_id election) const;
	/** Elections \p voter cast a vote in */
	std::vector<ballot::election_id> elections_of (std::string const & voter) const;
	size_t size () const;

private: // Dependencies
	ballot::stats & stats;
	ballot::logger & logger;

private:
	class entry final
	{
	public:
		ballot::vote_id id;
		std::string voter;
		ballot::election_id election;
		std::shared_ptr<ballot::vote_record> record;
	};

	// clang-format off
	class tag_id {};
	class tag_voter_election {};
	class tag_election {};
	class tag_voter {};

	using ordered_votes = boost::multi_index_container<entry,
	mi::indexed_by<
		mi::ordered_unique<mi::tag<tag_id>,
			mi::member<entry, ballot::vote_id, &entry::id>>,
		mi::hashed_unique<mi::tag<tag_voter_election>,
			mi::composite_key<entry,
				mi::member<entry, std::string, &entry::voter>,
				mi::member<entry, ballot::election_id, &entry::election>>>,
		mi::ordered_non_unique<mi::tag<tag_election>,
			mi::member<entry, ballot::election_id, &entry::election>>,
		mi::hashed_non_unique<mi::tag<tag_voter>,
			mi::member<entry, std::string, &entry::voter>>
	>>;
	// clang-format on

	ordered_votes votes;
	ballot::vote_id next_id{ 1 };
	ballot::random_generator random;
	mutable ballot::mutex mutex{ "vote_store" };
};
}
