#include <ballot/test_common/consensus.hpp>

ballot::test::consensus_context::consensus_context (uint32_t node_count)
{
	election = elections.create ("test", node_count).id;
	auto error = elections.start (election);
	release_assert (!error);
	for (uint32_t i = 0; i < node_count; ++i)
	{
		registry.add (election, "node" + std::to_string (i));
	}
}

ballot::vote ballot::test::consensus_context::cast (std::string const & voter, std::string const & candidate)
{
	auto result = store.create (voter, candidate, election, config.required_confirmations);
	release_assert (!result.code, result.code.message ());
	return result.vote;
}

std::vector<ballot::node_id> ballot::test::consensus_context::round_nodes (ballot::vote_id vote_id) const
{
	std::vector<ballot::node_id> result;
	auto vote = store.get (vote_id);
	if (vote && vote->current_round ())
	{
		for (auto const & entry : vote->current_round ()->entries)
		{
			result.push_back (entry.node);
		}
	}
	return result;
}
