#pragma once

#include <ballot/lib/logging.hpp>
#include <ballot/lib/stats.hpp>
#include <ballot/node/consensus_evaluator.hpp>
#include <ballot/node/elections.hpp>
#include <ballot/node/node_registry.hpp>
#include <ballot/node/round_manager.hpp>
#include <ballot/node/vote_store.hpp>

#include <vector>

namespace ballot::test
{
/**
 * Consensus components wired together without background threads, for driving rounds step by step.
 * Owns one active election with `node_count` registered nodes.
 */
class consensus_context final
{
public:
	explicit consensus_context (uint32_t node_count = 5);

	/** Casts a vote into the active election and asserts it was stored */
	ballot::vote cast (std::string const & voter, std::string const & candidate = "candidate");
	/** Node ids of the current round of \p vote */
	std::vector<ballot::node_id> round_nodes (ballot::vote_id) const;

public:
	ballot::consensus_config config;
	ballot::node_registry_config registry_config;
	ballot::stats stats;
	ballot::logger logger{ "tests" };
	ballot::elections elections{ stats, logger };
	ballot::node_registry registry{ registry_config, stats, logger };
	ballot::vote_store store{ stats, logger };
	ballot::round_manager rounds{ config, store, registry, elections, stats, logger };
	ballot::consensus_evaluator evaluator{ config, store, elections, stats, logger };
	ballot::election_id election{ 0 };
};
}
