#pragma once

#include <ballot/secure/common.hpp>

namespace ballot
{
/**
 * Asks the nodes of a freshly opened round to confirm a vote.
 * Answers arrive asynchronously through coordinator::record_confirmation.
 */
class confirmation_solicitor
{
public:
	virtual ~confirmation_solicitor () = default;
	virtual void solicit (ballot::vote const &, ballot::consensus_round const &) = 0;
};

/** Nodes confirm on their own, nothing needs to be sent */
class manual_solicitor final : public confirmation_solicitor
{
public:
	void solicit (ballot::vote const &, ballot::consensus_round const &) override
	{
	}
};
}
