#include <ballot/lib/errors.hpp>

std::string ballot::error_common_messages::message (int ev) const
{
	switch (static_cast<ballot::error_common> (ev))
	{
		case ballot::error_common::generic:
			return "Unknown error";
		case ballot::error_common::exception:
			return "Exception thrown";
	}

	return "Invalid error code";
}

std::string ballot::error_consensus_messages::message (int ev) const
{
	switch (static_cast<ballot::error_consensus> (ev))
	{
		case ballot::error_consensus::generic:
			return "Unknown error";
		case ballot::error_consensus::duplicate_vote:
			return "A vote from this voter already exists in this election";
		case ballot::error_consensus::insufficient_nodes:
			return "No active election nodes available";
		case ballot::error_consensus::unknown_round_entry:
			return "No pending log entry for this node in the current round";
		case ballot::error_consensus::round_exhausted:
			return "Maximum number of consensus rounds reached";
		case ballot::error_consensus::unknown_vote:
			return "Vote not found";
		case ballot::error_consensus::unknown_node:
			return "Election node not found";
		case ballot::error_consensus::unknown_election:
			return "Election not found";
		case ballot::error_consensus::election_not_active:
			return "Election is not active";
		case ballot::error_consensus::election_ended:
			return "Election has ended";
		case ballot::error_consensus::vote_not_pending:
			return "Vote is no longer pending";
		case ballot::error_consensus::round_superseded:
			return "Consensus round was superseded";
		case ballot::error_consensus::invalid_transition:
			return "Invalid election status transition";
	}

	return "Invalid error code";
}

std::string ballot::error_config_messages::message (int ev) const
{
	switch (static_cast<ballot::error_config> (ev))
	{
		case ballot::error_config::generic:
			return "Unknown error";
		case ballot::error_config::invalid_value:
			return "Invalid configuration value";
		case ballot::error_config::missing_value:
			return "Missing value in configuration";
	}

	return "Invalid error code";
}

ballot::error::error (std::error_code code_a)
{
	code = code_a;
}

ballot::error::error (std::string message_a)
{
	code = ballot::error_common::generic;
	message = std::move (message_a);
}

ballot::error::error (std::exception const & exception_a)
{
	code = ballot::error_common::exception;
	message = exception_a.what ();
}

ballot::error & ballot::error::operator= (ballot::error const & err_a)
{
	code = err_a.code;
	message = err_a.message;
	return *this;
}

ballot::error & ballot::error::operator= (ballot::error && err_a)
{
	code = err_a.code;
	message = std::move (err_a.message);
	return *this;
}

/** Assign error code */
ballot::error & ballot::error::operator= (std::error_code const code_a)
{
	code = code_a;
	message.clear ();
	return *this;
}

/** Set the error to ballot::error_common::generic and the error message to \p message_a */
ballot::error & ballot::error::operator= (std::string message_a)
{
	code = ballot::error_common::generic;
	message = std::move (message_a);
	return *this;
}

/** Sets the error to ballot::error_common::exception and adopts the exception error message. */
ballot::error & ballot::error::operator= (std::exception const & exception_a)
{
	code = ballot::error_common::exception;
	message = exception_a.what ();
	return *this;
}

bool ballot::error::operator== (std::error_code const code_a) const
{
	return code == code_a;
}

ballot::error::operator std::error_code () const
{
	return code;
}

/** True if there's an error */
ballot::error::operator bool () const
{
	return code.value () != 0;
}

/**
 * Get error message, or an empty string if there's no error. If a custom error message is set,
 * that will be returned, otherwise the error_code#message() is returned.
 */
std::string ballot::error::get_message () const
{
	std::string res = message;
	if (code && res.empty ())
	{
		res = code.message ();
	}
	return res;
}

ballot::error & ballot::error::set (std::string message_a, std::error_code code_a)
{
	message = std::move (message_a);
	code = code_a;
	return *this;
}

/** Set a custom error message. If the error code is not set, it will be set to ballot::error_common::generic. */
ballot::error & ballot::error::set_message (std::string message_a)
{
	if (!code)
	{
		code = ballot::error_common::generic;
	}
	message = std::move (message_a);
	return *this;
}

ballot::error & ballot::error::clear ()
{
	code.clear ();
	message.clear ();
	return *this;
}
