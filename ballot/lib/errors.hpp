#pragma once

#include <exception>
#include <memory>
#include <string>
#include <system_error>
#include <type_traits>

namespace ballot
{
/** Common error codes */
enum class error_common
{
	generic = 1,
	exception
};

/** Errors raised while casting, confirming and evaluating votes */
enum class error_consensus
{
	generic = 1,
	duplicate_vote, // A vote already exists for this (voter, election)
	insufficient_nodes, // No active node could be selected for a round
	unknown_round_entry, // No matching pending entry in the current round, confirmation dropped
	round_exhausted, // max_rounds rounds failed, vote moved to failed
	unknown_vote,
	unknown_node,
	unknown_election,
	election_not_active, // Votes are only accepted while the election is active
	election_ended, // Stale confirmation for a vote whose election already ended
	vote_not_pending, // Operation requires a pending vote
	round_superseded, // Round number no longer matches the vote's current round
	invalid_transition // Requested election lifecycle change is not allowed
};

/** config-*.toml deserialization related errors */
enum class error_config
{
	generic = 1,
	invalid_value,
	missing_value
};
} // ballot namespace

// Convenience macro to implement the standard boilerplate for using std::error_code with enums
// Use this at the end of any header defining one or more error code enums.
#define REGISTER_ERROR_CODES(namespace_name, enum_type)                                                        \
	namespace namespace_name                                                                                   \
	{                                                                                                          \
		static_assert (static_cast<int> (enum_type::generic) > 0, "The first error enum must be generic = 1"); \
		class enum_type##_messages : public std::error_category                                                \
		{                                                                                                      \
		public:                                                                                                \
			char const * name () const noexcept override                                                       \
			{                                                                                                  \
				return #enum_type;                                                                             \
			}                                                                                                  \
                                                                                                               \
			std::string message (int ev) const override;                                                       \
		};                                                                                                     \
                                                                                                               \
		inline std::error_category const & enum_type##_category ()                                             \
		{                                                                                                      \
			static enum_type##_messages instance;                                                              \
			return instance;                                                                                   \
		}                                                                                                      \
                                                                                                               \
		inline std::error_code make_error_code (::namespace_name::enum_type err)                               \
		{                                                                                                      \
			return { static_cast<int> (err), enum_type##_category () };                                        \
		}                                                                                                      \
	}                                                                                                          \
	namespace std                                                                                              \
	{                                                                                                          \
		template <>                                                                                            \
		struct is_error_code_enum<::namespace_name::enum_type> : std::true_type                                \
		{                                                                                                      \
		};                                                                                                     \
	}

REGISTER_ERROR_CODES (ballot, error_common);
REGISTER_ERROR_CODES (ballot, error_consensus);
REGISTER_ERROR_CODES (ballot, error_config);

namespace ballot
{
/** Adapter for std::error_code, std::exception and messages to facilitate unified error handling in config code */
class error
{
public:
	error () = default;
	error (ballot::error const & error_a) = default;
	error (ballot::error && error_a) = default;

	error (std::error_code code_a);
	error (std::string message_a);
	error (std::exception const & exception_a);
	error & operator= (ballot::error const & err_a);
	error & operator= (ballot::error && err_a);
	error & operator= (std::error_code code_a);
	error & operator= (std::string message_a);
	error & operator= (std::exception const & exception_a);
	bool operator== (std::error_code code_a) const;
	explicit operator std::error_code () const;
	explicit operator bool () const;
	std::string get_message () const;
	error & set (std::string message_a, std::error_code code_a = ballot::error_common::generic);
	error & set_message (std::string message_a);
	error & clear ();

private:
	std::error_code code;
	std::string message;
};

/**
 * A type that manages a ballot::error.
 * The default return type is ballot::error&, shared_ptr<ballot::error> is used where error state is shared.
 */
template <typename RET_TYPE = ballot::error &>
class error_aware
{
	static_assert (std::is_same<RET_TYPE, ballot::error &>::value || std::is_same<RET_TYPE, std::shared_ptr<ballot::error>>::value, "Must be ballot::error& or shared_ptr<ballot::error>");

public:
	/** Returns the error object managed by this object */
	virtual RET_TYPE get_error () = 0;
};
}
