#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>

namespace ballot
{
/** 256 bit blake2b digest */
class hash256
{
public:
	hash256 () = default;
	/**
	 * Decode from hex string
	 * @warning Aborts at runtime if the input is invalid
	 */
	explicit hash256 (std::string const &);

	bool operator== (ballot::hash256 const &) const;
	bool operator!= (ballot::hash256 const &) const;
	bool operator< (ballot::hash256 const &) const;
	void encode_hex (std::string &) const;
	/** Returns true on error */
	bool decode_hex (std::string const &);
	void clear ();
	bool is_zero () const;
	std::string to_string () const;

	std::array<uint8_t, 32> bytes{};
};

/** blake2b of the concatenated \p parts, each terminated by a zero byte so that ("ab", "c") and ("a", "bc") differ */
ballot::hash256 blake2b_digest (std::initializer_list<std::string_view> parts);
}

namespace std
{
template <>
struct hash<::ballot::hash256>
{
	size_t operator() (::ballot::hash256 const & data_a) const
	{
		size_t result;
		static_assert (sizeof (result) <= sizeof (data_a.bytes));
		std::copy_n (data_a.bytes.data (), sizeof (result), reinterpret_cast<uint8_t *> (&result));
		return result;
	}
};
}
