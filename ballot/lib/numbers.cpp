#include <ballot/lib/numbers.hpp>
#include <ballot/lib/utility.hpp>

#include <blake2.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

ballot::hash256::hash256 (std::string const & hex_a)
{
	auto error (decode_hex (hex_a));

	release_assert (!error);
}

bool ballot::hash256::operator== (ballot::hash256 const & other_a) const
{
	return bytes == other_a.bytes;
}

bool ballot::hash256::operator!= (ballot::hash256 const & other_a) const
{
	return !(*this == other_a);
}

bool ballot::hash256::operator< (ballot::hash256 const & other_a) const
{
	return bytes < other_a.bytes;
}

void ballot::hash256::encode_hex (std::string & text) const
{
	debug_assert (text.empty ());
	std::stringstream stream;
	stream << std::hex << std::uppercase << std::noshowbase << std::setfill ('0');
	for (auto byte : bytes)
	{
		stream << std::setw (2) << static_cast<unsigned> (byte);
	}
	text = stream.str ();
}

bool ballot::hash256::decode_hex (std::string const & text)
{
	auto error (text.size () != bytes.size () * 2);
	for (size_t i = 0; !error && i < bytes.size (); ++i)
	{
		auto pair = text.substr (i * 2, 2);
		if (!std::all_of (pair.begin (), pair.end (), [] (unsigned char c) { return std::isxdigit (c); }))
		{
			error = true;
		}
		else
		{
			bytes[i] = static_cast<uint8_t> (std::stoul (pair, nullptr, 16));
		}
	}
	return error;
}

void ballot::hash256::clear ()
{
	bytes.fill (0);
}

bool ballot::hash256::is_zero () const
{
	return std::all_of (bytes.begin (), bytes.end (), [] (uint8_t byte) { return byte == 0; });
}

std::string ballot::hash256::to_string () const
{
	std::string result;
	encode_hex (result);
	return result;
}

ballot::hash256 ballot::blake2b_digest (std::initializer_list<std::string_view> parts)
{
	ballot::hash256 result;
	blake2b_state hash;
	blake2b_init (&hash, sizeof (result.bytes));
	uint8_t const separator{ 0 };
	for (auto const & part : parts)
	{
		blake2b_update (&hash, reinterpret_cast<uint8_t const *> (part.data ()), part.size ());
		blake2b_update (&hash, &separator, sizeof (separator));
	}
	blake2b_final (&hash, result.bytes.data (), sizeof (result.bytes));
	return result;
}
