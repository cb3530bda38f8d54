#include <ballot/lib/numbers.hpp>

#include <gtest/gtest.h>

#include <unordered_set>

TEST (hash256, zero)
{
	ballot::hash256 value;
	ASSERT_TRUE (value.is_zero ());
	ASSERT_EQ (std::string (64, '0'), value.to_string ());
}

TEST (hash256, encode_decode)
{
	auto digest = ballot::blake2b_digest ({ "ballot" });
	ASSERT_FALSE (digest.is_zero ());
	auto text = digest.to_string ();
	ASSERT_EQ (64, text.size ());
	ballot::hash256 decoded;
	ASSERT_FALSE (decoded.decode_hex (text));
	ASSERT_EQ (digest, decoded);
	ASSERT_EQ (digest, ballot::hash256{ text });
}

TEST (hash256, decode_invalid)
{
	ballot::hash256 value;
	ASSERT_TRUE (value.decode_hex ("00"));
	ASSERT_TRUE (value.decode_hex (std::string (63, '0') + "g"));
	ASSERT_FALSE (value.decode_hex (std::string (64, 'a')));
	ASSERT_EQ (0xaa, value.bytes[31]);
	value.clear ();
	ASSERT_TRUE (value.is_zero ());
}

TEST (blake2b_digest, deterministic)
{
	ASSERT_EQ (ballot::blake2b_digest ({ "a", "b" }), ballot::blake2b_digest ({ "a", "b" }));
	ASSERT_NE (ballot::blake2b_digest ({ "a", "b" }), ballot::blake2b_digest ({ "b", "a" }));
}

// Part boundaries take part in the digest
TEST (blake2b_digest, separated_parts)
{
	ASSERT_NE (ballot::blake2b_digest ({ "ab", "c" }), ballot::blake2b_digest ({ "a", "bc" }));
	ASSERT_NE (ballot::blake2b_digest ({ "abc" }), ballot::blake2b_digest ({ "ab", "c" }));
}

TEST (hash256, std_hash)
{
	std::unordered_set<ballot::hash256> set;
	set.insert (ballot::blake2b_digest ({ "1" }));
	set.insert (ballot::blake2b_digest ({ "2" }));
	set.insert (ballot::blake2b_digest ({ "1" }));
	ASSERT_EQ (2, set.size ());
}
