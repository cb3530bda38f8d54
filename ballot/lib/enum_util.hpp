#pragma once

#include <ballot/lib/utility.hpp>

#include <magic_enum.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Needs nested namespace to avoid ADL collisions with magic_enum
namespace ballot::enum_util
{
std::string_view name (auto value)
{
	auto name = magic_enum::enum_name (value);
	debug_assert (!name.empty ());
	release_assert (name.size () < 64);
	return name;
}

/**
 * Same as `magic_enum::enum_values (...)` but ignores reserved values (starting with underscore) by default.
 */
template <class E>
std::vector<E> const & values (bool ignore_reserved = true)
{
	static std::vector<E> all = [ignore_reserved] () {
		std::vector<E> result;
		for (auto const & [val, name] : magic_enum::enum_entries<E> ())
		{
			if (!ignore_reserved || !name.starts_with ('_'))
			{
				result.push_back (val);
			}
		}
		return result;
	}();
	return all;
}

/**
 * Case insensitive `magic_enum::enum_cast (...)` that skips reserved values (starting with underscore) by default.
 */
template <class E>
std::optional<E> try_parse (std::string_view name, bool ignore_reserved = true)
{
	if (ignore_reserved && name.starts_with ('_'))
	{
		return std::nullopt;
	}
	return magic_enum::enum_cast<E> (name, magic_enum::case_insensitive);
}
}
