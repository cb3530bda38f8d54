#include <ballot/lib/enum_util.hpp>
#include <ballot/lib/logging_enums.hpp>
#include <ballot/lib/utility.hpp>

std::string_view ballot::log::to_string (ballot::log::type tag)
{
	return ballot::enum_util::name (tag);
}

std::string_view ballot::log::to_string (ballot::log::detail detail)
{
	return ballot::enum_util::name (detail);
}

std::string_view ballot::log::to_string (ballot::log::level level)
{
	return ballot::enum_util::name (level);
}

const std::vector<ballot::log::level> & ballot::log::all_levels ()
{
	return ballot::enum_util::values<ballot::log::level> ();
}

const std::vector<ballot::log::type> & ballot::log::all_types ()
{
	return ballot::enum_util::values<ballot::log::type> ();
}

ballot::log::level ballot::log::parse_level (std::string_view name)
{
	auto value = ballot::enum_util::try_parse<ballot::log::level> (name);
	if (value.has_value ())
	{
		return value.value ();
	}
	auto all_levels_str = ballot::util::join (ballot::log::all_levels (), ", ", [] (auto const & lvl) {
		return to_string (lvl);
	});

	throw std::invalid_argument ("Invalid log level: " + std::string (name) + ". Must be one of: " + all_levels_str);
}

ballot::log::type ballot::log::parse_type (std::string_view name)
{
	auto value = ballot::enum_util::try_parse<ballot::log::type> (name);
	if (value.has_value ())
	{
		return value.value ();
	}
	throw std::invalid_argument ("Invalid log type: " + std::string (name));
}

ballot::log::detail ballot::log::parse_detail (std::string_view name)
{
	auto value = ballot::enum_util::try_parse<ballot::log::detail> (name);
	if (value.has_value ())
	{
		return value.value ();
	}
	throw std::invalid_argument ("Invalid log detail: " + std::string (name));
}
