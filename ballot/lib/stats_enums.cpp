#include <ballot/lib/enum_util.hpp>
#include <ballot/lib/stats_enums.hpp>

std::string_view ballot::to_string (ballot::stat::type type)
{
	return ballot::enum_util::name (type);
}

std::string_view ballot::to_string (ballot::stat::detail detail)
{
	return ballot::enum_util::name (detail);
}

std::string_view ballot::to_string (ballot::stat::dir dir)
{
	return ballot::enum_util::name (dir);
}

std::string_view ballot::to_string (ballot::stat::sample sample)
{
	return ballot::enum_util::name (sample);
}
