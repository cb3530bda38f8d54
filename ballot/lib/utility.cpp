#include <ballot/lib/utility.hpp>

#include <boost/program_options.hpp>
#include <boost/stacktrace.hpp>

#include <cstdlib>
#include <iostream>
#include <map>

#include <sys/stat.h>
#include <sys/types.h>

void ballot::set_umask ()
{
	umask (077);
}

void ballot::set_secure_perm_directory (std::filesystem::path const & path, std::error_code & ec)
{
	std::filesystem::permissions (path, std::filesystem::perms::owner_all, ec);
}

void ballot::set_secure_perm_file (std::filesystem::path const & path)
{
	std::filesystem::permissions (path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
}

std::string ballot::generate_stacktrace ()
{
	auto stacktrace = boost::stacktrace::stacktrace ();
	std::stringstream ss;
	ss << stacktrace;
	return ss.str ();
}

/*
 * Backing code for "release_assert" & "debug_assert", which are macros
 */
void assert_internal (char const * check_expr, char const * func, char const * file, unsigned int line, bool is_release_assert, std::string_view error_msg)
{
	std::cerr << "Assertion (" << check_expr << ") failed\n"
			  << func << "\n"
			  << file << ":" << line << "\n";
	if (!error_msg.empty ())
	{
		std::cerr << "Error: " << error_msg << "\n";
	}
	std::cerr << "\n";

	std::cerr << ballot::generate_stacktrace () << std::endl;

	abort ();
}

void ballot::sort_options_description (const boost::program_options::options_description & source, boost::program_options::options_description & target)
{
	// Keyed by display name so the map sorts the options
	const auto & options = source.options ();
	std::map<std::string, boost::shared_ptr<boost::program_options::option_description>> sorted_options;
	for (const auto & option : options)
	{
		auto pair = std::make_pair (option->canonical_display_name (2), option);
		sorted_options.insert (pair);
	}

	for (const auto & option_pair : sorted_options)
	{
		target.add (option_pair.second);
	}
}
