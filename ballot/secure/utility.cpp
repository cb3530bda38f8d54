#include <ballot/lib/env.hpp>
#include <ballot/secure/utility.hpp>

#include <iostream>
#include <random>
#include <string>
#include <vector>

static std::vector<std::filesystem::path> all_unique_paths;

std::filesystem::path ballot::app_path ()
{
	static auto const path = [] () {
		if (auto value = ballot::env::get ("BALLOT_APP_PATH"))
		{
			std::cerr << "Application path overridden by BALLOT_APP_PATH environment variable: " << *value << std::endl;
			return std::filesystem::path{ *value };
		}
		if (auto home = ballot::env::get ("HOME"))
		{
			return std::filesystem::path{ *home };
		}
		return std::filesystem::current_path ();
	}();
	return path;
}

std::filesystem::path ballot::working_path ()
{
	return ballot::app_path () / "Ballot";
}

std::filesystem::path ballot::random_filename ()
{
	std::random_device rd;
	std::mt19937 gen (rd ());
	std::uniform_int_distribution<> dis (0, 15);

	const char * hex_chars = "0123456789ABCDEF";
	std::string random_string;
	random_string.reserve (32);

	for (int i = 0; i < 32; ++i)
	{
		random_string += hex_chars[dis (gen)];
	}
	return std::filesystem::path{ random_string };
}

std::filesystem::path ballot::unique_path ()
{
	auto result = working_path () / "tests" / random_filename ();

	std::filesystem::create_directories (result);

	all_unique_paths.push_back (result);
	return result;
}

void ballot::remove_temporary_directories ()
{
	for (auto & path : all_unique_paths)
	{
		std::error_code ec;
		std::filesystem::remove_all (path, ec);
		if (ec)
		{
			std::cerr << "Could not remove temporary directory: " << ec.message () << std::endl;
		}
	}
}
