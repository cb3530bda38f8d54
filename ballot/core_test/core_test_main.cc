#include "gtest/gtest.h"

#include <ballot/lib/env.hpp>
#include <ballot/lib/logging.hpp>
#include <ballot/lib/utility.hpp>
#include <ballot/secure/utility.hpp>

#include <cstdlib>
#include <iostream>
#include <signal.h>

void signalHandler (int signum)
{
	std::cerr << "SIGSEGV signal handler\n";
	std::cerr << ballot::generate_stacktrace () << std::endl;
	exit (signum);
}

GTEST_API_ int main (int argc, char ** argv)
{
	signal (SIGSEGV, signalHandler);
	ballot::logger::initialize_for_tests (ballot::log_config::tests_default ());
	testing::InitGoogleTest (&argc, argv);
	auto res = RUN_ALL_TESTS ();
	if (!ballot::env::get<bool> ("TEST_KEEP_TMPDIRS").value_or (false))
	{
		ballot::remove_temporary_directories ();
	}
	return res;
}
