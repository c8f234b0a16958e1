#include "gtest/gtest.h"

#include <lumen/lib/logging.hpp>
#include <lumen/lib/utility.hpp>
#include <lumen/test_common/testutil.hpp>

#include <cstdlib>
#include <iostream>

#include <signal.h>

void signalHandler (int signum)
{
	std::cerr << "SIGSEGV signal handler\n";
	std::cerr << lumen::generate_stacktrace () << std::endl;
	exit (signum);
}

GTEST_API_ int main (int argc, char ** argv)
{
	signal (SIGSEGV, signalHandler);
	lumen::logger::initialize_for_tests (lumen::log_config::tests_default ());
	testing::InitGoogleTest (&argc, argv);
	auto res = RUN_ALL_TESTS ();
	lumen::test::remove_temporary_directories ();
	return res;
}
