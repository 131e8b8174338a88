#include "gtest/gtest.h"

#include <rnd/lib/logging.hpp>
#include <rnd/lib/stacktrace.hpp>

#include <signal.h>
#include <stdlib.h>

void signalHandler (int signum)
{
	std::cerr << "SIGSEGV signal handler\n";
	std::cerr << rnd::generate_stacktrace () << std::endl;
	exit (signum);
}

GTEST_API_ int main (int argc, char ** argv)
{
	signal (SIGSEGV, signalHandler);
	rnd::logger::initialize_for_tests (rnd::log_config::tests_default ());
	testing::InitGoogleTest (&argc, argv);
	auto res = RUN_ALL_TESTS ();
	rnd::logger::flush ();
	return res;
}
