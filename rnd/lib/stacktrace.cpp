#include <rnd/lib/stacktrace.hpp>

#include <boost/stacktrace.hpp>

#include <sstream>

std::string rnd::generate_stacktrace ()
{
	auto stacktrace = boost::stacktrace::stacktrace ();
	std::stringstream ss;
	ss << stacktrace;
	return ss.str ();
}
