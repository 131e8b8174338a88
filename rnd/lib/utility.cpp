#include <rnd/lib/stacktrace.hpp>
#include <rnd/lib/utility.hpp>

#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>
#include <map>

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

	// Output stack trace to cerr
	auto backtrace_str = rnd::generate_stacktrace ();
	std::cerr << backtrace_str << std::endl;

	std::abort ();
}

void rnd::util::sort_options_description (boost::program_options::options_description const & source, boost::program_options::options_description & target)
{
	// Display name as key, the map keeps the options sorted
	auto const & options = source.options ();
	std::map<std::string, boost::shared_ptr<boost::program_options::option_description>> sorted_options;
	for (auto const & option : options)
	{
		sorted_options.emplace (option->canonical_display_name (2), option);
	}

	for (auto const & option_pair : sorted_options)
	{
		target.add (option_pair.second);
	}
}
