#include <rnd/lib/numbers.hpp>
#include <rnd/lib/stacktrace.hpp>
#include <rnd/lib/utility.hpp>

#include <gtest/gtest.h>

#include <boost/program_options.hpp>

#include <limits>
#include <string>
#include <vector>

TEST (utility, join)
{
	std::vector<int> values{ 1, 2, 3 };
	ASSERT_EQ ("1, 2, 3", rnd::util::join (values, ", ", [] (auto value) { return rnd::util::to_str (value); }));
	std::vector<int> empty;
	ASSERT_EQ ("", rnd::util::join (empty, ", ", [] (auto value) { return value; }));
}

TEST (utility, split)
{
	std::vector<std::string> expected{ "a", "b", "", "c" };
	ASSERT_EQ (expected, rnd::util::split ("a,b,,c", ","));
	std::vector<std::string> single{ "abc" };
	ASSERT_EQ (single, rnd::util::split ("abc", ","));
}

TEST (utility, sort_options_description)
{
	boost::program_options::options_description description;
	description.add_options () ("zeta", "") ("alpha", "") ("mid", "");
	boost::program_options::options_description sorted;
	rnd::util::sort_options_description (description, sorted);
	ASSERT_EQ (3, sorted.options ().size ());
	ASSERT_EQ ("alpha", sorted.options ()[0]->long_name ());
	ASSERT_EQ ("zeta", sorted.options ()[2]->long_name ());
}

TEST (utility, stacktrace)
{
	ASSERT_FALSE (rnd::generate_stacktrace ().empty ());
}

TEST (numbers, is_integer)
{
	ASSERT_TRUE (rnd::is_integer (3));
	ASSERT_TRUE (rnd::is_integer (3.0));
	ASSERT_TRUE (rnd::is_integer (-0.0));
	ASSERT_FALSE (rnd::is_integer (3.5));
	ASSERT_FALSE (rnd::is_integer (std::numeric_limits<double>::infinity ()));
	ASSERT_FALSE (rnd::is_integer (std::numeric_limits<double>::quiet_NaN ()));
}

TEST (numbers, to_count)
{
	ASSERT_EQ (5, rnd::to_count (5, rnd::error_sampling::invalid_count));
	ASSERT_EQ (5, rnd::to_count (5.0, rnd::error_sampling::invalid_count));
	ASSERT_EQ (0, rnd::to_count (0u, rnd::error_sampling::invalid_count));
	ASSERT_THROW (rnd::to_count (-1, rnd::error_sampling::invalid_count), rnd::range_error);
	ASSERT_THROW (rnd::to_count (1e300, rnd::error_sampling::invalid_count), rnd::range_error);
	ASSERT_THROW (rnd::to_count (0.5, rnd::error_sampling::invalid_length), rnd::type_error);
}

TEST (numbers, distance)
{
	ASSERT_EQ (10, rnd::distance (-5, 5));
	ASSERT_EQ (std::numeric_limits<uint64_t>::max (), rnd::distance (std::numeric_limits<int64_t>::min (), std::numeric_limits<int64_t>::max ()));
	ASSERT_EQ ((uint64_t{ 1 } << 53) - 1, rnd::safe_integer_max);
}
