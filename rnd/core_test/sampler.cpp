#include <rnd/lib/sampler.hpp>
#include <rnd/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <numeric>
#include <set>
#include <string>
#include <vector>

TEST (sampler, random_range)
{
	rnd::device_source source;
	rnd::sampler sampler{ source };
	for (auto i = 0; i < 1000; ++i)
	{
		auto value = sampler.random ();
		ASSERT_GE (value, 0.0);
		ASSERT_LT (value, 1.0);
	}
}

TEST (sampler, uniform)
{
	rnd::test::scripted_source source{ { 0.0, 0.5 } };
	rnd::sampler sampler{ source };
	ASSERT_EQ (2.0, sampler.uniform (2.0, 4.0));
	ASSERT_EQ (3.0, sampler.uniform (2.0, 4.0));
	ASSERT_EQ (5.0, sampler.uniform (5.0, 5.0));
}

TEST (sampler, uniform_full_double_range)
{
	rnd::test::scripted_source source{ { 0.0, 0.5, 0.999 } };
	rnd::sampler sampler{ source };
	auto const max = std::numeric_limits<double>::max ();
	ASSERT_EQ (-max, sampler.uniform (-max, max));
	ASSERT_EQ (0.0, sampler.uniform (-max, max));
	auto value = sampler.uniform (-max, max);
	ASSERT_TRUE (std::isfinite (value));
	ASSERT_GT (value, 0.0);
	ASSERT_LT (value, max);

	rnd::device_source device;
	rnd::sampler random_sampler{ device };
	for (auto i = 0; i < 1000; ++i)
	{
		auto sample = random_sampler.uniform (-max, max);
		ASSERT_TRUE (std::isfinite (sample));
		ASSERT_GE (sample, -max);
		ASSERT_LE (sample, max);
	}
}

TEST (sampler, uniform_invalid)
{
	rnd::test::scripted_source source{ { 0.5 } };
	rnd::sampler sampler{ source };
	ASSERT_THROW (sampler.uniform (4.0, 2.0), rnd::range_error);
	ASSERT_THROW (sampler.uniform (std::numeric_limits<double>::quiet_NaN (), 2.0), rnd::range_error);
	ASSERT_THROW (sampler.uniform (0.0, std::numeric_limits<double>::infinity ()), rnd::range_error);
	ASSERT_EQ (0, source.draws ());
}

TEST (sampler, randint_bounds)
{
	rnd::test::scripted_source source{ { 0.0, 0.999999, 0.5 } };
	rnd::sampler sampler{ source };
	ASSERT_EQ (1, sampler.randint (1, 6));
	ASSERT_EQ (6, sampler.randint (1, 6));
	ASSERT_EQ (4, sampler.randint (1, 6));
	ASSERT_EQ (7, sampler.randint (7, 7));
}

TEST (sampler, randint_negative)
{
	rnd::test::scripted_source source{ { 0.0, 0.999 } };
	rnd::sampler sampler{ source };
	ASSERT_EQ (-10, sampler.randint (-10, -5));
	ASSERT_EQ (-5, sampler.randint (-10, -5));
}

TEST (sampler, randint_full_width)
{
	rnd::test::scripted_source source{ { 0.0, 0.999 } };
	rnd::sampler sampler{ source };
	ASSERT_EQ (-128, sampler.randint<int8_t> (-128, 127));
	ASSERT_EQ (127, sampler.randint<int8_t> (-128, 127));
}

TEST (sampler, randint_distribution)
{
	rnd::device_source source;
	rnd::sampler sampler{ source };
	std::vector<std::size_t> counts (6, 0);
	for (auto i = 0; i < 60000; ++i)
	{
		auto value = sampler.randint (1, 6);
		ASSERT_GE (value, 1);
		ASSERT_LE (value, 6);
		++counts[value - 1];
	}
	// 5 degrees of freedom, p = 0.0001
	ASSERT_LT (rnd::test::chi_square (counts), 25.74);
}

TEST (sampler, randint_floating_arguments)
{
	rnd::test::scripted_source source{ { 0.5 } };
	rnd::sampler sampler{ source };
	ASSERT_EQ (2.0, sampler.randint (1.0, 3.0));
	ASSERT_THROW (sampler.randint (1.5, 3.0), rnd::type_error);
	ASSERT_THROW (sampler.randint (1.0, std::numeric_limits<double>::infinity ()), rnd::type_error);
}

TEST (sampler, randint_invalid)
{
	rnd::test::scripted_source source{ { 0.5 } };
	rnd::sampler sampler{ source };
	try
	{
		sampler.randint (6, 1);
		FAIL () << "Expected range_error";
	}
	catch (rnd::range_error const & err)
	{
		ASSERT_EQ (err.code (), rnd::error_sampling::min_greater_than_max);
	}
	ASSERT_THROW (sampler.randint (std::numeric_limits<int64_t>::min (), std::numeric_limits<int64_t>::max ()), rnd::range_error);
	ASSERT_THROW (sampler.randint (int64_t{ 0 }, static_cast<int64_t> (rnd::safe_integer_max)), rnd::range_error);
	ASSERT_NO_THROW (sampler.randint (int64_t{ 0 }, static_cast<int64_t> (rnd::safe_integer_max) - 1));
	ASSERT_EQ (1, source.draws ());
}

TEST (sampler, randrange_stop)
{
	rnd::test::scripted_source source{ { 0.0, 0.95 } };
	rnd::sampler sampler{ source };
	ASSERT_EQ (0, sampler.randrange (10));
	ASSERT_EQ (9, sampler.randrange (10));
}

TEST (sampler, randrange_step)
{
	rnd::test::scripted_source source{ { 0.0, 0.3, 0.99 } };
	rnd::sampler sampler{ source };
	// 0, 3, 6, 9
	ASSERT_EQ (0, sampler.randrange (0, 10, 3));
	ASSERT_EQ (3, sampler.randrange (0, 10, 3));
	ASSERT_EQ (9, sampler.randrange (0, 10, 3));
}

TEST (sampler, randrange_negative_step)
{
	rnd::test::scripted_source source{ { 0.0, 0.99 } };
	rnd::sampler sampler{ source };
	// 10, 7, 4, 1
	ASSERT_EQ (10, sampler.randrange (10, 0, -3));
	ASSERT_EQ (1, sampler.randrange (10, 0, -3));
}

TEST (sampler, randrange_floating)
{
	rnd::test::scripted_source source{ { 0.99 } };
	rnd::sampler sampler{ source };
	ASSERT_EQ (9.0, sampler.randrange (0.0, 10.0, 3.0));
	ASSERT_EQ (1.0, sampler.randrange (10.0, 0.0, -3.0));
	ASSERT_THROW (sampler.randrange (0.5), rnd::type_error);
}

TEST (sampler, randrange_values)
{
	rnd::device_source source;
	rnd::sampler sampler{ source };
	std::set<int> seen;
	for (auto i = 0; i < 1000; ++i)
	{
		auto value = sampler.randrange (2, 20, 4);
		ASSERT_EQ (2, value % 4);
		ASSERT_GE (value, 2);
		ASSERT_LT (value, 20);
		seen.insert (value);
	}
	ASSERT_EQ (5, seen.size ());
}

TEST (sampler, randrange_invalid)
{
	rnd::test::scripted_source source{ { 0.5 } };
	rnd::sampler sampler{ source };
	try
	{
		sampler.randrange (0, 10, 0);
		FAIL () << "Expected range_error";
	}
	catch (rnd::range_error const & err)
	{
		ASSERT_EQ (err.code (), rnd::error_sampling::zero_step);
	}
	ASSERT_THROW (sampler.randrange (5, 5), rnd::range_error);
	ASSERT_THROW (sampler.randrange (0), rnd::range_error);
	ASSERT_THROW (sampler.randrange (0, 10, -1), rnd::range_error);
	ASSERT_THROW (sampler.randrange (10, 0), rnd::range_error);
	ASSERT_EQ (0, source.draws ());
}

TEST (sampler, choice)
{
	rnd::test::scripted_source source{ { 0.0, 0.99, 0.5 } };
	rnd::sampler sampler{ source };
	std::vector<std::string> items{ "a", "b", "c" };
	ASSERT_EQ ("a", sampler.choice (items));
	ASSERT_EQ ("c", sampler.choice (items));
	ASSERT_EQ ("b", sampler.choice (items));
}

TEST (sampler, choice_containers)
{
	rnd::test::scripted_source source{ { 0.0 } };
	rnd::sampler sampler{ source };
	std::array<int, 3> array{ 4, 5, 6 };
	ASSERT_EQ (4, sampler.choice (array));
	ASSERT_EQ ('x', sampler.choice (std::string ("xyz")));
	ASSERT_EQ (7, sampler.choice ({ 7, 8, 9 }));
}

TEST (sampler, choice_empty)
{
	rnd::test::scripted_source source{ { 0.5 } };
	rnd::sampler sampler{ source };
	std::vector<int> empty;
	try
	{
		sampler.choice (empty);
		FAIL () << "Expected range_error";
	}
	catch (rnd::range_error const & err)
	{
		ASSERT_EQ (err.code (), rnd::error_sampling::empty_sequence);
	}
}

TEST (sampler, shuffle_scripted)
{
	rnd::test::scripted_source source{ { 0.0 } };
	rnd::sampler sampler{ source };
	std::vector<int> items{ 1, 2, 3, 4 };
	sampler.shuffle (items);
	std::vector<int> expected{ 2, 3, 4, 1 };
	ASSERT_EQ (expected, items);
	ASSERT_EQ (3, source.draws ());
}

TEST (sampler, shuffle_permutation)
{
	rnd::device_source source;
	rnd::sampler sampler{ source };
	std::vector<int> items (100);
	std::iota (items.begin (), items.end (), 0);
	auto original = items;
	sampler.shuffle (items);
	ASSERT_TRUE (std::is_permutation (items.begin (), items.end (), original.begin ()));
}

TEST (sampler, shuffle_small)
{
	rnd::test::counting_source source;
	rnd::sampler sampler{ source };
	std::vector<int> empty;
	sampler.shuffle (empty);
	ASSERT_TRUE (empty.empty ());
	std::vector<int> one{ 42 };
	sampler.shuffle (one);
	ASSERT_EQ (42, one[0]);
	ASSERT_EQ (0, source.draws ());
}

TEST (sampler, shuffle_uniform)
{
	rnd::device_source source;
	rnd::sampler sampler{ source };
	std::map<std::array<int, 3>, std::size_t> counts;
	for (auto i = 0; i < 60000; ++i)
	{
		std::array<int, 3> items{ 1, 2, 3 };
		sampler.shuffle (items);
		++counts[items];
	}
	ASSERT_EQ (6, counts.size ());
	std::vector<std::size_t> observed;
	for (auto const & [permutation, count] : counts)
	{
		observed.push_back (count);
	}
	// 5 degrees of freedom, p = 0.0001
	ASSERT_LT (rnd::test::chi_square (observed), 25.74);
}

TEST (sampler, sample_distinct)
{
	rnd::device_source source;
	rnd::sampler sampler{ source };
	std::vector<int> population (20);
	std::iota (population.begin (), population.end (), 100);
	for (auto k : { 0, 1, 5, 10, 11, 19, 20 })
	{
		auto result = sampler.sample (population, k);
		ASSERT_EQ (k, result.size ());
		std::set<int> unique (result.begin (), result.end ());
		ASSERT_EQ (k, unique.size ());
		for (auto value : result)
		{
			ASSERT_GE (value, 100);
			ASSERT_LT (value, 120);
		}
	}
}

TEST (sampler, sample_rejection)
{
	rnd::test::scripted_source source{ { 0.0, 0.0, 0.5 } };
	rnd::sampler sampler{ source };
	std::vector<int> population (100);
	std::iota (population.begin (), population.end (), 0);
	auto result = sampler.sample (population, 2);
	std::vector<int> expected{ 0, 50 };
	ASSERT_EQ (expected, result);
	ASSERT_EQ (3, source.draws ());
}

TEST (sampler, sample_shuffle)
{
	rnd::test::counting_source source;
	rnd::sampler sampler{ source };
	std::vector<int> population (10);
	std::iota (population.begin (), population.end (), 0);
	auto result = sampler.sample (population, 10);
	ASSERT_TRUE (std::is_permutation (result.begin (), result.end (), population.begin ()));
	ASSERT_EQ (9, source.draws ());
}

TEST (sampler, sample_ratio_config)
{
	std::vector<int> population{ 1, 2, 3, 4 };
	{
		rnd::test::counting_source source;
		rnd::sampler_config config;
		config.sample_shuffle_ratio = 0.0;
		rnd::sampler sampler{ source, config };
		ASSERT_EQ (1, sampler.sample (population, 1).size ());
		ASSERT_EQ (3, source.draws ());
	}
	{
		rnd::test::scripted_source source{ { 0.0, 0.25, 0.5, 0.75 } };
		rnd::sampler_config config;
		config.sample_shuffle_ratio = 1.0;
		rnd::sampler sampler{ source, config };
		auto result = sampler.sample (population, 4);
		ASSERT_EQ (population, result);
		ASSERT_EQ (4, source.draws ());
	}
}

TEST (sampler, sample_invalid)
{
	rnd::test::scripted_source source{ { 0.5 } };
	rnd::sampler sampler{ source };
	std::vector<int> population{ 1, 2, 3 };
	try
	{
		sampler.sample (population, 4);
		FAIL () << "Expected range_error";
	}
	catch (rnd::range_error const & err)
	{
		ASSERT_EQ (err.code (), rnd::error_sampling::sample_too_large);
	}
	ASSERT_THROW (sampler.sample (population, -1), rnd::range_error);
	ASSERT_THROW (sampler.sample (population, 1.5), rnd::range_error);
	ASSERT_EQ (2, sampler.sample (population, 2.0).size ());
	std::vector<int> empty;
	ASSERT_TRUE (sampler.sample (empty, 0).empty ());
}

TEST (sampler, choices_uniform)
{
	rnd::device_source source;
	rnd::sampler sampler{ source };
	std::vector<std::string> population{ "x", "y" };
	auto result = sampler.choices (population, 50);
	ASSERT_EQ (50, result.size ());
	for (auto const & value : result)
	{
		ASSERT_TRUE (value == "x" || value == "y");
	}
	ASSERT_EQ (1, sampler.choices (population).size ());
	ASSERT_TRUE (sampler.choices (population, 0).empty ());
}

TEST (sampler, choices_weighted_scripted)
{
	rnd::test::scripted_source source{ { 0.2, 0.25, 0.3, 0.0 } };
	rnd::sampler sampler{ source };
	std::vector<char> population{ 'a', 'b' };
	std::vector<double> weights{ 1.0, 3.0 };
	auto result = sampler.choices (population, weights, 4);
	std::vector<char> expected{ 'a', 'a', 'b', 'a' };
	ASSERT_EQ (expected, result);
}

TEST (sampler, choices_zero_weight)
{
	rnd::test::scripted_source source{ { 0.1, 0.5, 0.9 } };
	rnd::sampler sampler{ source };
	std::vector<int> population{ 1, 2, 3 };
	std::vector<int> weights{ 0, 5, 0 };
	auto result = sampler.choices (population, weights, 3);
	std::vector<int> expected{ 2, 2, 2 };
	ASSERT_EQ (expected, result);
}

TEST (sampler, choices_weighted_frequencies)
{
	rnd::device_source source;
	rnd::sampler sampler{ source };
	std::vector<int> population{ 0, 1, 2 };
	std::vector<double> weights{ 1.0, 2.0, 7.0 };
	auto result = sampler.choices (population, weights, 10000);
	std::array<std::size_t, 3> counts{};
	for (auto value : result)
	{
		++counts[value];
	}
	ASSERT_NEAR (0.1, counts[0] / 10000.0, 0.03);
	ASSERT_NEAR (0.2, counts[1] / 10000.0, 0.03);
	ASSERT_NEAR (0.7, counts[2] / 10000.0, 0.03);
}

TEST (sampler, choices_invalid)
{
	rnd::test::scripted_source source{ { 0.5 } };
	rnd::sampler sampler{ source };
	std::vector<int> population{ 1, 2, 3 };
	std::vector<int> empty;
	auto expect_error = [&] (auto && call, rnd::error_sampling expected) {
		try
		{
			call ();
			FAIL () << "Expected range_error";
		}
		catch (rnd::range_error const & err)
		{
			ASSERT_EQ (err.code (), expected);
		}
	};
	expect_error ([&] { sampler.choices (empty, 1); }, rnd::error_sampling::empty_sequence);
	expect_error ([&] { sampler.choices (population, -1); }, rnd::error_sampling::invalid_count);
	expect_error ([&] { sampler.choices (population, std::vector<double>{ 1.0, 2.0 }); }, rnd::error_sampling::weights_length_mismatch);
	expect_error ([&] { sampler.choices (population, std::vector<double>{ 1.0, -1.0, 2.0 }); }, rnd::error_sampling::invalid_weight);
	expect_error ([&] { sampler.choices (population, std::vector<double>{ 1.0, std::numeric_limits<double>::quiet_NaN (), 2.0 }); }, rnd::error_sampling::invalid_weight);
	expect_error ([&] { sampler.choices (population, std::vector<double>{ 1.0, std::numeric_limits<double>::infinity (), 2.0 }); }, rnd::error_sampling::invalid_weight);
	expect_error ([&] { sampler.choices (population, std::vector<double>{ 0.0, 0.0, 0.0 }); }, rnd::error_sampling::weight_sum_not_positive);
	auto max = std::numeric_limits<double>::max ();
	expect_error ([&] { sampler.choices (population, std::vector<double>{ max, max, max }); }, rnd::error_sampling::invalid_weight);
	ASSERT_EQ (0, source.draws ());
}

TEST (sampler, cumulative_distribution)
{
	std::vector<double> weights{ 1.0, 1.0, 2.0 };
	auto cumulative = rnd::sampler::cumulative_distribution (weights, 4.0);
	ASSERT_EQ (3, cumulative.size ());
	ASSERT_DOUBLE_EQ (0.25, cumulative[0]);
	ASSERT_DOUBLE_EQ (0.5, cumulative[1]);
	ASSERT_EQ (1.0, cumulative[2]);
	ASSERT_TRUE (std::is_sorted (cumulative.begin (), cumulative.end ()));
}

TEST (sampler, cumulative_distribution_rounding)
{
	std::vector<double> weights (10, 0.1);
	auto cumulative = rnd::sampler::cumulative_distribution (weights, 1.0);
	ASSERT_EQ (1.0, cumulative.back ());
	ASSERT_TRUE (std::is_sorted (cumulative.begin (), cumulative.end ()));
}

TEST (sampler, weighted_index)
{
	std::vector<double> cumulative{ 0.0, 0.5, 0.5, 1.0 };
	// Leftmost entry not less than r
	ASSERT_EQ (0, rnd::sampler::weighted_index (cumulative, 0.0));
	ASSERT_EQ (1, rnd::sampler::weighted_index (cumulative, 0.25));
	ASSERT_EQ (1, rnd::sampler::weighted_index (cumulative, 0.5));
	ASSERT_EQ (3, rnd::sampler::weighted_index (cumulative, 0.75));
	ASSERT_EQ (3, rnd::sampler::weighted_index (cumulative, 1.0));

	// A leading zero weight is only reachable by r = 0
	std::vector<double> leading_zero{ 0.0, 1.0 };
	ASSERT_EQ (0, rnd::sampler::weighted_index (leading_zero, 0.0));
	ASSERT_EQ (1, rnd::sampler::weighted_index (leading_zero, std::numeric_limits<double>::denorm_min ()));
}

TEST (sampler, default_sampler)
{
	auto & sampler = rnd::default_sampler ();
	ASSERT_EQ (&sampler, &rnd::default_sampler ());
	auto value = sampler.randint (1, 3);
	ASSERT_GE (value, 1);
	ASSERT_LE (value, 3);
}
