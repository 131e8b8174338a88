#include <rnd/lib/secure_sampler.hpp>
#include <rnd/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

TEST (secure_sampler, randint_scripted)
{
	rnd::test::scripted_secure_source source{ { 0, 0, 0, 5 } };
	rnd::secure_sampler sampler{ source };
	ASSERT_EQ (5, sampler.randint (0, 9));
	ASSERT_EQ (15, sampler.randint (10, 20));
	ASSERT_EQ (8, source.consumed ());
}

TEST (secure_sampler, big_endian_word)
{
	rnd::test::scripted_secure_source source{ { 0x01, 0x02, 0x03, 0x04 } };
	rnd::secure_sampler sampler{ source };
	ASSERT_EQ (0x01020304u, sampler.randint<uint32_t> (0, std::numeric_limits<uint32_t>::max ()));
}

TEST (secure_sampler, rejection_bound)
{
	ASSERT_EQ (4294967295u, rnd::secure_sampler::rejection_bound (3));
	ASSERT_EQ (4294967290u, rnd::secure_sampler::rejection_bound (10));
	ASSERT_EQ (uint64_t{ 1 } << 32, rnd::secure_sampler::rejection_bound (1));
	ASSERT_EQ (uint64_t{ 1 } << 32, rnd::secure_sampler::rejection_bound (uint64_t{ 1 } << 32));
	ASSERT_EQ (uint64_t{ 1 } << 32, rnd::secure_sampler::rejection_bound (256));
}

/** A word at or above the largest multiple of the range is drawn again */
TEST (secure_sampler, rejects_biased_words)
{
	rnd::test::scripted_secure_source source{ { 0xff, 0xff, 0xff, 0xff, 0x00, 0x00, 0x00, 0x07 } };
	rnd::secure_sampler sampler{ source };
	ASSERT_EQ (1, sampler.randint (0, 2));
	ASSERT_EQ (8, source.consumed ());
}

TEST (secure_sampler, accepts_below_bound)
{
	// 0xfffffffe is the largest accepted word for a range of 3
	rnd::test::scripted_secure_source source{ { 0xff, 0xff, 0xff, 0xfe } };
	rnd::secure_sampler sampler{ source };
	ASSERT_EQ (2, sampler.randint (0, 2));
	ASSERT_EQ (4, source.consumed ());
}

TEST (secure_sampler, randint_range_limits)
{
	rnd::test::scripted_secure_source source{ { 0xff, 0xff, 0xff, 0xff } };
	rnd::secure_sampler sampler{ source };
	ASSERT_EQ ((int64_t{ 1 } << 32) - 1, sampler.randint (int64_t{ 0 }, (int64_t{ 1 } << 32) - 1));
	try
	{
		sampler.randint (int64_t{ 0 }, int64_t{ 1 } << 32);
		FAIL () << "Expected range_error";
	}
	catch (rnd::range_error const & err)
	{
		ASSERT_EQ (err.code (), rnd::error_sampling::range_too_large);
	}
	ASSERT_EQ (4, source.consumed ());
}

TEST (secure_sampler, randint_invalid)
{
	rnd::test::scripted_secure_source source{ { 0, 0, 0, 0 } };
	rnd::secure_sampler sampler{ source };
	ASSERT_THROW (sampler.randint (5, 1), rnd::range_error);
	ASSERT_THROW (sampler.randint (0.5, 2.0), rnd::type_error);
	ASSERT_EQ (1.0, sampler.randint (1.0, 2.0));
	ASSERT_EQ (4, source.consumed ());
}

TEST (secure_sampler, randint_bounds)
{
	rnd::os_secure_source source;
	rnd::secure_sampler sampler{ source };
	for (auto i = 0; i < 1000; ++i)
	{
		auto value = sampler.randint (-3, 3);
		ASSERT_GE (value, -3);
		ASSERT_LE (value, 3);
	}
}

TEST (secure_sampler, randint_no_modulo_bias)
{
	rnd::os_secure_source source;
	rnd::secure_sampler sampler{ source };
	std::vector<std::size_t> counts (3, 0);
	for (auto i = 0; i < 30000; ++i)
	{
		++counts[sampler.randint (0, 2)];
	}
	// 2 degrees of freedom, p = 0.0001
	ASSERT_LT (rnd::test::chi_square (counts), 18.42);
}

TEST (secure_sampler, choice)
{
	rnd::test::scripted_secure_source source{ { 0, 0, 0, 1 } };
	rnd::secure_sampler sampler{ source };
	std::vector<std::string> items{ "a", "b", "c" };
	ASSERT_EQ ("b", sampler.choice (items));
	ASSERT_EQ ('y', sampler.choice (std::string ("xyz")));
	ASSERT_EQ (2, sampler.choice ({ 1, 2 }));
}

TEST (secure_sampler, choice_empty)
{
	rnd::test::scripted_secure_source source{ { 0 } };
	rnd::secure_sampler sampler{ source };
	std::vector<int> empty;
	ASSERT_THROW (sampler.choice (empty), rnd::range_error);
	ASSERT_EQ (0, source.consumed ());
}

TEST (secure_sampler, bytes)
{
	rnd::os_secure_source source;
	rnd::secure_sampler sampler{ source };
	auto first = sampler.bytes (16);
	auto second = sampler.bytes (16);
	ASSERT_EQ (16, first.size ());
	ASSERT_EQ (16, second.size ());
	ASSERT_NE (first, second);
	ASSERT_TRUE (sampler.bytes (0).empty ());
	ASSERT_EQ (3, sampler.bytes (3.0).size ());
}

TEST (secure_sampler, bytes_scripted)
{
	rnd::test::scripted_secure_source source{ { 9, 8, 7 } };
	rnd::secure_sampler sampler{ source };
	std::vector<uint8_t> expected{ 9, 8, 7, 9 };
	ASSERT_EQ (expected, sampler.bytes (4));
}

TEST (secure_sampler, bytes_invalid)
{
	rnd::test::scripted_secure_source source{ { 1 } };
	rnd::secure_sampler sampler{ source };
	try
	{
		sampler.bytes (-1);
		FAIL () << "Expected type_error";
	}
	catch (rnd::type_error const & err)
	{
		ASSERT_EQ (err.code (), rnd::error_sampling::invalid_length);
	}
	ASSERT_THROW (sampler.bytes (2.5), rnd::type_error);
	ASSERT_EQ (0, source.consumed ());
}

TEST (secure_sampler, unavailable)
{
	rnd::test::scripted_secure_source source{ std::vector<uint8_t>{} };
	rnd::secure_sampler sampler{ source };
	try
	{
		sampler.randint (0, 10);
		FAIL () << "Expected unavailable_error";
	}
	catch (rnd::unavailable_error const & err)
	{
		ASSERT_EQ (err.code (), rnd::error_source::unavailable);
	}
	ASSERT_THROW (sampler.bytes (4), rnd::unavailable_error);
	std::vector<int> items{ 1, 2 };
	ASSERT_THROW (sampler.choice (items), rnd::unavailable_error);
	// Validation still precedes the source
	ASSERT_THROW (sampler.randint (10, 0), rnd::range_error);
}

TEST (secure_sampler, default_secure_sampler)
{
	auto & sampler = rnd::default_secure_sampler ();
	ASSERT_EQ (&sampler, &rnd::default_secure_sampler ());
	ASSERT_EQ (8, sampler.bytes (8).size ());
}
