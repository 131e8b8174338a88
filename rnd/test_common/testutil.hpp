#pragma once

#include <rnd/lib/random.hpp>
#include <rnd/lib/secure_sampler.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <vector>

#define GTEST_TEST_ERROR_CODE(expression, text, actual, expected, fail)                       \
	GTEST_AMBIGUOUS_ELSE_BLOCKER_                                                             \
	if (const ::testing::AssertionResult gtest_ar_ = ::testing::AssertionResult (expression)) \
		;                                                                                     \
	else                                                                                      \
		fail (::testing::internal::GetBoolAssertionFailureMessage (                           \
		gtest_ar_, text, actual, expected)                                                    \
			  .c_str ())

/** Extends gtest with a std::error_code assert that prints the error code message when non-zero */
#define ASSERT_NO_ERROR(condition)                                                      \
	GTEST_TEST_ERROR_CODE (!(condition), #condition, condition.message ().c_str (), "", \
	GTEST_FATAL_FAILURE_)

/** Extends gtest with a std::error_code assert that prints the error code message when non-zero */
#define EXPECT_NO_ERROR(condition)                                                      \
	GTEST_TEST_ERROR_CODE (!(condition), #condition, condition.message ().c_str (), "", \
	GTEST_NONFATAL_FAILURE_)

/** Extends gtest with a std::error_code assert that expects an error */
#define ASSERT_IS_ERROR(condition)                                                             \
	GTEST_TEST_ERROR_CODE ((condition.value () != 0), #condition, "An error was expected", "", \
	GTEST_FATAL_FAILURE_)

/** Extends gtest with a std::error_code assert that expects an error */
#define EXPECT_IS_ERROR(condition)                                                             \
	GTEST_TEST_ERROR_CODE ((condition.value () != 0), #condition, "An error was expected", "", \
	GTEST_NONFATAL_FAILURE_)

namespace rnd::test
{
/** Replays a fixed list of values, starting over once the end is reached */
class scripted_source final : public rnd::uniform_source
{
public:
	explicit scripted_source (std::vector<double> values_a);

	double next () override;

	std::size_t draws () const;

private:
	std::vector<double> values;
	std::size_t position{ 0 };
};

/** Counts draws taken from a rnd::device_source */
class counting_source final : public rnd::uniform_source
{
public:
	double next () override;

	std::size_t draws () const;

private:
	rnd::device_source source;
	std::atomic<std::size_t> count{ 0 };
};

/**
 * Replays a fixed list of bytes, starting over once the end is reached.
 * With no bytes it behaves as an environment without a secure source.
 */
class scripted_secure_source final : public rnd::secure_source
{
public:
	explicit scripted_secure_source (std::vector<std::uint8_t> bytes_a);

	void generate_block (std::uint8_t * output, std::size_t size) override;

	/** Number of bytes handed out so far */
	std::size_t consumed () const;

private:
	std::vector<std::uint8_t> bytes;
	std::size_t position{ 0 };
};

/** Pearson's chi-square statistic of \p observed counts against a uniform expectation */
double chi_square (std::vector<std::size_t> const & observed);

class cout_redirect
{
public:
	cout_redirect (std::streambuf * new_buffer)
	{
		std::cout.rdbuf (new_buffer);
	}

	~cout_redirect ()
	{
		std::cout.rdbuf (old);
	}

private:
	std::streambuf * old{ std::cout.rdbuf () };
};
}
