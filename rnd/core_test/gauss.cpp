#include <rnd/lib/sampler.hpp>
#include <rnd/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

TEST (gauss, moments)
{
	rnd::device_source source;
	rnd::sampler sampler{ source };
	std::size_t const count = 20000;
	double sum = 0.0;
	double sum_squares = 0.0;
	for (std::size_t i = 0; i < count; ++i)
	{
		auto value = sampler.gauss ();
		sum += value;
		sum_squares += value * value;
	}
	auto mean = sum / count;
	auto variance = sum_squares / count - mean * mean;
	ASSERT_NEAR (0.0, mean, 0.1);
	ASSERT_NEAR (1.0, variance, 0.1);
}

TEST (gauss, scaled_moments)
{
	rnd::device_source source;
	rnd::sampler sampler{ source };
	std::size_t const count = 20000;
	double sum = 0.0;
	double sum_squares = 0.0;
	for (std::size_t i = 0; i < count; ++i)
	{
		auto value = sampler.gauss (10.0, 2.0);
		sum += value;
		sum_squares += value * value;
	}
	auto mean = sum / count;
	auto deviation = std::sqrt (sum_squares / count - mean * mean);
	ASSERT_NEAR (10.0, mean, 0.1);
	ASSERT_NEAR (2.0, deviation, 0.1);
}

/** Every second call consumes the cached deviate without drawing */
TEST (gauss, cache_draws)
{
	rnd::test::counting_source source;
	rnd::sampler sampler{ source };
	ASSERT_FALSE (sampler.has_cached_gaussian ());
	sampler.gauss ();
	ASSERT_EQ (2, source.draws ());
	ASSERT_TRUE (sampler.has_cached_gaussian ());
	sampler.gauss ();
	ASSERT_EQ (2, source.draws ());
	ASSERT_FALSE (sampler.has_cached_gaussian ());
	for (auto i = 0; i < 98; ++i)
	{
		sampler.gauss ();
	}
	ASSERT_EQ (100, source.draws ());
}

TEST (gauss, box_muller_pair)
{
	// The first pair has u1 = 0 and is drawn again
	rnd::test::scripted_source source{ { 0.0, 0.25, 0.5, 0.25 } };
	rnd::sampler sampler{ source };
	auto radius = std::sqrt (2.0 * std::log (2.0));
	ASSERT_NEAR (0.0, sampler.gauss (), 1e-12);
	ASSERT_EQ (4, source.draws ());
	ASSERT_NEAR (radius, sampler.gauss (), 1e-12);
	ASSERT_EQ (4, source.draws ());
	ASSERT_NEAR (3.0 + 2.0 * 0.0, sampler.gauss (3.0, 2.0), 1e-12);
}

TEST (gauss, cached_value_scaled_per_call)
{
	rnd::test::scripted_source source{ { 0.5, 0.25 } };
	rnd::sampler sampler{ source };
	auto radius = std::sqrt (2.0 * std::log (2.0));
	sampler.gauss (100.0, 5.0);
	ASSERT_NEAR (-1.0 + 2.0 * radius, sampler.gauss (-1.0, 2.0), 1e-12);
}

TEST (gauss, clear_cache)
{
	rnd::test::counting_source source;
	rnd::sampler sampler{ source };
	sampler.gauss ();
	ASSERT_TRUE (sampler.has_cached_gaussian ());
	sampler.clear_cache ();
	ASSERT_FALSE (sampler.has_cached_gaussian ());
	sampler.gauss ();
	ASSERT_EQ (4, source.draws ());
	sampler.clear_cache ();
	sampler.clear_cache ();
	ASSERT_FALSE (sampler.has_cached_gaussian ());
}

TEST (gauss, cache_disabled)
{
	rnd::test::counting_source source;
	rnd::sampler_config config;
	config.gauss_cache = false;
	rnd::sampler sampler{ source, config };
	for (auto i = 0; i < 10; ++i)
	{
		sampler.gauss ();
		ASSERT_FALSE (sampler.has_cached_gaussian ());
	}
	ASSERT_EQ (20, source.draws ());
}

namespace
{
/** Inspects the sampler it feeds on every draw */
class reentrant_source final : public rnd::uniform_source
{
public:
	double next () override
	{
		if (sampler != nullptr)
		{
			cached_during_draw = cached_during_draw || sampler->has_cached_gaussian ();
			sampler->clear_cache ();
		}
		return source.next ();
	}

	rnd::sampler * sampler{ nullptr };
	bool cached_during_draw{ false };

private:
	rnd::test::scripted_source source{ { 0.5, 0.25 } };
};
}

TEST (gauss, source_calls_back_into_sampler)
{
	reentrant_source source;
	rnd::sampler sampler{ source };
	source.sampler = &sampler;
	auto radius = std::sqrt (2.0 * std::log (2.0));
	ASSERT_NEAR (0.0, sampler.gauss (), 1e-12);
	ASSERT_FALSE (source.cached_during_draw);
	ASSERT_TRUE (sampler.has_cached_gaussian ());
	ASSERT_NEAR (radius, sampler.gauss (), 1e-12);
	ASSERT_FALSE (sampler.has_cached_gaussian ());
}

TEST (gauss, invalid)
{
	rnd::test::counting_source source;
	rnd::sampler sampler{ source };
	try
	{
		sampler.gauss (0.0, 0.0);
		FAIL () << "Expected range_error";
	}
	catch (rnd::range_error const & err)
	{
		ASSERT_EQ (err.code (), rnd::error_sampling::non_positive_sigma);
	}
	ASSERT_THROW (sampler.gauss (0.0, -1.0), rnd::range_error);
	ASSERT_THROW (sampler.gauss (std::numeric_limits<double>::quiet_NaN (), 1.0), rnd::range_error);
	ASSERT_THROW (sampler.gauss (0.0, std::numeric_limits<double>::infinity ()), rnd::range_error);
	ASSERT_EQ (0, source.draws ());
}
