#include <rnd/lib/sampler.hpp>
#include <rnd/lib/utility.hpp>

#include <numbers>

rnd::sampler::sampler (rnd::uniform_source & source_a, rnd::sampler_config const & config_a, rnd::logger & logger_a) :
	source{ source_a },
	config{ config_a },
	logger{ logger_a }
{
}

double rnd::sampler::random ()
{
	return source.next ();
}

double rnd::sampler::uniform (double min_a, double max_a)
{
	if (!std::isfinite (min_a) || !std::isfinite (max_a))
	{
		rnd::throw_error (rnd::error_sampling::not_finite);
	}
	if (min_a > max_a)
	{
		rnd::throw_error (rnd::error_sampling::min_greater_than_max);
	}
	auto const u = source.next ();
	auto const width = max_a - min_a;
	if (std::isfinite (width))
	{
		return u * width + min_a;
	}
	// The width overflows for bounds of opposite sign near the limits of double
	return u * max_a + (1.0 - u) * min_a;
}

double rnd::sampler::gauss (double mu_a, double sigma_a)
{
	if (!std::isfinite (mu_a) || !std::isfinite (sigma_a))
	{
		rnd::throw_error (rnd::error_sampling::not_finite);
	}
	if (sigma_a <= 0.0)
	{
		rnd::throw_error (rnd::error_sampling::non_positive_sigma);
	}

	{
		std::lock_guard<std::mutex> guard{ gaussian_mutex };
		if (cached_gaussian)
		{
			auto const value = *cached_gaussian;
			cached_gaussian.reset ();
			return value * sigma_a + mu_a;
		}
	}

	// The source is drawn without holding gaussian_mutex
	double u1;
	double u2;
	do
	{
		u1 = source.next ();
		u2 = source.next ();
	} while (u1 == 0.0); // log (0) is undefined

	auto const radius = std::sqrt (-2.0 * std::log (u1));
	auto const theta = 2.0 * std::numbers::pi * u2;
	auto const z0 = radius * std::cos (theta);
	auto const z1 = radius * std::sin (theta);

	if (config.gauss_cache)
	{
		std::lock_guard<std::mutex> guard{ gaussian_mutex };
		cached_gaussian = z1;
	}
	return z0 * sigma_a + mu_a;
}

void rnd::sampler::clear_cache ()
{
	std::lock_guard<std::mutex> guard{ gaussian_mutex };
	cached_gaussian.reset ();
}

bool rnd::sampler::has_cached_gaussian () const
{
	std::lock_guard<std::mutex> guard{ gaussian_mutex };
	return cached_gaussian.has_value ();
}

rnd::sampler_config const & rnd::sampler::get_config () const
{
	return config;
}

std::size_t rnd::sampler::weighted_index (std::vector<double> const & cumulative_a, double r_a)
{
	debug_assert (!cumulative_a.empty ());
	auto const position = std::lower_bound (cumulative_a.begin (), cumulative_a.end (), r_a);
	// The last entry is exactly 1 and r < 1, so the search never runs past the end
	return std::min (static_cast<std::size_t> (position - cumulative_a.begin ()), cumulative_a.size () - 1);
}

std::uint64_t rnd::sampler::next_index (std::uint64_t n_a)
{
	debug_assert (n_a > 0);
	auto const index = static_cast<std::uint64_t> (std::floor (source.next () * static_cast<double> (n_a)));
	// u * n can round up to n when n is close to 2^53
	return std::min (index, n_a - 1);
}

rnd::sampler & rnd::default_sampler ()
{
	static rnd::device_source source;
	static rnd::sampler sampler{ source };
	return sampler;
}
