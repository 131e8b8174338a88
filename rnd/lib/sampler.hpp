#pragma once

#include <rnd/lib/errors.hpp>
#include <rnd/lib/logging.hpp>
#include <rnd/lib/numbers.hpp>
#include <rnd/lib/random.hpp>
#include <rnd/lib/sampler_config.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <mutex>
#include <numeric>
#include <optional>
#include <ranges>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace rnd
{
/**
 * Python style sampling helpers over a uniform [0, 1) source.
 * Not safe for any crypto related code, see rnd::secure_sampler.
 *
 * Validation failures throw rnd::type_error when an argument has the wrong kind (a non-integer
 * where an integer is required) and rnd::range_error when its value is out of the allowed domain.
 * Validation always completes before the source is drawn from or any argument is modified.
 */
class sampler final
{
public:
	explicit sampler (rnd::uniform_source & source_a, rnd::sampler_config const & config_a = rnd::sampler_config{}, rnd::logger & logger_a = rnd::default_logger ());

	sampler (sampler const &) = delete;
	sampler & operator= (sampler const &) = delete;

	/** Returns a double in [0, 1) */
	double random ();

	/** Returns a double in [min, max) */
	double uniform (double min_a, double max_a);

	/**
	 * Returns an integer uniformly distributed over [min, max], both inclusive
	 * @throws rnd::type_error if an argument is not an integer
	 * @throws rnd::range_error if min > max or the range holds more than 2^53 - 1 values
	 */
	template <rnd::number T>
	T randint (T min_a, T max_a)
	{
		if (!rnd::is_integer (min_a) || !rnd::is_integer (max_a))
		{
			rnd::throw_error (rnd::error_sampling::not_integer);
		}
		if (min_a > max_a)
		{
			rnd::throw_error (rnd::error_sampling::min_greater_than_max);
		}
		if constexpr (std::is_floating_point_v<T>)
		{
			auto range = static_cast<double> (max_a) - static_cast<double> (min_a) + 1.0;
			if (range > static_cast<double> (rnd::safe_integer_max))
			{
				rnd::throw_error (rnd::error_sampling::range_too_large);
			}
			return static_cast<T> (static_cast<double> (next_index (static_cast<std::uint64_t> (range))) + static_cast<double> (min_a));
		}
		else
		{
			auto width = rnd::distance (min_a, max_a);
			if (width >= rnd::safe_integer_max)
			{
				rnd::throw_error (rnd::error_sampling::range_too_large);
			}
			return static_cast<T> (static_cast<std::uint64_t> (min_a) + next_index (width + 1));
		}
	}

	/** Returns an integer from [0, stop) */
	template <rnd::number T>
	T randrange (T stop_a)
	{
		return randrange (T{ 0 }, stop_a, T{ 1 });
	}

	/**
	 * Returns a randomly selected element of the progression start, start + step, ... excluding stop
	 * @throws rnd::type_error if an argument is not an integer
	 * @throws rnd::range_error if step is zero or the progression is empty
	 */
	template <rnd::number T>
	T randrange (T start_a, T stop_a, T step_a = T{ 1 })
	{
		if (!rnd::is_integer (start_a) || !rnd::is_integer (stop_a) || !rnd::is_integer (step_a))
		{
			rnd::throw_error (rnd::error_sampling::not_integer);
		}
		if (step_a == T{ 0 })
		{
			rnd::throw_error (rnd::error_sampling::zero_step);
		}
		auto const descending = rnd::is_negative (step_a);
		if ((!descending && !(start_a < stop_a)) || (descending && !(stop_a < start_a)))
		{
			rnd::throw_error (rnd::error_sampling::empty_range);
		}
		if constexpr (std::is_floating_point_v<T>)
		{
			auto const width = static_cast<double> (stop_a) - static_cast<double> (start_a);
			auto const step = static_cast<double> (step_a);
			auto const count = std::floor ((width + step - (descending ? -1.0 : 1.0)) / step);
			if (count <= 0.0)
			{
				rnd::throw_error (rnd::error_sampling::empty_range);
			}
			if (count > static_cast<double> (rnd::safe_integer_max))
			{
				rnd::throw_error (rnd::error_sampling::range_too_large);
			}
			auto const index = next_index (static_cast<std::uint64_t> (count));
			return static_cast<T> (static_cast<double> (start_a) + static_cast<double> (index) * step);
		}
		else
		{
			// Unsigned arithmetic, exact for every start/stop/step of T
			auto const width = descending ? rnd::distance (stop_a, start_a) : rnd::distance (start_a, stop_a);
			auto const step = descending ? std::uint64_t{ 0 } - static_cast<std::uint64_t> (step_a) : static_cast<std::uint64_t> (step_a);
			auto const count = width / step + (width % step != 0 ? 1 : 0);
			if (count > rnd::safe_integer_max)
			{
				rnd::throw_error (rnd::error_sampling::range_too_large);
			}
			auto const index = next_index (count);
			return static_cast<T> (static_cast<std::uint64_t> (start_a) + index * static_cast<std::uint64_t> (step_a));
		}
	}

	/**
	 * Returns one element of \p seq, each position equally likely
	 * @throws rnd::range_error if \p seq is empty
	 */
	template <rnd::sequence R>
	std::ranges::range_value_t<R const> choice (R const & seq_a)
	{
		auto const size = std::ranges::size (seq_a);
		if (size == 0)
		{
			rnd::throw_error (rnd::error_sampling::empty_sequence);
		}
		return std::ranges::begin (seq_a)[static_cast<std::ranges::range_difference_t<R const>> (next_index (size))];
	}

	template <typename T>
	T choice (std::initializer_list<T> seq_a)
	{
		return choice<std::initializer_list<T>> (seq_a);
	}

	/**
	 * Returns \p k elements from distinct positions of \p population, drawn without replacement
	 * @throws rnd::range_error if k is not a non-negative integer or exceeds the population size
	 */
	template <rnd::sequence R, rnd::number K>
	std::vector<std::ranges::range_value_t<R const>> sample (R const & population_a, K k_a)
	{
		auto const count = rnd::to_count (k_a, rnd::error_sampling::invalid_count);
		auto const size = static_cast<std::size_t> (std::ranges::size (population_a));
		if (count > size)
		{
			rnd::throw_error (rnd::error_sampling::sample_too_large);
		}

		auto const first = std::ranges::begin (population_a);
		std::vector<std::ranges::range_value_t<R const>> result;
		if (static_cast<double> (count) > static_cast<double> (size) * config.sample_shuffle_ratio)
		{
			// Most of the population is kept, shuffling a copy is cheaper than rejecting repeated indices
			logger.debug (rnd::log::type::sampler, "Sampling {} of {} elements by shuffling", count, size);
			result.reserve (size);
			std::ranges::copy (population_a, std::back_inserter (result));
			shuffle (result);
			result.erase (result.begin () + static_cast<std::ptrdiff_t> (count), result.end ());
		}
		else
		{
			logger.debug (rnd::log::type::sampler, "Sampling {} of {} elements by index rejection", count, size);
			std::unordered_set<std::uint64_t> selected;
			result.reserve (count);
			while (result.size () < count)
			{
				auto const index = next_index (size);
				if (selected.insert (index).second)
				{
					result.push_back (first[static_cast<std::ranges::range_difference_t<R const>> (index)]);
				}
			}
		}
		return result;
	}

	/**
	 * Permutes \p seq in place (Fisher-Yates), every permutation equally likely
	 */
	template <std::ranges::random_access_range R>
		requires std::ranges::sized_range<R> && std::permutable<std::ranges::iterator_t<R>>
	void shuffle (R && seq_a)
	{
		auto const size = static_cast<std::uint64_t> (std::ranges::size (seq_a));
		auto const first = std::ranges::begin (seq_a);
		using difference = std::ranges::range_difference_t<R>;
		for (auto i = size; i > 1; --i)
		{
			auto const j = next_index (i);
			std::ranges::iter_swap (first + static_cast<difference> (i - 1), first + static_cast<difference> (j));
		}
	}

	/**
	 * Returns \p k elements of \p population drawn independently with replacement, uniformly
	 * @throws rnd::range_error if the population is empty or k is not a non-negative integer
	 */
	template <rnd::sequence R, rnd::number K = int>
	std::vector<std::ranges::range_value_t<R const>> choices (R const & population_a, K k_a = 1)
	{
		if (std::ranges::empty (population_a))
		{
			rnd::throw_error (rnd::error_sampling::empty_sequence);
		}
		auto const count = rnd::to_count (k_a, rnd::error_sampling::invalid_count);
		std::vector<std::ranges::range_value_t<R const>> result;
		result.reserve (count);
		for (std::size_t i = 0; i < count; ++i)
		{
			result.push_back (choice (population_a));
		}
		return result;
	}

	/**
	 * Returns \p k elements of \p population drawn independently with replacement,
	 * element i being selected with probability weights[i] / sum (weights)
	 * @throws rnd::range_error on an empty population, a count that is not a non-negative integer,
	 * a weights/population size mismatch, a negative or non-finite weight or a weight sum that is not positive
	 */
	template <rnd::sequence R, rnd::sequence W, rnd::number K = int>
		requires std::convertible_to<std::ranges::range_value_t<W const>, double>
	std::vector<std::ranges::range_value_t<R const>> choices (R const & population_a, W const & weights_a, K k_a = 1)
	{
		if (std::ranges::empty (population_a))
		{
			rnd::throw_error (rnd::error_sampling::empty_sequence);
		}
		auto const count = rnd::to_count (k_a, rnd::error_sampling::invalid_count);
		auto const size = static_cast<std::size_t> (std::ranges::size (population_a));
		if (static_cast<std::size_t> (std::ranges::size (weights_a)) != size)
		{
			rnd::throw_error (rnd::error_sampling::weights_length_mismatch);
		}
		auto const valid_weight = [] (auto const & weight_a) {
			auto const weight = static_cast<double> (weight_a);
			return std::isfinite (weight) && weight >= 0.0;
		};
		if (!std::ranges::all_of (weights_a, valid_weight))
		{
			rnd::throw_error (rnd::error_sampling::invalid_weight);
		}
		auto const sum = std::accumulate (std::ranges::begin (weights_a), std::ranges::end (weights_a), 0.0, [] (double total_a, auto const & weight_a) { return total_a + static_cast<double> (weight_a); });
		if (!(sum > 0.0))
		{
			rnd::throw_error (rnd::error_sampling::weight_sum_not_positive);
		}
		if (!std::isfinite (sum))
		{
			rnd::throw_error (rnd::error_sampling::invalid_weight, "Weight sum overflows");
		}

		auto const cumulative = cumulative_distribution (weights_a, sum);
		auto const first = std::ranges::begin (population_a);
		std::vector<std::ranges::range_value_t<R const>> result;
		result.reserve (count);
		for (std::size_t i = 0; i < count; ++i)
		{
			result.push_back (first[static_cast<std::ranges::range_difference_t<R const>> (weighted_index (cumulative, source.next ()))]);
		}
		return result;
	}

	/**
	 * Returns a normally distributed double with mean \p mu and standard deviation \p sigma (Box-Muller).
	 * Each generated pair is used for two consecutive calls unless the cache is disabled in the config.
	 * The uniform source is called without the cache lock held, it may call back into this sampler.
	 * @throws rnd::range_error if an argument is not finite or sigma is not positive
	 */
	double gauss (double mu_a = 0.0, double sigma_a = 1.0);

	/** Drops a pending Box-Muller deviate so the next gauss () call draws a fresh pair */
	void clear_cache ();

	bool has_cached_gaussian () const;

	rnd::sampler_config const & get_config () const;

	/** Partial sums of weights / sum, non-decreasing, with the last entry forced to exactly 1 */
	template <rnd::sequence W>
	static std::vector<double> cumulative_distribution (W const & weights_a, double sum_a)
	{
		std::vector<double> cumulative;
		cumulative.reserve (std::ranges::size (weights_a));
		double acc = 0.0;
		for (auto const & weight : weights_a)
		{
			acc += static_cast<double> (weight) / sum_a;
			cumulative.push_back (acc);
		}
		if (!cumulative.empty ())
		{
			cumulative.back () = 1.0;
		}
		return cumulative;
	}

	/**
	 * Leftmost index whose cumulative value is not less than \p r_a.
	 * Leading zero weights have cumulative value 0 and are selected by r = 0.
	 */
	static std::size_t weighted_index (std::vector<double> const & cumulative_a, double r_a);

private:
	/** floor (u * n) for one draw u, an index in [0, n) */
	std::uint64_t next_index (std::uint64_t n_a);

	rnd::uniform_source & source;
	rnd::sampler_config const config;
	rnd::logger & logger;

	mutable std::mutex gaussian_mutex;
	std::optional<double> cached_gaussian;
};

/** Process wide sampler over a rnd::device_source */
rnd::sampler & default_sampler ();
}
