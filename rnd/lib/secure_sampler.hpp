#pragma once

#include <rnd/lib/errors.hpp>
#include <rnd/lib/logging.hpp>
#include <rnd/lib/numbers.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <ranges>
#include <vector>

namespace rnd
{
/** Source of cryptographically unpredictable bytes */
class secure_source
{
public:
	virtual ~secure_source () = default;

	/**
	 * Fills \p output with \p size fresh bytes
	 * @throws rnd::unavailable_error if no secure source exists in the running environment
	 */
	virtual void generate_block (std::uint8_t * output, std::size_t size) = 0;
};

/** Operating system entropy through rnd::random_pool */
class os_secure_source final : public secure_source
{
public:
	explicit os_secure_source (rnd::logger & logger_a = rnd::default_logger ());

	void generate_block (std::uint8_t * output, std::size_t size) override;

private:
	rnd::logger & logger;
};

/**
 * Integer, choice and byte generation over a secure byte source.
 * Integers are mapped onto their range by rejection sampling on 32 bit words, without modulo bias.
 */
class secure_sampler final
{
public:
	explicit secure_sampler (rnd::secure_source & source_a);

	secure_sampler (secure_sampler const &) = delete;
	secure_sampler & operator= (secure_sampler const &) = delete;

	/** Largest number of values randint () can map onto, one 32 bit word is drawn per attempt */
	static constexpr std::uint64_t max_range = std::uint64_t{ 1 } << 32;

	/**
	 * Returns an integer uniformly distributed over [min, max], both inclusive
	 * @throws rnd::type_error if an argument is not an integer
	 * @throws rnd::range_error if min > max or the range holds more than 2^32 values
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
			auto const range = static_cast<double> (max_a) - static_cast<double> (min_a) + 1.0;
			if (range > static_cast<double> (max_range))
			{
				rnd::throw_error (rnd::error_sampling::range_too_large);
			}
			return static_cast<T> (static_cast<double> (min_a) + static_cast<double> (next_index (static_cast<std::uint64_t> (range))));
		}
		else
		{
			auto const width = rnd::distance (min_a, max_a);
			if (width >= max_range)
			{
				rnd::throw_error (rnd::error_sampling::range_too_large);
			}
			return static_cast<T> (static_cast<std::uint64_t> (min_a) + next_index (width + 1));
		}
	}

	/**
	 * Returns one element of \p seq, each position equally likely
	 * @throws rnd::range_error if \p seq is empty or holds more than 2^32 elements
	 */
	template <rnd::sequence R>
	std::ranges::range_value_t<R const> choice (R const & seq_a)
	{
		auto const size = static_cast<std::uint64_t> (std::ranges::size (seq_a));
		if (size == 0)
		{
			rnd::throw_error (rnd::error_sampling::empty_sequence);
		}
		auto const index = randint (std::uint64_t{ 0 }, size - 1);
		return std::ranges::begin (seq_a)[static_cast<std::ranges::range_difference_t<R const>> (index)];
	}

	template <typename T>
	T choice (std::initializer_list<T> seq_a)
	{
		return choice<std::initializer_list<T>> (seq_a);
	}

	/**
	 * Returns \p length fresh secure bytes
	 * @throws rnd::type_error if \p length is not a non-negative integer
	 */
	template <rnd::number L>
	std::vector<std::uint8_t> bytes (L length_a)
	{
		auto const length = rnd::to_count (length_a, rnd::error_sampling::invalid_length);
		std::vector<std::uint8_t> result (length);
		if (length > 0)
		{
			source.generate_block (result.data (), result.size ());
		}
		return result;
	}

	/** Largest multiple of \p range_a not above 2^32, draws at or above it are rejected */
	static std::uint64_t rejection_bound (std::uint64_t range_a);

private:
	/** Uniform index in [0, range) for 0 < range <= 2^32 */
	std::uint64_t next_index (std::uint64_t range_a);
	/** Four secure bytes composed big-endian */
	std::uint32_t next_word32 ();

	rnd::secure_source & source;
};

/** Process wide secure sampler over a rnd::os_secure_source */
rnd::secure_sampler & default_secure_sampler ();
}
