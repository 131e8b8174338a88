#pragma once

#include <rnd/lib/errors.hpp>

#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <ranges>
#include <type_traits>

namespace rnd
{
/** Arithmetic types accepted where an integer argument is expected. Floating values must hold an integral value. */
template <typename T>
concept number = std::is_arithmetic_v<T> && !std::is_same_v<T, bool>;

/** Finite indexable sequence: a sized random access range */
template <typename R>
concept sequence = std::ranges::random_access_range<R const> && std::ranges::sized_range<R const>;

/** Largest integer n such that every integer in [0, n] is exactly representable by a double (2^53 - 1) */
constexpr std::uint64_t safe_integer_max = (std::uint64_t{ 1 } << std::numeric_limits<double>::digits) - 1;

/** True if \p value_a holds an integral value, always true for integral types */
template <rnd::number T>
bool is_integer (T value_a)
{
	if constexpr (std::is_floating_point_v<T>)
	{
		return std::isfinite (value_a) && std::trunc (value_a) == value_a;
	}
	else
	{
		return true;
	}
}

template <rnd::number T>
bool is_finite (T value_a)
{
	if constexpr (std::is_floating_point_v<T>)
	{
		return std::isfinite (value_a);
	}
	else
	{
		return true;
	}
}

template <rnd::number T>
bool is_negative (T value_a)
{
	if constexpr (std::is_signed_v<T>)
	{
		return value_a < T{ 0 };
	}
	else
	{
		return false;
	}
}

/**
 * Converts a count argument (sample size, number of draws, byte length) to std::size_t
 * @throws rnd::type_error or rnd::range_error carrying \p error_a if \p count_a is not a non-negative integer
 */
template <rnd::number T>
std::size_t to_count (T count_a, rnd::error_sampling error_a)
{
	if (!rnd::is_integer (count_a) || rnd::is_negative (count_a))
	{
		rnd::throw_error (error_a);
	}
	if constexpr (std::is_floating_point_v<T>)
	{
		if (count_a > static_cast<T> (std::numeric_limits<std::size_t>::max () / 2))
		{
			rnd::throw_error (error_a);
		}
	}
	return static_cast<std::size_t> (count_a);
}

/** Unsigned distance max_a - min_a for integral min_a <= max_a, exact over the whole domain of T */
template <std::integral T>
std::uint64_t distance (T min_a, T max_a)
{
	return static_cast<std::uint64_t> (max_a) - static_cast<std::uint64_t> (min_a);
}
}
