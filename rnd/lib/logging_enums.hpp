#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace rnd::log
{
enum class level
{
	trace,
	debug,
	info,
	warn,
	error,
	critical,
	off,
};

enum class type
{
	all = 0, // reserved

	generic,
	test,
	config,
	cli,
	sampler,
	secure_sampler,
};
}

namespace rnd::log
{
std::string_view to_string (rnd::log::type);
std::string_view to_string (rnd::log::level);

/// @return All enum values, excluding reserved ones
std::vector<rnd::log::level> const & all_levels ();
std::vector<rnd::log::type> const & all_types ();

/// @throw std::invalid_argument if the input string does not match a log::level
rnd::log::level parse_level (std::string_view);

/// @throw std::invalid_argument if the input string does not match a log::type
rnd::log::type parse_type (std::string_view);
}
