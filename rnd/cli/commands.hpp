#pragma once

#include <rnd/lib/errors.hpp>

#include <boost/program_options.hpp>

#include <iosfwd>

namespace rnd
{
/** Command line related error codes */
enum class error_cli
{
	generic = 1,
	parse_error = 2,
	invalid_arguments = 3,
	unknown_command = 4,
	reading_config = 5,
	count_too_large = 6
};

void add_sampling_options (boost::program_options::options_description &);

/**
 * Runs the sampling or config command selected in \p vm, writing its result to \p out.
 * Returns error_cli::unknown_command if no command handled here was given, the error code of a
 * rejected argument (rnd::error_sampling), error_cli::invalid_arguments for a missing one or
 * error_cli::reading_config if the config file or an override is invalid.
 * A count whose result cannot be allocated gives error_cli::count_too_large.
 */
std::error_code handle_sampling_options (boost::program_options::variables_map const & vm, std::ostream & out);
}

REGISTER_ERROR_CODES (rnd, error_cli)
