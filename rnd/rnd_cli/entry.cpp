#include <rnd/cli/commands.hpp>
#include <rnd/crypto_lib/random_pool.hpp>
#include <rnd/lib/cli.hpp>
#include <rnd/lib/errors.hpp>
#include <rnd/lib/logging.hpp>
#include <rnd/lib/utility.hpp>

#include <boost/program_options.hpp>

#include <array>
#include <iostream>

int main (int argc, char * const * argv)
{
	rnd::logger::initialize (rnd::log_config::cli_default ());

	boost::program_options::options_description description ("Command line options");
	// clang-format off
	description.add_options ()
		("help", "Print out options")
		("version", "Prints out version")
		("config", boost::program_options::value<std::vector<rnd::config_key_value_pair>>()->multitoken(), "Pass sampler configuration values. This takes precedence over any values in the configuration file. This option can be repeated multiple times.")
		("random_feed", "Generates output to RNG test suites");
	// clang-format on
	rnd::add_sampling_options (description);
	boost::program_options::variables_map vm;
	try
	{
		boost::program_options::store (boost::program_options::parse_command_line (argc, argv, description), vm);
	}
	catch (boost::program_options::error const & err)
	{
		std::cerr << err.what () << std::endl;
		return 1;
	}
	boost::program_options::notify (vm);
	int result (0);

	auto ec = rnd::handle_sampling_options (vm, std::cout);
	if (ec == rnd::error_cli::unknown_command)
	{
		if (vm.count ("random_feed"))
		{
			/*
			 * This command redirects an infinite stream of bytes from the random pool to standard out.
			 * The result can be fed into various tools for testing RNGs and entropy pools.
			 *
			 * Example, running the entire dieharder test suite:
			 *
			 *   ./rnd_cli --random_feed | dieharder -a -g 200
			 */
			std::array<uint8_t, 32> block;
			try
			{
				for (;;)
				{
					rnd::random_pool::generate_block (block.data (), block.size ());
					std::cout.write (reinterpret_cast<char const *> (block.data ()), block.size ());
				}
			}
			catch (rnd::unavailable_error const & err)
			{
				std::cerr << err.what () << std::endl;
				result = 1;
			}
		}
		else if (vm.count ("version"))
		{
			std::cout << "Version " << RND_VERSION_STRING << std::endl;
		}
		else
		{
			// Output the options in alphabetical order so they are easy to find
			boost::program_options::options_description sorted_description ("Command line options");
			rnd::util::sort_options_description (description, sorted_description);
			std::cout << sorted_description << std::endl;
			result = -1;
		}
	}
	else if (ec)
	{
		result = 1;
	}
	rnd::logger::flush ();
	return result;
}
