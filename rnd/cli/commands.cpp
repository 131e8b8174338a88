#include <rnd/cli/commands.hpp>
#include <rnd/lib/cli.hpp>
#include <rnd/lib/config.hpp>
#include <rnd/lib/logging.hpp>
#include <rnd/lib/random.hpp>
#include <rnd/lib/sampler.hpp>
#include <rnd/lib/secure_sampler.hpp>
#include <rnd/lib/utility.hpp>

#include <boost/lexical_cast.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <new>
#include <stdexcept>

namespace
{
/** Integral option value, a value that does not parse as an integer is a type error */
long long integer_option (boost::program_options::variables_map const & vm, char const * name)
{
	auto const & text = vm[name].as<std::string> ();
	long long result;
	if (!boost::conversion::try_lexical_convert (text, result))
	{
		rnd::throw_error (rnd::error_sampling::not_integer, std::string (name) + ": " + text);
	}
	return result;
}

double real_option (boost::program_options::variables_map const & vm, char const * name)
{
	auto const & text = vm[name].as<std::string> ();
	double result;
	if (!boost::conversion::try_lexical_convert (text, result))
	{
		rnd::throw_error (rnd::error_sampling::not_a_number, std::string (name) + ": " + text);
	}
	return result;
}

std::vector<std::string> population_option (boost::program_options::variables_map const & vm)
{
	auto const & text = vm["population"].as<std::string> ();
	if (text.empty ())
	{
		return {};
	}
	return rnd::util::split (text, ",");
}

std::vector<double> weights_option (boost::program_options::variables_map const & vm)
{
	std::vector<double> result;
	for (auto const & entry : rnd::util::split (vm["weights"].as<std::string> (), ","))
	{
		double weight;
		if (!boost::conversion::try_lexical_convert (entry, weight))
		{
			rnd::throw_error (rnd::error_sampling::not_a_number, "weights: " + entry);
		}
		result.push_back (weight);
	}
	return result;
}

std::string join_values (std::vector<std::string> const & values)
{
	return rnd::util::join (values, " ", [] (auto const & value) { return value; });
}

bool has_all (boost::program_options::variables_map const & vm, std::initializer_list<char const *> names)
{
	for (auto name : names)
	{
		if (vm.count (name) == 0)
		{
			std::cerr << "Missing required option --" << name << std::endl;
			return false;
		}
	}
	return true;
}

rnd::rnd_config read_config (boost::program_options::variables_map const & vm)
{
	auto data_path_it = vm.find ("data_path");
	std::filesystem::path data_path = (data_path_it != vm.end ()) ? std::filesystem::path (data_path_it->second.as<std::string> ()) : std::filesystem::current_path ();
	std::vector<std::string> overrides;
	auto config_it = vm.find ("config");
	if (config_it != vm.end ())
	{
		overrides = rnd::config_overrides (config_it->second.as<std::vector<rnd::config_key_value_pair>> ());
	}
	auto config = rnd::load_config_file<rnd::rnd_config> (rnd::rnd_config{}, rnd::rnd_config::filename, data_path, overrides);
	rnd::default_logger ().debug (rnd::log::type::config, "Sampler config: sample_shuffle_ratio={} gauss_cache={}", config.sampler.sample_shuffle_ratio, config.sampler.gauss_cache);
	return config;
}

std::error_code run_command (boost::program_options::variables_map const & vm, std::ostream & out)
{
	std::error_code ec;
	auto const secure = vm.count ("secure") > 0;
	if (vm.count ("generate_config"))
	{
		auto type = vm["generate_config"].as<std::string> ();
		rnd::tomlconfig toml;
		bool valid_type = false;
		if (type == "rnd")
		{
			valid_type = true;
			rnd::rnd_config config;
			config.serialize_toml (toml);
		}
		else if (type == "log")
		{
			valid_type = true;
			rnd::log_config config = rnd::log_config::sample_config ();
			config.serialize_toml (toml);
		}
		else
		{
			std::cerr << "Invalid configuration type " << type << ". Must be rnd or log." << std::endl;
			ec = rnd::error_cli::invalid_arguments;
		}

		if (valid_type)
		{
			out << "# This is an example configuration file for rnd.\n#\n"
				<< "# Fields may need to be defined in the context of a [category] above them.\n"
				<< "# The desired configuration changes should be placed in config-" << type << ".toml in the data path.\n"
				<< "# To change a value from its default, uncomment (erasing #) the corresponding field.\n";
			out << toml.to_string (vm.count ("use_defaults") == 0) << std::endl;
		}
		return ec;
	}

	auto config = read_config (vm);
	rnd::device_source source;
	rnd::sampler sampler{ source, config.sampler };
	auto & secure_sampler = rnd::default_secure_sampler ();

	if (vm.count ("randint"))
	{
		if (has_all (vm, { "min", "max" }))
		{
			auto min = integer_option (vm, "min");
			auto max = integer_option (vm, "max");
			out << (secure ? secure_sampler.randint (min, max) : sampler.randint (min, max)) << std::endl;
		}
		else
		{
			ec = rnd::error_cli::invalid_arguments;
		}
	}
	else if (vm.count ("randrange"))
	{
		if (has_all (vm, { "stop" }))
		{
			auto start = vm.count ("start") ? integer_option (vm, "start") : 0;
			auto step = vm.count ("step") ? integer_option (vm, "step") : 1;
			out << sampler.randrange (start, integer_option (vm, "stop"), step) << std::endl;
		}
		else
		{
			ec = rnd::error_cli::invalid_arguments;
		}
	}
	else if (vm.count ("uniform"))
	{
		if (has_all (vm, { "min", "max" }))
		{
			out << sampler.uniform (real_option (vm, "min"), real_option (vm, "max")) << std::endl;
		}
		else
		{
			ec = rnd::error_cli::invalid_arguments;
		}
	}
	else if (vm.count ("choice"))
	{
		if (has_all (vm, { "population" }))
		{
			auto population = population_option (vm);
			out << (secure ? secure_sampler.choice (population) : sampler.choice (population)) << std::endl;
		}
		else
		{
			ec = rnd::error_cli::invalid_arguments;
		}
	}
	else if (vm.count ("sample"))
	{
		if (has_all (vm, { "population", "count" }))
		{
			out << join_values (sampler.sample (population_option (vm), integer_option (vm, "count"))) << std::endl;
		}
		else
		{
			ec = rnd::error_cli::invalid_arguments;
		}
	}
	else if (vm.count ("shuffle"))
	{
		if (has_all (vm, { "population" }))
		{
			auto population = population_option (vm);
			sampler.shuffle (population);
			out << join_values (population) << std::endl;
		}
		else
		{
			ec = rnd::error_cli::invalid_arguments;
		}
	}
	else if (vm.count ("choices"))
	{
		if (has_all (vm, { "population" }))
		{
			auto population = population_option (vm);
			auto count = vm.count ("count") ? integer_option (vm, "count") : 1;
			auto result = vm.count ("weights") ? sampler.choices (population, weights_option (vm), count) : sampler.choices (population, count);
			out << join_values (result) << std::endl;
		}
		else
		{
			ec = rnd::error_cli::invalid_arguments;
		}
	}
	else if (vm.count ("gauss"))
	{
		auto mu = vm.count ("mu") ? real_option (vm, "mu") : 0.0;
		auto sigma = vm.count ("sigma") ? real_option (vm, "sigma") : 1.0;
		auto count = rnd::to_count (vm.count ("count") ? integer_option (vm, "count") : 1, rnd::error_sampling::invalid_count);
		for (std::size_t i = 0; i < count; ++i)
		{
			out << sampler.gauss (mu, sigma) << std::endl;
		}
	}
	else if (vm.count ("bytes"))
	{
		if (has_all (vm, { "count" }))
		{
			auto bytes = secure_sampler.bytes (integer_option (vm, "count"));
			out << rnd::util::join (bytes, "", [] (auto byte) { return fmt::format ("{:02x}", byte); }) << std::endl;
		}
		else
		{
			ec = rnd::error_cli::invalid_arguments;
		}
	}
	else
	{
		ec = rnd::error_cli::unknown_command;
	}
	return ec;
}
}

std::string rnd::error_cli_messages::message (int ev) const
{
	switch (static_cast<rnd::error_cli> (ev))
	{
		case rnd::error_cli::generic:
			return "Unknown error";
		case rnd::error_cli::parse_error:
			return "Could not parse command line";
		case rnd::error_cli::invalid_arguments:
			return "Invalid arguments";
		case rnd::error_cli::unknown_command:
			return "Unknown command";
		case rnd::error_cli::reading_config:
			return "Config file read error";
		case rnd::error_cli::count_too_large:
			return "Count too large";
	}

	return "Invalid error code";
}

void rnd::add_sampling_options (boost::program_options::options_description & description_a)
{
	// clang-format off
	description_a.add_options ()
	("randint", "Print an integer from [<min>, <max>], both inclusive. Uses the secure source with --secure")
	("randrange", "Print an element of the progression <start>, <start> + <step>, ... excluding <stop>")
	("uniform", "Print a real number from [<min>, <max>)")
	("choice", "Print one element of <population>. Uses the secure source with --secure")
	("sample", "Print <count> elements of <population> drawn without replacement")
	("shuffle", "Print <population> in random order")
	("choices", "Print <count> elements of <population> drawn with replacement, optionally weighted by <weights>")
	("gauss", "Print <count> normally distributed numbers with mean <mu> and standard deviation <sigma>")
	("bytes", "Print <count> secure random bytes, hex encoded")
	("generate_config", boost::program_options::value<std::string> (), "Write configuration to stdout, populated with defaults. Pass the configuration type rnd or log. See also use_defaults.")
	("use_defaults", "If present, the generate_config command will generate uncommented entries")
	("min", boost::program_options::value<std::string> (), "Defines <min> for randint and uniform")
	("max", boost::program_options::value<std::string> (), "Defines <max> for randint and uniform")
	("start", boost::program_options::value<std::string> (), "Defines <start> for randrange, default 0")
	("stop", boost::program_options::value<std::string> (), "Defines <stop> for randrange")
	("step", boost::program_options::value<std::string> (), "Defines <step> for randrange, default 1")
	("mu", boost::program_options::value<std::string> (), "Defines <mu> for gauss, default 0")
	("sigma", boost::program_options::value<std::string> (), "Defines <sigma> for gauss, default 1")
	("count", boost::program_options::value<std::string> (), "Defines <count> for various commands")
	("population", boost::program_options::value<std::string> (), "Defines the comma separated <population> for sequence commands")
	("weights", boost::program_options::value<std::string> (), "Defines comma separated <weights> for choices")
	("secure", "Draw from the operating system secure random source")
	("data_path", boost::program_options::value<std::string> (), "Use the supplied path as the data directory holding config-rnd.toml");
	// clang-format on
}

std::error_code rnd::handle_sampling_options (boost::program_options::variables_map const & vm, std::ostream & out)
{
	try
	{
		return run_command (vm, out);
	}
	catch (std::system_error const & err)
	{
		rnd::default_logger ().debug (rnd::log::type::cli, "Command rejected: {}", err.what ());
		std::cerr << err.what () << std::endl;
		return err.code ();
	}
	catch (std::runtime_error const & err)
	{
		std::cerr << "Error reading config: " << err.what () << std::endl;
		return rnd::error_cli::reading_config;
	}
	catch (std::length_error const & err)
	{
		std::cerr << "Count too large: " << err.what () << std::endl;
		return rnd::error_cli::count_too_large;
	}
	catch (std::bad_alloc const & err)
	{
		std::cerr << "Count too large: " << err.what () << std::endl;
		return rnd::error_cli::count_too_large;
	}
}
