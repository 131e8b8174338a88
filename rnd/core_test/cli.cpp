#include <rnd/cli/commands.hpp>
#include <rnd/lib/cli.hpp>
#include <rnd/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <boost/program_options.hpp>

#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace
{
boost::program_options::variables_map parse (std::vector<std::string> const & args)
{
	boost::program_options::options_description description ("Command line options");
	description.add_options () ("config", boost::program_options::value<std::vector<rnd::config_key_value_pair>> ()->multitoken (), "");
	rnd::add_sampling_options (description);
	std::vector<char const *> argv{ "rnd_cli" };
	for (auto const & arg : args)
	{
		argv.push_back (arg.c_str ());
	}
	boost::program_options::variables_map vm;
	boost::program_options::store (boost::program_options::parse_command_line (static_cast<int> (argv.size ()), argv.data (), description), vm);
	boost::program_options::notify (vm);
	return vm;
}

std::string call_cli_command (std::vector<std::string> const & args, std::error_code & ec)
{
	std::stringstream ss;
	ec = rnd::handle_sampling_options (parse (args), ss);
	return ss.str ();
}

std::string call_cli_command (std::vector<std::string> const & args)
{
	std::error_code ec;
	auto output = call_cli_command (args, ec);
	EXPECT_NO_ERROR (ec);
	return output;
}
}

TEST (cli, config_override_parsing)
{
	std::vector<rnd::config_key_value_pair> key_value_pairs;
	auto config_overrides = rnd::config_overrides (key_value_pairs);
	ASSERT_TRUE (config_overrides.empty ());
	key_value_pairs.push_back ({ "key", "value" });
	config_overrides = rnd::config_overrides (key_value_pairs);
	ASSERT_EQ (config_overrides[0], "key=\"value\"");
	key_value_pairs.push_back ({ "sampler.sample_shuffle_ratio", "0.25" });
	config_overrides = rnd::config_overrides (key_value_pairs);
	ASSERT_EQ (config_overrides[1], "sampler.sample_shuffle_ratio=\"0.25\"");

	// Should add this as it contains escaped quotes, and make sure these are not escaped again
	key_value_pairs.push_back ({ "key", "\"value\"" });
	config_overrides = rnd::config_overrides (key_value_pairs);
	ASSERT_EQ (config_overrides[2], "key=\"value\"");
	ASSERT_EQ (config_overrides.size (), 3);
}

TEST (cli, key_value_pair_stream)
{
	std::stringstream ss ("sampler.gauss_cache=false");
	rnd::config_key_value_pair pair;
	ss >> pair;
	ASSERT_EQ ("sampler.gauss_cache", pair.key);
	ASSERT_EQ ("false", pair.value);
}

TEST (cli, randint)
{
	for (auto i = 0; i < 20; ++i)
	{
		auto value = std::stoi (call_cli_command ({ "--randint", "--min", "1", "--max", "3" }));
		ASSERT_GE (value, 1);
		ASSERT_LE (value, 3);
	}
	auto value = std::stoi (call_cli_command ({ "--randint", "--secure", "--min=-2", "--max=-1" }));
	ASSERT_GE (value, -2);
	ASSERT_LE (value, -1);
}

TEST (cli, randint_errors)
{
	std::error_code ec;
	call_cli_command ({ "--randint", "--min", "1.5", "--max", "3" }, ec);
	ASSERT_EQ (ec, rnd::error_sampling::not_integer);
	call_cli_command ({ "--randint", "--min", "5", "--max", "3" }, ec);
	ASSERT_EQ (ec, rnd::error_sampling::min_greater_than_max);
	call_cli_command ({ "--randint", "--min", "5" }, ec);
	ASSERT_EQ (ec, rnd::error_cli::invalid_arguments);
}

TEST (cli, randrange)
{
	auto value = std::stoi (call_cli_command ({ "--randrange", "--start", "10", "--stop", "0", "--step=-5" }));
	ASSERT_TRUE (value == 10 || value == 5);
	std::error_code ec;
	call_cli_command ({ "--randrange", "--stop", "0" }, ec);
	ASSERT_EQ (ec, rnd::error_sampling::empty_range);
}

TEST (cli, uniform)
{
	auto value = std::stod (call_cli_command ({ "--uniform", "--min", "0.5", "--max", "0.75" }));
	ASSERT_GE (value, 0.5);
	ASSERT_LE (value, 0.75);
	std::error_code ec;
	call_cli_command ({ "--uniform", "--min", "abc", "--max", "1" }, ec);
	ASSERT_EQ (ec, rnd::error_sampling::not_a_number);
}

TEST (cli, choice)
{
	auto output = call_cli_command ({ "--choice", "--population", "red,green,blue" });
	std::set<std::string> expected{ "red\n", "green\n", "blue\n" };
	ASSERT_EQ (1, expected.count (output));
	output = call_cli_command ({ "--choice", "--secure", "--population", "red,green,blue" });
	ASSERT_EQ (1, expected.count (output));
	std::error_code ec;
	call_cli_command ({ "--choice", "--population", "" }, ec);
	ASSERT_EQ (ec, rnd::error_sampling::empty_sequence);
}

TEST (cli, sample)
{
	auto output = call_cli_command ({ "--sample", "--population", "a,b,c,d", "--count", "4" });
	std::istringstream stream (output);
	std::set<std::string> values;
	std::string value;
	while (stream >> value)
	{
		values.insert (value);
	}
	std::set<std::string> expected{ "a", "b", "c", "d" };
	ASSERT_EQ (expected, values);
	std::error_code ec;
	call_cli_command ({ "--sample", "--population", "a,b", "--count", "3" }, ec);
	ASSERT_EQ (ec, rnd::error_sampling::sample_too_large);
}

TEST (cli, shuffle)
{
	auto output = call_cli_command ({ "--shuffle", "--population", "1,2,3" });
	ASSERT_EQ (6, output.size ());
	ASSERT_NE (output.find ('1'), std::string::npos);
	ASSERT_NE (output.find ('2'), std::string::npos);
	ASSERT_NE (output.find ('3'), std::string::npos);
}

TEST (cli, choices_weighted)
{
	auto output = call_cli_command ({ "--choices", "--population", "x,y,z", "--weights", "0,1,0", "--count", "3" });
	ASSERT_EQ ("y y y\n", output);
	std::error_code ec;
	call_cli_command ({ "--choices", "--population", "x,y", "--weights", "1,w" }, ec);
	ASSERT_EQ (ec, rnd::error_sampling::not_a_number);
	call_cli_command ({ "--choices", "--population", "x,y", "--weights", "1" }, ec);
	ASSERT_EQ (ec, rnd::error_sampling::weights_length_mismatch);
}

TEST (cli, gauss)
{
	auto output = call_cli_command ({ "--gauss", "--mu", "5", "--sigma", "0.001", "--count", "3" });
	std::istringstream stream (output);
	double value;
	auto count = 0;
	while (stream >> value)
	{
		ASSERT_NEAR (5.0, value, 0.1);
		++count;
	}
	ASSERT_EQ (3, count);
	std::error_code ec;
	call_cli_command ({ "--gauss", "--sigma", "0" }, ec);
	ASSERT_EQ (ec, rnd::error_sampling::non_positive_sigma);
}

TEST (cli, bytes)
{
	auto output = call_cli_command ({ "--bytes", "--count", "16" });
	ASSERT_EQ (33, output.size ());
	ASSERT_EQ (output.find_first_not_of ("0123456789abcdef\n"), std::string::npos);
	std::error_code ec;
	call_cli_command ({ "--bytes", "--count=-1" }, ec);
	ASSERT_EQ (ec, rnd::error_sampling::invalid_length);
}

/** Counts that pass validation but cannot be allocated are reported, not fatal */
TEST (cli, count_too_large)
{
	std::error_code ec;
	auto output = call_cli_command ({ "--bytes", "--count", "9223372036854775807" }, ec);
	ASSERT_EQ (ec, rnd::error_cli::count_too_large);
	ASSERT_TRUE (output.empty ());
	call_cli_command ({ "--choices", "--population", "a", "--count", "9223372036854775807" }, ec);
	ASSERT_EQ (ec, rnd::error_cli::count_too_large);
	call_cli_command ({ "--choices", "--population", "a,b", "--weights", "1,1", "--count", "9223372036854775807" }, ec);
	ASSERT_EQ (ec, rnd::error_cli::count_too_large);
	ASSERT_FALSE (call_cli_command ({ "--bytes", "--count", "4" }).empty ());
}

TEST (cli, config_override)
{
	std::error_code ec;
	call_cli_command ({ "--sample", "--population", "a,b", "--count", "1", "--config", "sampler.sample_shuffle_ratio=2" }, ec);
	ASSERT_EQ (ec, rnd::error_cli::reading_config);
	auto output = call_cli_command ({ "--sample", "--population", "a,b", "--count", "1", "--config", "sampler.sample_shuffle_ratio=0" });
	ASSERT_TRUE (output == "a\n" || output == "b\n");
}

TEST (cli, generate_config)
{
	auto output = call_cli_command ({ "--generate_config", "rnd" });
	ASSERT_NE (output.find ("[sampler]"), std::string::npos);
	ASSERT_NE (output.find ("# sample_shuffle_ratio"), std::string::npos);
	output = call_cli_command ({ "--generate_config", "log", "--use_defaults" });
	ASSERT_NE (output.find ("[log]"), std::string::npos);
	std::error_code ec;
	call_cli_command ({ "--generate_config", "node" }, ec);
	ASSERT_EQ (ec, rnd::error_cli::invalid_arguments);
}

TEST (cli, unknown_command)
{
	std::error_code ec;
	auto output = call_cli_command ({ "--min", "1" }, ec);
	ASSERT_EQ (ec, rnd::error_cli::unknown_command);
	ASSERT_TRUE (output.empty ());
}
