#include <rnd/lib/enum_util.hpp>
#include <rnd/lib/env.hpp>
#include <rnd/lib/logging.hpp>
#include <rnd/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace
{
enum class test_enum
{
	_invalid,
	one,
	two,
	three,
	_last
};

/** Sets an environment variable for the lifetime of the guard */
class env_guard
{
public:
	env_guard (char const * name_a, char const * value_a) :
		name{ name_a }
	{
		setenv (name, value_a, 1);
	}

	~env_guard ()
	{
		unsetenv (name);
	}

private:
	char const * name;
};

std::filesystem::path make_data_path (std::string const & name)
{
	auto path = std::filesystem::temp_directory_path () / ("rnd_core_test_" + name);
	std::filesystem::remove_all (path);
	std::filesystem::create_directories (path);
	return path;
}
}

TEST (log_parse, parse_level)
{
	ASSERT_EQ (rnd::log::parse_level ("error"), rnd::log::level::error);
	ASSERT_EQ (rnd::log::parse_level ("off"), rnd::log::level::off);
	ASSERT_EQ (rnd::log::parse_level ("DEBUG"), rnd::log::level::debug);
	ASSERT_THROW (rnd::log::parse_level ("enumnotpresent"), std::invalid_argument);
	ASSERT_THROW (rnd::log::parse_level (""), std::invalid_argument);
	ASSERT_THROW (rnd::log::parse_level ("_last"), std::invalid_argument);
	ASSERT_THROW (rnd::log::parse_level ("_error"), std::invalid_argument);
}

TEST (log_parse, parse_type)
{
	ASSERT_EQ (rnd::log::parse_type ("sampler"), rnd::log::type::sampler);
	ASSERT_EQ (rnd::log::parse_type ("secure_sampler"), rnd::log::type::secure_sampler);
	ASSERT_THROW (rnd::log::parse_type ("all"), std::invalid_argument);
	ASSERT_THROW (rnd::log::parse_type ("enumnotpresent"), std::invalid_argument);
	ASSERT_THROW (rnd::log::parse_type (""), std::invalid_argument);
	ASSERT_THROW (rnd::log::parse_type ("_sampler"), std::invalid_argument);
}

TEST (enums, log_type)
{
	ASSERT_EQ (to_string (rnd::log::type::secure_sampler), "secure_sampler");
	ASSERT_EQ (to_string (rnd::log::level::warn), "warn");
	auto const & types = rnd::log::all_types ();
	ASSERT_EQ (std::find (types.begin (), types.end (), rnd::log::type::all), types.end ());
	ASSERT_NE (std::find (types.begin (), types.end (), rnd::log::type::cli), types.end ());
	ASSERT_EQ (rnd::log::all_levels ().size (), 7);
}

TEST (enum_util, name)
{
	ASSERT_EQ (rnd::enum_util::name (test_enum::_invalid), "_invalid");
	ASSERT_EQ (rnd::enum_util::name (test_enum::one), "one");
	ASSERT_EQ (rnd::enum_util::name (test_enum::_last), "_last");
}

TEST (enum_util, values)
{
	auto values = rnd::enum_util::values<test_enum> ();
	ASSERT_EQ (values.size (), 3);
	ASSERT_EQ (values[0], test_enum::one);
	ASSERT_EQ (values[1], test_enum::two);
	ASSERT_EQ (values[2], test_enum::three);
}

TEST (enum_util, parse)
{
	ASSERT_EQ (rnd::enum_util::try_parse<test_enum> ("one"), test_enum::one);
	ASSERT_EQ (rnd::enum_util::try_parse<test_enum> ("Three"), test_enum::three);
	ASSERT_FALSE (rnd::enum_util::try_parse<test_enum> ("four").has_value ());
	ASSERT_FALSE (rnd::enum_util::try_parse<test_enum> ("_invalid").has_value ());
	ASSERT_TRUE (rnd::enum_util::try_parse<test_enum> ("_invalid", false).has_value ());
}

TEST (log_config, presets)
{
	auto cli = rnd::log_config::cli_default ();
	ASSERT_TRUE (cli.console.to_cerr);
	ASSERT_FALSE (cli.file.enable);
	auto library = rnd::log_config::library_default ();
	ASSERT_EQ (library.default_level, rnd::log::level::warn);
	ASSERT_FALSE (library.file.enable);
	auto tests = rnd::log_config::tests_default ();
	ASSERT_EQ (tests.default_level, rnd::log::level::off);
	auto sample = rnd::log_config::sample_config ();
	ASSERT_EQ (sample.levels.size (), rnd::log::all_types ().size ());
}

TEST (log_config, toml)
{
	rnd::log_config config = rnd::log_config::sample_config ();
	config.default_level = rnd::log::level::debug;
	config.levels[rnd::log::type::sampler] = rnd::log::level::trace;
	config.file.rotation_count = 7;
	rnd::tomlconfig toml;
	ASSERT_FALSE (config.serialize_toml (toml));

	std::stringstream ss;
	toml.write (ss);
	rnd::tomlconfig read_back;
	read_back.read (ss);
	rnd::log_config loaded;
	ASSERT_FALSE (loaded.deserialize_toml (read_back));
	ASSERT_EQ (loaded.default_level, rnd::log::level::debug);
	ASSERT_EQ (loaded.levels[rnd::log::type::sampler], rnd::log::level::trace);
	ASSERT_EQ (loaded.levels[rnd::log::type::cli], rnd::log::level::info);
	ASSERT_EQ (loaded.file.rotation_count, 7);
}

TEST (log_config, invalid_level)
{
	std::stringstream ss;
	ss << R"toml(
	[log]
	default_level = "loud"
	)toml";

	rnd::tomlconfig toml;
	toml.read (ss);
	rnd::log_config config;
	ASSERT_TRUE (config.deserialize_toml (toml));
}

TEST (log_config, load_file)
{
	auto data_path = make_data_path ("log_load_file");
	{
		std::ofstream file (data_path / "config-log.toml");
		file << "[log]\ndefault_level = \"error\"\n\n[log.levels]\nsampler = \"debug\"\n";
	}
	auto config = rnd::load_log_config (rnd::log_config::tests_default (), data_path);
	ASSERT_EQ (config.default_level, rnd::log::level::error);
	ASSERT_EQ (config.levels[rnd::log::type::sampler], rnd::log::level::debug);

	auto overridden = rnd::load_log_config (rnd::log_config::tests_default (), data_path, { "log.default_level=\"critical\"" });
	ASSERT_EQ (overridden.default_level, rnd::log::level::critical);
	std::filesystem::remove_all (data_path);
}

TEST (log_config, load_invalid_file)
{
	auto data_path = make_data_path ("log_load_invalid_file");
	{
		std::ofstream file (data_path / "config-log.toml");
		file << "[log]\ndefault_level = \"loud\"\n";
	}
	auto config = rnd::load_log_config (rnd::log_config::tests_default (), data_path);
	ASSERT_EQ (config.default_level, rnd::log::level::off);
	std::filesystem::remove_all (data_path);
}

TEST (log_config, environment)
{
	auto data_path = make_data_path ("log_environment");
	env_guard level_guard{ "RND_LOG", "trace" };
	env_guard levels_guard{ "RND_LOG_LEVELS", "sampler=warn,secure_sampler=error,bogus=info" };
	auto config = rnd::load_log_config (rnd::log_config::tests_default (), data_path);
	ASSERT_EQ (config.default_level, rnd::log::level::trace);
	ASSERT_EQ (config.levels[rnd::log::type::sampler], rnd::log::level::warn);
	ASSERT_EQ (config.levels[rnd::log::type::secure_sampler], rnd::log::level::error);
	std::filesystem::remove_all (data_path);
}

TEST (env, get)
{
	ASSERT_FALSE (rnd::env::get ("RND_TEST_UNSET_VARIABLE"));
	env_guard number_guard{ "RND_TEST_NUMBER", "42" };
	ASSERT_EQ (rnd::env::get<int> ("RND_TEST_NUMBER"), 42);
	env_guard flag_guard{ "RND_TEST_FLAG", "ON" };
	ASSERT_EQ (rnd::env::get<bool> ("RND_TEST_FLAG"), true);
	env_guard bad_guard{ "RND_TEST_BAD", "maybe" };
	ASSERT_THROW (rnd::env::get<bool> ("RND_TEST_BAD"), std::invalid_argument);
	ASSERT_THROW (rnd::env::get<int> ("RND_TEST_BAD"), std::invalid_argument);
}

TEST (logger, levels)
{
	rnd::logger logger;
	// Tests run with logging turned off
	ASSERT_FALSE (logger.should_log (rnd::log::type::test, rnd::log::level::critical));
	logger.info (rnd::log::type::test, "Sampling {} of {} elements", 1, 2);
	logger.error (rnd::log::type::test, "Value: {}", 3.5);
}
