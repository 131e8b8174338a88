#include <rnd/lib/config.hpp>
#include <rnd/lib/tomlconfig.hpp>
#include <rnd/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>

namespace
{
/** Temporary data directory removed when the test ends */
class data_path_guard
{
public:
	explicit data_path_guard (std::string const & name) :
		path{ std::filesystem::temp_directory_path () / ("rnd_core_test_" + name) }
	{
		std::filesystem::remove_all (path);
		std::filesystem::create_directories (path);
	}

	~data_path_guard ()
	{
		std::error_code ec;
		std::filesystem::remove_all (path, ec);
	}

	std::filesystem::path const path;
};
}

TEST (toml, optional_child)
{
	std::stringstream ss;
	ss << R"toml(
		[child]
		val=1
	)toml";

	rnd::tomlconfig t;
	t.read (ss);
	auto c1 = t.get_optional_child ("child");
	ASSERT_TRUE (c1);
	int val = 0;
	c1->get ("val", val);
	ASSERT_EQ (val, 1);
	ASSERT_FALSE (t.get_optional_child ("child2"));
	ASSERT_FALSE (t.get_optional_child ("child.val"));
}

/** Child tables report into the error state of their parent */
TEST (toml, child_shares_error)
{
	std::stringstream ss;
	ss << R"toml(
		[sampler]
		gauss_cache = "sometimes"
	)toml";

	rnd::tomlconfig t;
	t.read (ss);
	auto sampler = t.get_optional_child ("sampler");
	ASSERT_TRUE (sampler);
	bool value = true;
	sampler->get ("gauss_cache", value);
	ASSERT_TRUE (value);
	ASSERT_TRUE (t.get_error () == rnd::error_config::invalid_value);
	ASSERT_EQ ("gauss_cache is not a boolean", t.get_error ().get_message ());
}

/** Config settings passed via CLI overrides the config file settings. This is solved
using an override stream. */
TEST (toml, dot_child_syntax)
{
	std::stringstream ss_override;
	ss_override << R"toml(
		sampler.a = 1
		sampler.b = 2
	)toml";

	std::stringstream ss;
	ss << R"toml(
		[sampler]
		b=5
		c=3
	)toml";

	rnd::tomlconfig t;
	t.read (ss_override, ss);

	auto sampler = t.get_optional_child ("sampler");
	ASSERT_TRUE (sampler);
	uint16_t a, b, c;
	sampler->get<uint16_t> ("a", a);
	ASSERT_EQ (a, 1);
	sampler->get<uint16_t> ("b", b);
	ASSERT_EQ (b, 2);
	sampler->get<uint16_t> ("c", c);
	ASSERT_EQ (c, 3);
}

TEST (toml, base_override)
{
	std::stringstream ss_base;
	ss_base << R"toml(
	        sampler.value=7075
	)toml";

	std::stringstream ss_override;
	ss_override << R"toml(
	        sampler.value=8075
			sampler.too_big=70000
	)toml";

	rnd::tomlconfig t;
	t.read (ss_override, ss_base);

	uint16_t value = 0;
	t.get<uint16_t> ("sampler.value", value);
	ASSERT_EQ (value, 8075);
	ASSERT_FALSE (t.get_error ());

	// A missing key leaves the target unchanged without an error
	value = 65535;
	t.get<uint16_t> ("sampler.value_non_existent", value);
	ASSERT_EQ (value, 65535);
	ASSERT_FALSE (t.get_error ());

	t.get<uint16_t> ("sampler.too_big", value);
	ASSERT_TRUE (t.get_error () == rnd::error_config::invalid_value);
	ASSERT_EQ ("sampler.too_big is not a 16-bit unsigned integer", t.get_error ().get_message ());
}

TEST (toml, put)
{
	rnd::tomlconfig config;
	rnd::tomlconfig config_sampler;
	// Overwrite value and add to child node
	config_sampler.put ("ratio", "0.25");
	config_sampler.put ("ratio", "0.75");
	config.put_child ("sampler", config_sampler);
	ASSERT_TRUE (config.has_key ("sampler"));
	ASSERT_FALSE (config.has_key ("ratio"));
	ASSERT_EQ (0.75, config.get<double> ("sampler.ratio"));
	ASSERT_FALSE (config.get_error ());
	ASSERT_FALSE (config.empty ());
	ASSERT_TRUE (rnd::tomlconfig{}.empty ());
}

TEST (toml, get_values)
{
	std::stringstream ss;
	ss << R"toml(
		sampler = "debug"
		cli = "warn"
	)toml";

	rnd::tomlconfig t;
	t.read (ss);
	auto values = t.get_values<std::string> ();
	ASSERT_EQ (2, values.size ());
	std::map<std::string, std::string> entries (values.begin (), values.end ());
	ASSERT_EQ ("debug", entries["sampler"]);
	ASSERT_EQ ("warn", entries["cli"]);
}

TEST (toml, parse_error)
{
	std::stringstream ss;
	ss << "[sampler\n";
	rnd::tomlconfig t;
	ASSERT_TRUE (t.read (ss));
	ASSERT_TRUE (t.get_error () == rnd::error_config::generic);
}

TEST (toml, bool_values)
{
	std::stringstream ss;
	ss << R"toml(
		yes = true
		no = false
		bad = "maybe"
	)toml";

	rnd::tomlconfig t;
	t.read (ss);
	bool value = false;
	t.get ("yes", value);
	ASSERT_TRUE (value);
	t.get ("no", value);
	ASSERT_FALSE (value);
	ASSERT_FALSE (t.get_error ());
	t.get ("bad", value);
	ASSERT_TRUE (t.get_error () == rnd::error_config::invalid_value);
}

TEST (toml, sampler_config_defaults)
{
	std::stringstream ss;
	ss << R"toml(
	)toml";

	rnd::tomlconfig toml;
	toml.read (ss);
	rnd::rnd_config config;
	rnd::rnd_config defaults;
	ASSERT_FALSE (config.deserialize_toml (toml));
	ASSERT_EQ (config.sampler.sample_shuffle_ratio, defaults.sampler.sample_shuffle_ratio);
	ASSERT_EQ (config.sampler.gauss_cache, defaults.sampler.gauss_cache);
}

TEST (toml, sampler_config_deserialize_no_defaults)
{
	std::stringstream ss;
	ss << R"toml(
	[sampler]
	sample_shuffle_ratio = 0.25
	gauss_cache = false
	)toml";

	rnd::tomlconfig toml;
	toml.read (ss);
	rnd::rnd_config config;
	rnd::rnd_config defaults;
	ASSERT_FALSE (config.deserialize_toml (toml));
	ASSERT_NE (config.sampler.sample_shuffle_ratio, defaults.sampler.sample_shuffle_ratio);
	ASSERT_NE (config.sampler.gauss_cache, defaults.sampler.gauss_cache);
	ASSERT_EQ (0.25, config.sampler.sample_shuffle_ratio);
	ASSERT_FALSE (config.sampler.gauss_cache);
}

TEST (toml, sampler_config_deserialize_errors)
{
	{
		std::stringstream ss;
		ss << R"toml(
		[sampler]
		sample_shuffle_ratio = 1.5
		)toml";

		rnd::tomlconfig toml;
		toml.read (ss);
		rnd::rnd_config config;
		auto error = config.deserialize_toml (toml);
		ASSERT_TRUE (error);
		ASSERT_TRUE (error == rnd::error_config::invalid_value);
		ASSERT_EQ ("sample_shuffle_ratio must be between 0 and 1", error.get_message ());
	}
	{
		std::stringstream ss;
		ss << R"toml(
		[sampler]
		sample_shuffle_ratio = "half"
		)toml";

		rnd::tomlconfig toml;
		toml.read (ss);
		rnd::rnd_config config;
		ASSERT_TRUE (config.deserialize_toml (toml) == rnd::error_config::invalid_value);
	}
}

/** Serialized defaults are read back unchanged */
TEST (toml, sampler_config_serialize)
{
	rnd::rnd_config config;
	config.sampler.sample_shuffle_ratio = 0.125;
	config.sampler.gauss_cache = false;
	rnd::tomlconfig toml;
	ASSERT_FALSE (config.serialize_toml (toml));

	std::stringstream ss;
	toml.write (ss);
	rnd::tomlconfig read_back;
	read_back.read (ss);
	rnd::rnd_config loaded;
	ASSERT_FALSE (loaded.deserialize_toml (read_back));
	ASSERT_EQ (0.125, loaded.sampler.sample_shuffle_ratio);
	ASSERT_FALSE (loaded.sampler.gauss_cache);
}

TEST (toml, generated_config_commented)
{
	rnd::rnd_config config;
	rnd::tomlconfig toml;
	config.serialize_toml (toml);
	auto text = toml.to_string (true);
	ASSERT_NE (text.find ("[sampler]"), std::string::npos);
	ASSERT_NE (text.find ("# sample_shuffle_ratio"), std::string::npos);
	ASSERT_EQ (toml.to_string (false).find ("# gauss_cache"), std::string::npos);
}

TEST (toml, load_config_file)
{
	data_path_guard guard{ "load_config_file" };
	{
		std::ofstream file (guard.path / rnd::rnd_config::filename);
		file << "[sampler]\nsample_shuffle_ratio = 0.75\ngauss_cache = false\n";
	}
	auto config = rnd::load_config_file<rnd::rnd_config> (rnd::rnd_config{}, rnd::rnd_config::filename, guard.path, {});
	ASSERT_EQ (0.75, config.sampler.sample_shuffle_ratio);
	ASSERT_FALSE (config.sampler.gauss_cache);

	// Overrides take precedence over the file
	auto overridden = rnd::load_config_file<rnd::rnd_config> (rnd::rnd_config{}, rnd::rnd_config::filename, guard.path, { "sampler.sample_shuffle_ratio=\"0.25\"" });
	ASSERT_EQ (0.25, overridden.sampler.sample_shuffle_ratio);
	ASSERT_FALSE (overridden.sampler.gauss_cache);
}

TEST (toml, load_config_file_missing)
{
	data_path_guard guard{ "load_config_file_missing" };
	rnd::rnd_config fallback;
	fallback.sampler.sample_shuffle_ratio = 0.3;
	auto config = rnd::load_config_file<rnd::rnd_config> (fallback, rnd::rnd_config::filename, guard.path, {});
	ASSERT_EQ (0.3, config.sampler.sample_shuffle_ratio);

	auto overridden = rnd::load_config_file<rnd::rnd_config> (fallback, rnd::rnd_config::filename, guard.path, { "sampler.gauss_cache=\"false\"" });
	ASSERT_EQ (0.3, overridden.sampler.sample_shuffle_ratio);
	ASSERT_FALSE (overridden.sampler.gauss_cache);
}

TEST (toml, load_config_file_invalid)
{
	data_path_guard guard{ "load_config_file_invalid" };
	{
		std::ofstream file (guard.path / rnd::rnd_config::filename);
		file << "[sampler]\nsample_shuffle_ratio = -1\n";
	}
	ASSERT_THROW (rnd::load_config_file<rnd::rnd_config> (rnd::rnd_config{}, rnd::rnd_config::filename, guard.path, {}), std::runtime_error);
}
