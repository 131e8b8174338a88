#include <rnd/lib/config.hpp>
#include <rnd/lib/env.hpp>
#include <rnd/lib/logging.hpp>
#include <rnd/lib/logging_enums.hpp>
#include <rnd/lib/utility.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <algorithm>
#include <chrono>
#include <iostream>

rnd::logger & rnd::default_logger ()
{
	static rnd::logger logger{ "default" };
	return logger;
}

/*
 * logger
 */

bool rnd::logger::global_initialized{ false };
rnd::log_config rnd::logger::global_config{};
std::vector<spdlog::sink_ptr> rnd::logger::global_sinks{};

void rnd::logger::initialize (rnd::log_config fallback, std::optional<std::filesystem::path> data_path, std::vector<std::string> const & config_overrides)
{
	// Only load log config from file if data_path is available
	rnd::log_config config = data_path ? rnd::load_log_config (fallback, *data_path, config_overrides) : fallback;
	initialize_common (config, data_path);
	global_initialized = true;
}

void rnd::logger::initialize_for_tests (rnd::log_config fallback)
{
	auto config = rnd::load_log_config (std::move (fallback), /* load log config from current workdir */ std::filesystem::current_path ());
	initialize_common (config, /* store log file in current workdir */ std::filesystem::current_path ());

	auto formatter = std::make_unique<spdlog::pattern_formatter> ();
	formatter->set_pattern ("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");

	for (auto & sink : global_sinks)
	{
		sink->set_formatter (formatter->clone ());
	}

	global_initialized = true;
}

// Using std::cerr here, since logging may not be initialized yet
void rnd::logger::initialize_common (rnd::log_config const & config, std::optional<std::filesystem::path> data_path)
{
	global_config = config;

	spdlog::set_automatic_registration (false);
	spdlog::set_level (to_spdlog_level (config.default_level));

	global_sinks.clear ();

	// Console setup
	if (config.console.enable)
	{
		if (!config.console.to_cerr)
		{
			// Only use colors if not writing to cerr
			if (config.console.colors)
			{
				auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt> ();
				global_sinks.push_back (console_sink);
			}
			else
			{
				auto console_sink = std::make_shared<spdlog::sinks::stdout_sink_mt> ();
				global_sinks.push_back (console_sink);
			}
		}
		else
		{
			if (config.console.colors)
			{
				std::cerr << "WARNING: Logging to cerr is enabled, console colors will be disabled" << std::endl;
			}

			auto cerr_sink = std::make_shared<spdlog::sinks::stderr_sink_mt> ();
			global_sinks.push_back (cerr_sink);
		}
	}

	// File setup
	if (config.file.enable)
	{
		// In cases where data_path is not available, file logging should always be disabled
		release_assert (data_path);

		auto now = std::chrono::system_clock::now ();
		auto time = std::chrono::system_clock::to_time_t (now);

		auto filename = fmt::format ("log_{:%Y-%m-%d_%H-%M-%S}", fmt::localtime (time));

		std::filesystem::path log_path{ data_path.value () / "log" / (filename + ".log") };
		log_path = std::filesystem::absolute (log_path);

		std::cerr << "Logging to file: " << log_path.string () << std::endl;

		// If either max_size or rotation_count is 0, then disable file rotation
		if (config.file.max_size == 0 || config.file.rotation_count == 0)
		{
			std::cerr << "WARNING: Log file rotation is disabled, log file size may grow without bound" << std::endl;

			auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt> (log_path.string (), true);
			global_sinks.push_back (file_sink);
		}
		else
		{
			auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt> (log_path.string (), config.file.max_size, config.file.rotation_count);
			global_sinks.push_back (file_sink);
		}
	}
}

void rnd::logger::flush ()
{
	for (auto & sink : global_sinks)
	{
		sink->flush ();
	}
}

/*
 * logger
 */

rnd::logger::logger (std::string identifier) :
	identifier{ std::move (identifier) }
{
	// Library users are not required to set up logging themselves
	if (!global_initialized)
	{
		initialize (rnd::log_config::library_default ());
	}
}

rnd::logger::~logger ()
{
	flush ();
}

bool rnd::logger::should_log (rnd::log::type type, rnd::log::level level)
{
	return get_logger (type).should_log (to_spdlog_level (level));
}

spdlog::logger & rnd::logger::get_logger (rnd::log::type type)
{
	// This is a two-step process to avoid exclusively locking the mutex in the common case
	{
		std::shared_lock lock{ mutex };

		if (auto it = spd_loggers.find (type); it != spd_loggers.end ())
		{
			return *it->second;
		}
	}
	// Not found, create a new logger
	{
		std::unique_lock lock{ mutex };

		auto [it, inserted] = spd_loggers.emplace (type, make_logger (type));
		return *it->second;
	}
}

std::shared_ptr<spdlog::logger> rnd::logger::make_logger (rnd::log::type type)
{
	auto const & config = global_config;
	auto const & sinks = global_sinks;

	auto name = identifier.empty () ? std::string{ to_string (type) } : fmt::format ("{}::{}", identifier, to_string (type));
	auto spd_logger = std::make_shared<spdlog::logger> (name, sinks.begin (), sinks.end ());

	spd_logger->set_level (to_spdlog_level (find_level (type)));
	spd_logger->flush_on (to_spdlog_level (config.flush_level));

	return spd_logger;
}

rnd::log::level rnd::logger::find_level (rnd::log::type type) const
{
	auto const & config = global_config;

	// Check for a specific level for this logger
	if (auto it = config.levels.find (type); it != config.levels.end ())
	{
		return it->second;
	}
	// Use the default level
	return config.default_level;
}

spdlog::level::level_enum rnd::logger::to_spdlog_level (rnd::log::level level)
{
	switch (level)
	{
		case rnd::log::level::off:
			return spdlog::level::off;
		case rnd::log::level::critical:
			return spdlog::level::critical;
		case rnd::log::level::error:
			return spdlog::level::err;
		case rnd::log::level::warn:
			return spdlog::level::warn;
		case rnd::log::level::info:
			return spdlog::level::info;
		case rnd::log::level::debug:
			return spdlog::level::debug;
		case rnd::log::level::trace:
			return spdlog::level::trace;
	}
	debug_assert (false, "Invalid log level");
	return spdlog::level::off;
}

/*
 * logging config presets
 */

rnd::log_config rnd::log_config::cli_default ()
{
	log_config config{};
	config.default_level = rnd::log::level::critical;
	config.console.colors = false; // to avoid printing warning about cerr and colors
	config.console.to_cerr = true; // Use cerr to avoid interference with CLI output that goes to stdout
	config.file.enable = false;
	return config;
}

rnd::log_config rnd::log_config::library_default ()
{
	log_config config{};
	config.default_level = rnd::log::level::warn;
	config.console.colors = false;
	config.console.to_cerr = true;
	config.file.enable = false;
	return config;
}

rnd::log_config rnd::log_config::tests_default ()
{
	log_config config{};
	config.default_level = rnd::log::level::off;
	config.file.enable = false;
	return config;
}

rnd::log_config rnd::log_config::sample_config ()
{
	log_config config{};
	config.default_level = rnd::log::level::info;
	config.levels = default_levels (rnd::log::level::info); // Populate with default levels
	return config;
}

/*
 * logging config
 */

rnd::error rnd::log_config::serialize_toml (rnd::tomlconfig & toml) const
{
	rnd::tomlconfig config_toml;
	serialize (config_toml);
	toml.put_child ("log", config_toml);

	return toml.get_error ();
}

rnd::error rnd::log_config::deserialize_toml (rnd::tomlconfig & toml)
{
	try
	{
		auto logging_l = toml.get_optional_child ("log");
		if (logging_l)
		{
			deserialize (*logging_l);
		}
	}
	catch (std::invalid_argument const & ex)
	{
		toml.get_error ().set (ex.what ());
	}

	return toml.get_error ();
}

void rnd::log_config::serialize (rnd::tomlconfig & toml) const
{
	toml.put ("default_level", std::string{ to_string (default_level) });

	rnd::tomlconfig console_config;
	console_config.put ("enable", console.enable);
	console_config.put ("to_cerr", console.to_cerr);
	console_config.put ("colors", console.colors);
	toml.put_child ("console", console_config);

	rnd::tomlconfig file_config;
	file_config.put ("enable", file.enable);
	file_config.put ("max_size", static_cast<int64_t> (file.max_size));
	file_config.put ("rotation_count", static_cast<int64_t> (file.rotation_count));
	toml.put_child ("file", file_config);

	rnd::tomlconfig levels_config;
	for (auto const & [type, level] : levels)
	{
		levels_config.put (std::string{ to_string (type) }, std::string{ to_string (level) });
	}
	toml.put_child ("levels", levels_config);
}

void rnd::log_config::deserialize (rnd::tomlconfig & toml)
{
	if (toml.has_key ("default_level"))
	{
		auto default_level_l = toml.get<std::string> ("default_level");
		default_level = rnd::log::parse_level (default_level_l);
	}

	if (auto console_config = toml.get_optional_child ("console"))
	{
		console_config->get ("enable", console.enable);
		console_config->get ("to_cerr", console.to_cerr);
		console_config->get ("colors", console.colors);
	}

	if (auto file_config = toml.get_optional_child ("file"))
	{
		file_config->get ("enable", file.enable);
		file_config->get ("max_size", file.max_size);
		file_config->get ("rotation_count", file.rotation_count);
	}

	if (auto levels_config = toml.get_optional_child ("levels"))
	{
		for (auto & level : levels_config->get_values<std::string> ())
		{
			try
			{
				auto & [name_str, level_str] = level;
				auto logger_level = rnd::log::parse_level (level_str);
				auto logger_type = rnd::log::parse_type (name_str);

				levels[logger_type] = logger_level;
			}
			catch (std::invalid_argument const & ex)
			{
				// Ignore but warn about invalid logger names
				std::cerr << "Problem processing log config: " << ex.what () << std::endl;
			}
		}
	}
}

std::map<rnd::log::type, rnd::log::level> rnd::log_config::default_levels (rnd::log::level default_level)
{
	std::map<rnd::log::type, rnd::log::level> result;
	for (auto const & type : rnd::log::all_types ())
	{
		result.emplace (type, default_level);
	}
	return result;
}

/*
 * config loading
 */

// Using std::cerr here, since logging may not be initialized yet
rnd::log_config rnd::load_log_config (rnd::log_config fallback, std::filesystem::path const & data_path, std::vector<std::string> const & config_overrides)
{
	std::string const config_filename = "config-log.toml";
	try
	{
		auto config = rnd::load_config_file<rnd::log_config> (fallback, config_filename, data_path, config_overrides);

		// Parse default log level from environment variable, e.g. "RND_LOG=debug"
		auto env_level = rnd::env::get ("RND_LOG");
		if (env_level)
		{
			try
			{
				auto level = rnd::log::parse_level (*env_level);
				config.default_level = level;

				std::cerr << "Using default log level from RND_LOG environment variable: " << to_string (level) << std::endl;
			}
			catch (std::invalid_argument const & ex)
			{
				std::cerr << "Invalid log level from RND_LOG environment variable: " << ex.what () << std::endl;
			}
		}

		// Parse per logger levels from environment variable, e.g. "RND_LOG_LEVELS=sampler=debug,secure_sampler=trace"
		if (auto env_levels = rnd::env::get ("RND_LOG_LEVELS"))
		{
			for (auto const & env_level_str : rnd::util::split (*env_levels, ","))
			{
				try
				{
					// Split 'logger_name=level' into a pair of 'logger_name' and 'level'
					auto arr = rnd::util::split (env_level_str, "=");
					if (arr.size () != 2)
					{
						throw std::invalid_argument ("Invalid entry: " + env_level_str);
					}

					auto logger_type = rnd::log::parse_type (arr[0]);
					auto logger_level = rnd::log::parse_level (arr[1]);

					config.levels[logger_type] = logger_level;

					std::cerr << "Using logger log level from RND_LOG_LEVELS environment variable: " << to_string (logger_type) << "=" << to_string (logger_level) << std::endl;
				}
				catch (std::invalid_argument const & ex)
				{
					std::cerr << "Invalid log level from RND_LOG_LEVELS environment variable: " << ex.what () << std::endl;
				}
			}
		}

		return config;
	}
	catch (std::runtime_error const & ex)
	{
		std::cerr << "Unable to load log config. Using defaults. Error: " << ex.what () << std::endl;
	}
	return fallback;
}
