#pragma once

#include <rnd/lib/logging_enums.hpp>
#include <rnd/lib/tomlconfig.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace rnd
{
class log_config final
{
public:
	rnd::error serialize_toml (rnd::tomlconfig &) const;
	rnd::error deserialize_toml (rnd::tomlconfig &);

private:
	void serialize (rnd::tomlconfig &) const;
	void deserialize (rnd::tomlconfig &);

public:
	rnd::log::level default_level{ rnd::log::level::info };
	rnd::log::level flush_level{ rnd::log::level::error };

	std::map<rnd::log::type, rnd::log::level> levels;

	struct console_config
	{
		bool enable{ true };
		bool colors{ true };
		bool to_cerr{ false };
	};

	struct file_config
	{
		bool enable{ true };
		std::size_t max_size{ 32 * 1024 * 1024 };
		std::size_t rotation_count{ 4 };
	};

	console_config console;
	file_config file;

public: // Predefined defaults
	static log_config cli_default ();
	static log_config library_default ();
	static log_config tests_default ();
	static log_config sample_config (); // For auto-generated sample config files

private:
	/// Returns placeholder log levels for all loggers
	static std::map<rnd::log::type, rnd::log::level> default_levels (rnd::log::level);
};

rnd::log_config load_log_config (rnd::log_config fallback, std::filesystem::path const & data_path, std::vector<std::string> const & config_overrides = {});

class logger final
{
public:
	explicit logger (std::string identifier = "");
	~logger ();

	// Disallow copies
	logger (logger const &) = delete;

public:
	static void initialize (rnd::log_config fallback, std::optional<std::filesystem::path> data_path = std::nullopt, std::vector<std::string> const & config_overrides = {});
	static void initialize_for_tests (rnd::log_config fallback);
	static void flush ();

private:
	static bool global_initialized;
	static rnd::log_config global_config;
	static std::vector<spdlog::sink_ptr> global_sinks;

	static void initialize_common (rnd::log_config const &, std::optional<std::filesystem::path> data_path);

public:
	template <class... Args>
	void trace (rnd::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).trace (fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void debug (rnd::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).debug (fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void info (rnd::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).info (fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void warn (rnd::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).warn (fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void error (rnd::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).error (fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void critical (rnd::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).critical (fmt, std::forward<Args> (args)...);
	}

	/** True if a message of \p level for \p type would be emitted */
	bool should_log (rnd::log::type type, rnd::log::level level);

private:
	std::string const identifier;

	std::map<rnd::log::type, std::shared_ptr<spdlog::logger>> spd_loggers;
	std::shared_mutex mutex;

private:
	spdlog::logger & get_logger (rnd::log::type);
	std::shared_ptr<spdlog::logger> make_logger (rnd::log::type);
	rnd::log::level find_level (rnd::log::type) const;

	static spdlog::level::level_enum to_spdlog_level (rnd::log::level);
};

/**
 * Returns a logger instance shared by components that are not given one explicitly.
 * Logging falls back to log_config::library_default () if it was not initialized by the application.
 */
rnd::logger & default_logger ();
}
