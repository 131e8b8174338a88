#pragma once

#include <rnd/lib/errors.hpp>
#include <rnd/lib/sampler_config.hpp>
#include <rnd/lib/tomlconfig.hpp>

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace rnd
{
/** Top level configuration, stored in config-rnd.toml */
class rnd_config final
{
public:
	rnd::error serialize_toml (rnd::tomlconfig &) const;
	rnd::error deserialize_toml (rnd::tomlconfig &);

	rnd::sampler_config sampler;

	static std::string const filename;
};

/**
 * Loads \p config_filename from \p data_path, falling back to the values of \p fallback for missing keys.
 * Values in \p config_overrides ("key=value" strings) take precedence over the file.
 * @throws std::runtime_error if the file cannot be parsed or contains invalid values
 */
template <typename T>
T load_config_file (T fallback, std::filesystem::path const & config_filename, std::filesystem::path const & data_path, std::vector<std::string> const & config_overrides)
{
	std::stringstream config_overrides_stream;
	for (auto const & entry : config_overrides)
	{
		config_overrides_stream << entry << std::endl;
	}
	config_overrides_stream << std::endl;

	rnd::tomlconfig toml;
	auto toml_config_path = data_path / config_filename;
	if (std::filesystem::exists (toml_config_path))
	{
		auto error = toml.read (config_overrides_stream, toml_config_path);
		if (error)
		{
			throw std::runtime_error (error.get_message ());
		}
	}
	else if (!config_overrides.empty ())
	{
		auto error = toml.read (config_overrides_stream);
		if (error)
		{
			throw std::runtime_error (error.get_message ());
		}
	}

	T config = fallback;
	auto error = config.deserialize_toml (toml);
	if (error)
	{
		throw std::runtime_error (error.get_message ());
	}
	return config;
}
}
