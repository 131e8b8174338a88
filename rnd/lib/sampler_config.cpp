#include <rnd/lib/sampler_config.hpp>
#include <rnd/lib/tomlconfig.hpp>

rnd::error rnd::sampler_config::serialize_toml (rnd::tomlconfig & toml) const
{
	toml.put ("sample_shuffle_ratio", sample_shuffle_ratio, "Fraction of the population above which sample () shuffles a copy instead of drawing distinct indices.\ntype:double,[0..1]");
	toml.put ("gauss_cache", gauss_cache, "Cache the second deviate of each Box-Muller pair for the next gauss () call.\ntype:bool");
	return toml.get_error ();
}

rnd::error rnd::sampler_config::deserialize_toml (rnd::tomlconfig & toml)
{
	toml.get<double> ("sample_shuffle_ratio", sample_shuffle_ratio);
	toml.get<bool> ("gauss_cache", gauss_cache);

	if (!toml.get_error () && (!(sample_shuffle_ratio >= 0.0) || sample_shuffle_ratio > 1.0))
	{
		toml.get_error ().set ("sample_shuffle_ratio must be between 0 and 1", rnd::error_config::invalid_value);
	}
	return toml.get_error ();
}
