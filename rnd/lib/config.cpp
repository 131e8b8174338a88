#include <rnd/lib/config.hpp>

std::string const rnd::rnd_config::filename = "config-rnd.toml";

rnd::error rnd::rnd_config::serialize_toml (rnd::tomlconfig & toml) const
{
	rnd::tomlconfig sampler_l;
	sampler.serialize_toml (sampler_l);
	toml.put_child ("sampler", sampler_l);
	return toml.get_error ();
}

rnd::error rnd::rnd_config::deserialize_toml (rnd::tomlconfig & toml)
{
	if (auto sampler_l = toml.get_optional_child ("sampler"))
	{
		sampler.deserialize_toml (*sampler_l);
	}
	return toml.get_error ();
}
