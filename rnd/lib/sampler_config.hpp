#pragma once

#include <rnd/lib/errors.hpp>

namespace rnd
{
class tomlconfig;

/** Tunables for rnd::sampler */
class sampler_config final
{
public:
	rnd::error serialize_toml (rnd::tomlconfig &) const;
	rnd::error deserialize_toml (rnd::tomlconfig &);

public:
	/** sample () shuffles a copy of the population when k > n * ratio, otherwise it draws distinct indices by rejection */
	double sample_shuffle_ratio{ 0.5 };
	/** Keep the second Box-Muller deviate for the next gauss () call */
	bool gauss_cache{ true };
};
}
