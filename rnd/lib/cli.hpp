#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace rnd
{
class config_key_value_pair
{
public:
	std::string key;
	std::string value;
};

/** Converts --config key=value pairs into toml lines, quoting values that are not already quoted */
std::vector<std::string> config_overrides (std::vector<config_key_value_pair> const & key_value_pairs_a);

std::istream & operator>> (std::istream & is, rnd::config_key_value_pair & into);
}
