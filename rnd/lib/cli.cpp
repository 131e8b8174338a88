#include <rnd/lib/cli.hpp>

#include <boost/format.hpp>

#include <istream>

std::vector<std::string> rnd::config_overrides (std::vector<config_key_value_pair> const & key_value_pairs_a)
{
	std::vector<std::string> overrides;
	auto format (boost::format ("%1%=%2%"));
	auto format_add_escaped_quotes (boost::format ("%1%=\"%2%\""));
	for (auto const & pair : key_value_pairs_a)
	{
		auto already_escaped = pair.value.find ('\"') != std::string::npos;
		overrides.push_back (((!already_escaped ? format_add_escaped_quotes : format) % pair.key % pair.value).str ());
	}
	return overrides;
}

std::istream & rnd::operator>> (std::istream & is, rnd::config_key_value_pair & into)
{
	char ch;
	while (is >> ch && ch != '=')
	{
		into.key += ch;
	}
	return is >> into.value;
}
