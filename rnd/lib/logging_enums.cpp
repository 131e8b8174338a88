#include <rnd/lib/enum_util.hpp>
#include <rnd/lib/logging_enums.hpp>
#include <rnd/lib/utility.hpp>

std::string_view rnd::log::to_string (rnd::log::type tag)
{
	return rnd::enum_util::name (tag);
}

std::string_view rnd::log::to_string (rnd::log::level level)
{
	return rnd::enum_util::name (level);
}

std::vector<rnd::log::level> const & rnd::log::all_levels ()
{
	return rnd::enum_util::values<rnd::log::level> ();
}

std::vector<rnd::log::type> const & rnd::log::all_types ()
{
	static std::vector<rnd::log::type> all = [] () {
		std::vector<rnd::log::type> result;
		for (auto type : rnd::enum_util::values<rnd::log::type> ())
		{
			if (type != rnd::log::type::all)
			{
				result.push_back (type);
			}
		}
		return result;
	}();
	return all;
}

rnd::log::level rnd::log::parse_level (std::string_view name)
{
	auto value = rnd::enum_util::try_parse<rnd::log::level> (name);
	if (value.has_value ())
	{
		return value.value ();
	}
	else
	{
		auto all_levels_str = rnd::util::join (rnd::log::all_levels (), ", ", [] (auto const & lvl) {
			return to_string (lvl);
		});

		throw std::invalid_argument ("Invalid log level: " + std::string (name) + ". Must be one of: " + all_levels_str);
	}
}

rnd::log::type rnd::log::parse_type (std::string_view name)
{
	auto value = rnd::enum_util::try_parse<rnd::log::type> (name);
	if (value.has_value () && value.value () != rnd::log::type::all)
	{
		return value.value ();
	}
	else
	{
		throw std::invalid_argument ("Invalid log type: " + std::string (name));
	}
}
