#include <rnd/lib/tomlconfig.hpp>

#include <fstream>
#include <sstream>

rnd::tomlconfig::tomlconfig () :
	tree (cpptoml::make_table ()),
	error (std::make_shared<rnd::error> ())
{
}

rnd::tomlconfig::tomlconfig (std::shared_ptr<cpptoml::table> const & tree_a, std::shared_ptr<rnd::error> const & error_a) :
	tree (tree_a),
	error (error_a ? error_a : std::make_shared<rnd::error> ())
{
}

rnd::error & rnd::tomlconfig::read (std::istream & stream_overrides, std::filesystem::path const & path_a)
{
	std::ifstream stream (path_a);
	if (!stream.fail ())
	{
		read (stream_overrides, stream);
	}
	else
	{
		error->set ("Unable to open config file: " + path_a.string (), rnd::error_config::generic);
	}
	return *error;
}

rnd::error & rnd::tomlconfig::read (std::istream & stream_a)
{
	std::stringstream stream_override_empty;
	stream_override_empty << std::endl;
	return read (stream_override_empty, stream_a);
}

rnd::error & rnd::tomlconfig::read (std::istream & stream_first_a, std::istream & stream_second_a)
{
	try
	{
		tree = cpptoml::parse_base_and_override_files (stream_first_a, stream_second_a, cpptoml::parser::merge_type::ignore, true);
	}
	catch (std::runtime_error const & ex)
	{
		*error = ex;
	}
	return *error;
}

void rnd::tomlconfig::write (std::ostream & stream_a) const
{
	cpptoml::toml_writer writer{ stream_a, "" };
	tree->accept (writer);
}

rnd::error & rnd::tomlconfig::get_error ()
{
	return *error;
}

bool rnd::tomlconfig::empty () const
{
	return tree->empty ();
}

bool rnd::tomlconfig::has_key (std::string const & key_a) const
{
	return tree->contains (key_a);
}

boost::optional<rnd::tomlconfig> rnd::tomlconfig::get_optional_child (std::string const & key_a)
{
	boost::optional<tomlconfig> child_config;
	if (auto child = tree->get_table (key_a))
	{
		child_config = tomlconfig (child, error);
	}
	return child_config;
}

rnd::tomlconfig & rnd::tomlconfig::put_child (std::string const & key_a, rnd::tomlconfig const & conf_a)
{
	tree->insert (key_a, conf_a.tree);
	return *this;
}

std::string rnd::tomlconfig::to_string (bool comment_values) const
{
	std::stringstream ss, ss_processed;
	write (ss);
	std::string line;
	while (std::getline (ss, line, '\n'))
	{
		if (!line.empty () && line[0] != '[')
		{
			if (line[0] == '#') // Already commented
			{
				line = "\t" + line;
			}
			else
			{
				line = comment_values ? "\t# " + line : "\t" + line;
			}
		}
		ss_processed << line << std::endl;
	}
	return ss_processed.str ();
}

void rnd::tomlconfig::get_config (std::string const & key, bool & target)
{
	try
	{
		if (tree->contains_qualified (key))
		{
			auto val (tree->get_qualified_as<std::string> (key));
			if (*val == "true")
			{
				target = true;
			}
			else if (*val == "false")
			{
				target = false;
			}
			else
			{
				set_error<bool> (rnd::error_config::invalid_value, key);
			}
		}
	}
	catch (std::runtime_error const & ex)
	{
		set_error<bool> (ex, key);
	}
}
