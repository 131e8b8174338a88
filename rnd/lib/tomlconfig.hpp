#pragma once

#include <rnd/lib/errors.hpp>

#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>
#include <boost/type_traits.hpp>

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <cpptoml.h>

namespace rnd
{
/** Type trait to determine if T is compatible with boost's lexical_cast */
template <class T>
struct is_lexical_castable : std::integral_constant<bool,
							 (std::is_default_constructible<T>::value && boost::has_right_shift<std::basic_istream<char>, T>::value)>
{
};

/* Type descriptions used in configuration error messages */
// clang-format off
template <typename T> inline std::string type_desc () { return "an unknown type"; }
template <> inline std::string type_desc<uint16_t> () { return "a 16-bit unsigned integer"; }
template <> inline std::string type_desc<uint32_t> () { return "a 32-bit unsigned integer"; }
template <> inline std::string type_desc<uint64_t> () { return "a 64-bit unsigned integer"; }
template <> inline std::string type_desc<double> () { return "a double precision floating point number"; }
template <> inline std::string type_desc<std::string> () { return "a string"; }
template <> inline std::string type_desc<bool> () { return "a boolean"; }
// clang-format on

/**
 * Manages a table in a toml configuration table hierarchy.
 * Child tables share the error state of their parent, the first error is kept until get_error ().clear () is called.
 */
class tomlconfig
{
public:
	tomlconfig ();
	tomlconfig (std::shared_ptr<cpptoml::table> const & tree_a, std::shared_ptr<rnd::error> const & error_a = nullptr);

	/** Reads \p path_a, keys in \p stream_overrides take precedence over the file */
	rnd::error & read (std::istream & stream_overrides, std::filesystem::path const & path_a);
	rnd::error & read (std::istream & stream_a);
	/** Read from two streams where keys in the first will take precedence over those in the second stream. */
	rnd::error & read (std::istream & stream_first_a, std::istream & stream_second_a);
	void write (std::ostream & stream_a) const;

	rnd::error & get_error ();
	bool empty () const;
	bool has_key (std::string const & key_a) const;
	boost::optional<tomlconfig> get_optional_child (std::string const & key_a);
	tomlconfig & put_child (std::string const & key_a, rnd::tomlconfig const & conf_a);

	/** Renders the table, with every value commented out if \p comment_values is set */
	std::string to_string (bool comment_values) const;

	/** Set value for the given key. Any existing value will be overwritten. */
	template <typename T>
	tomlconfig & put (std::string const & key, T const & value, boost::optional<char const *> documentation_a = boost::none)
	{
		tree->insert (key, value);
		if (documentation_a)
		{
			tree->document (key, *documentation_a);
		}
		return *this;
	}

	/**
	 * Reads \p key into \p target, leaving \p target unchanged if the key is missing.
	 * Sets rnd::error_config::invalid_value if the value does not convert to T.
	 */
	template <typename T>
	tomlconfig & get (std::string const & key, T & target)
	{
		get_config (key, target);
		return *this;
	}

	/** Value of \p key, the default value of T if missing */
	template <typename T>
	T get (std::string const & key)
	{
		T target{};
		get_config (key, target);
		return target;
	}

	/** Every key of this table with its value converted to T */
	template <typename T>
	std::vector<std::pair<std::string, T>> get_values ()
	{
		std::vector<std::pair<std::string, T>> result;
		for (auto & entry : *tree)
		{
			T target{};
			get_config (entry.first, target);
			result.emplace_back (entry.first, target);
		}
		return result;
	}

private:
	template <typename T, typename = std::enable_if_t<rnd::is_lexical_castable<T>::value>>
	void get_config (std::string const & key, T & target)
	{
		try
		{
			if (tree->contains_qualified (key))
			{
				auto val (tree->get_qualified_as<std::string> (key));
				if (!boost::conversion::try_lexical_convert<T> (*val, target))
				{
					set_error<T> (rnd::error_config::invalid_value, key);
				}
			}
		}
		catch (std::runtime_error const & ex)
		{
			set_error<T> (ex, key);
		}
	}

	void get_config (std::string const & key, bool & target);

	template <typename T, typename V>
	void set_error (V error_a, std::string const & key)
	{
		if (!*error)
		{
			*error = error_a;
			error->set_message (key + " is not " + type_desc<T> ());
		}
	}

	/** The config node being managed */
	std::shared_ptr<cpptoml::table> tree;
	std::shared_ptr<rnd::error> error;
};
}
