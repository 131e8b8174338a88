#pragma once

#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

namespace rnd
{
/** Argument validation errors raised by the samplers */
enum class error_sampling
{
	generic = 1,
	not_integer,
	not_a_number,
	invalid_length,
	not_finite,
	min_greater_than_max,
	range_too_large,
	zero_step,
	empty_range,
	empty_sequence,
	invalid_count,
	sample_too_large,
	weights_length_mismatch,
	invalid_weight,
	weight_sum_not_positive,
	non_positive_sigma
};

/** Entropy source errors */
enum class error_source
{
	generic = 1,
	unavailable
};

/** Config file deserialization related errors */
enum class error_config
{
	generic = 1,
	invalid_value,
	missing_value
};
} // rnd namespace

// Convenience macro to implement the standard boilerplate for using std::error_code with enums
// Use this at the end of any header defining one or more error code enums.
#define REGISTER_ERROR_CODES(namespace_name, enum_type)                                                        \
	namespace namespace_name                                                                                   \
	{                                                                                                          \
		static_assert (static_cast<int> (enum_type::generic) > 0, "The first error enum must be generic = 1"); \
		class enum_type##_messages : public std::error_category                                                \
		{                                                                                                      \
		public:                                                                                                \
			char const * name () const noexcept override                                                       \
			{                                                                                                  \
				return #enum_type;                                                                             \
			}                                                                                                  \
                                                                                                               \
			std::string message (int ev) const override;                                                       \
		};                                                                                                     \
                                                                                                               \
		inline std::error_category const & enum_type##_category ()                                             \
		{                                                                                                      \
			static enum_type##_messages instance;                                                              \
			return instance;                                                                                   \
		}                                                                                                      \
                                                                                                               \
		inline std::error_code make_error_code (::namespace_name::enum_type err)                               \
		{                                                                                                      \
			return { static_cast<int> (err), enum_type##_category () };                                        \
		}                                                                                                      \
	}                                                                                                          \
	namespace std                                                                                              \
	{                                                                                                          \
		template <>                                                                                            \
		struct is_error_code_enum<::namespace_name::enum_type> : std::true_type                                \
		{                                                                                                      \
		};                                                                                                     \
	}

REGISTER_ERROR_CODES (rnd, error_sampling);
REGISTER_ERROR_CODES (rnd, error_source);
REGISTER_ERROR_CODES (rnd, error_config);

namespace rnd
{
/** The argument is not of the required kind (not an integer, not a number) */
class type_error : public std::system_error
{
public:
	using std::system_error::system_error;
};

/** The argument has the right kind but a value outside the allowed domain */
class range_error : public std::system_error
{
public:
	using std::system_error::system_error;
};

/** No secure entropy source exists in the running environment */
class unavailable_error : public std::system_error
{
public:
	using std::system_error::system_error;
};

/** True for sampling errors describing a wrong kind of argument rather than a wrong value */
bool is_type_error (std::error_code const & code_a);

/**
 * Throws rnd::type_error or rnd::range_error depending on the kind of \p code_a
 */
[[noreturn]] void throw_error (rnd::error_sampling code_a);
[[noreturn]] void throw_error (rnd::error_sampling code_a, std::string const & what_a);

/** Adapter for std::error_code, std::exception and bool flags to facilitate unified error handling */
class error
{
public:
	error () = default;
	error (rnd::error const & error_a) = default;
	error (rnd::error && error_a) = default;

	error (std::error_code code_a);
	error (std::string message_a);
	error (std::exception const & exception_a);
	error & operator= (rnd::error const & err_a);
	error & operator= (rnd::error && err_a);
	error & operator= (std::error_code code_a);
	error & operator= (std::string message_a);
	error & operator= (std::exception const & exception_a);
	bool operator== (std::error_code code_a) const;
	explicit operator std::error_code () const;
	explicit operator bool () const;
	std::string get_message () const;
	error & set (std::string message_a, std::error_code code_a = rnd::error_config::generic);
	error & set_message (std::string message_a);
	error & clear ();

private:
	std::error_code code;
	std::string message;
};
}
