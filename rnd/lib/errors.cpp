#include <rnd/lib/errors.hpp>

std::string rnd::error_sampling_messages::message (int ev) const
{
	switch (static_cast<rnd::error_sampling> (ev))
	{
		case rnd::error_sampling::generic:
			return "Unknown error";
		case rnd::error_sampling::not_integer:
			return "Arguments must be integers";
		case rnd::error_sampling::not_a_number:
			return "Arguments must be numbers";
		case rnd::error_sampling::invalid_length:
			return "Length must be a non-negative integer";
		case rnd::error_sampling::not_finite:
			return "Arguments must be finite numbers";
		case rnd::error_sampling::min_greater_than_max:
			return "min must be less than or equal to max";
		case rnd::error_sampling::range_too_large:
			return "Range exceeds the supported size";
		case rnd::error_sampling::zero_step:
			return "step argument must not be zero";
		case rnd::error_sampling::empty_range:
			return "Empty range for randrange";
		case rnd::error_sampling::empty_sequence:
			return "Cannot choose from an empty sequence";
		case rnd::error_sampling::invalid_count:
			return "Count must be a non-negative integer";
		case rnd::error_sampling::sample_too_large:
			return "Sample size cannot be larger than population";
		case rnd::error_sampling::weights_length_mismatch:
			return "Weights must have the same length as population";
		case rnd::error_sampling::invalid_weight:
			return "All weights must be non-negative finite numbers";
		case rnd::error_sampling::weight_sum_not_positive:
			return "Weight sum must be positive";
		case rnd::error_sampling::non_positive_sigma:
			return "Standard deviation must be positive";
	}

	return "Invalid error code";
}

std::string rnd::error_source_messages::message (int ev) const
{
	switch (static_cast<rnd::error_source> (ev))
	{
		case rnd::error_source::generic:
			return "Unknown error";
		case rnd::error_source::unavailable:
			return "Secure random not available in this environment";
	}

	return "Invalid error code";
}

std::string rnd::error_config_messages::message (int ev) const
{
	switch (static_cast<rnd::error_config> (ev))
	{
		case rnd::error_config::generic:
			return "Unknown error";
		case rnd::error_config::invalid_value:
			return "Invalid configuration value";
		case rnd::error_config::missing_value:
			return "Missing value in configuration";
	}

	return "Invalid error code";
}

bool rnd::is_type_error (std::error_code const & code_a)
{
	return code_a == rnd::error_sampling::not_integer || code_a == rnd::error_sampling::not_a_number || code_a == rnd::error_sampling::invalid_length;
}

void rnd::throw_error (rnd::error_sampling code_a)
{
	auto code = make_error_code (code_a);
	if (is_type_error (code))
	{
		throw rnd::type_error (code);
	}
	throw rnd::range_error (code);
}

void rnd::throw_error (rnd::error_sampling code_a, std::string const & what_a)
{
	auto code = make_error_code (code_a);
	if (is_type_error (code))
	{
		throw rnd::type_error (code, what_a);
	}
	throw rnd::range_error (code, what_a);
}

rnd::error::error (std::error_code code_a)
{
	code = code_a;
}

rnd::error::error (std::string message_a)
{
	code = rnd::error_config::generic;
	message = std::move (message_a);
}

rnd::error::error (std::exception const & exception_a)
{
	code = rnd::error_config::generic;
	message = exception_a.what ();
}

rnd::error & rnd::error::operator= (rnd::error const & err_a)
{
	code = err_a.code;
	message = err_a.message;
	return *this;
}

rnd::error & rnd::error::operator= (rnd::error && err_a)
{
	code = err_a.code;
	message = std::move (err_a.message);
	return *this;
}

/** Assign error code */
rnd::error & rnd::error::operator= (std::error_code const code_a)
{
	code = code_a;
	message.clear ();
	return *this;
}

/** Set the error to rnd::error_config::generic and the error message to \p message_a */
rnd::error & rnd::error::operator= (std::string message_a)
{
	code = rnd::error_config::generic;
	message = std::move (message_a);
	return *this;
}

/** Sets the error to rnd::error_config::generic and adopts the exception error message. */
rnd::error & rnd::error::operator= (std::exception const & exception_a)
{
	code = rnd::error_config::generic;
	message = exception_a.what ();
	return *this;
}

/** Return true if this#error_code equals the parameter */
bool rnd::error::operator== (std::error_code const code_a) const
{
	return code == code_a;
}

rnd::error::operator std::error_code () const
{
	return code;
}

/** True if there's an error */
rnd::error::operator bool () const
{
	return code.value () != 0;
}

/**
 * Get error message, or an empty string if there's no error. If a custom error message is set,
 * that will be returned, otherwise the error_code#message() is returned.
 */
std::string rnd::error::get_message () const
{
	std::string res = message;
	if (code && res.empty ())
	{
		res = code.message ();
	}
	return res;
}

rnd::error & rnd::error::set (std::string message_a, std::error_code code_a)
{
	message = std::move (message_a);
	code = code_a;
	return *this;
}

/** Set a custom error message. If the error code is not set, it will be set to rnd::error_config::generic. */
rnd::error & rnd::error::set_message (std::string message_a)
{
	if (!code)
	{
		code = rnd::error_config::generic;
	}
	message = std::move (message_a);
	return *this;
}

rnd::error & rnd::error::clear ()
{
	code.clear ();
	message.clear ();
	return *this;
}
