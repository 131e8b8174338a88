#include <rnd/lib/errors.hpp>
#include <rnd/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

TEST (errors, categories)
{
	std::error_code sampling = rnd::error_sampling::empty_sequence;
	std::error_code source = rnd::error_source::unavailable;
	std::error_code config = rnd::error_config::invalid_value;
	ASSERT_STREQ ("error_sampling", sampling.category ().name ());
	ASSERT_STREQ ("error_source", source.category ().name ());
	ASSERT_STREQ ("error_config", config.category ().name ());
	ASSERT_EQ ("Cannot choose from an empty sequence", sampling.message ());
	ASSERT_EQ ("Secure random not available in this environment", source.message ());
	ASSERT_NE (sampling, source);
}

TEST (errors, kinds)
{
	ASSERT_TRUE (rnd::is_type_error (rnd::error_sampling::not_integer));
	ASSERT_TRUE (rnd::is_type_error (rnd::error_sampling::not_a_number));
	ASSERT_TRUE (rnd::is_type_error (rnd::error_sampling::invalid_length));
	ASSERT_FALSE (rnd::is_type_error (rnd::error_sampling::min_greater_than_max));
	ASSERT_FALSE (rnd::is_type_error (rnd::error_sampling::invalid_count));
	ASSERT_FALSE (rnd::is_type_error (rnd::error_source::unavailable));
}

TEST (errors, throw_error)
{
	ASSERT_THROW (rnd::throw_error (rnd::error_sampling::not_integer), rnd::type_error);
	ASSERT_THROW (rnd::throw_error (rnd::error_sampling::empty_range), rnd::range_error);
	try
	{
		rnd::throw_error (rnd::error_sampling::not_a_number, "weights: abc");
		FAIL () << "Expected type_error";
	}
	catch (rnd::type_error const & err)
	{
		ASSERT_EQ (err.code (), rnd::error_sampling::not_a_number);
		ASSERT_NE (std::string (err.what ()).find ("weights: abc"), std::string::npos);
	}
	// All kinds can be handled as std::system_error
	ASSERT_THROW (rnd::throw_error (rnd::error_sampling::zero_step), std::system_error);
}

TEST (errors, error_adapter)
{
	rnd::error error;
	ASSERT_FALSE (error);
	error = rnd::error_config::invalid_value;
	ASSERT_TRUE (error);
	ASSERT_TRUE (error == rnd::error_config::invalid_value);
	ASSERT_EQ ("Invalid configuration value", error.get_message ());
	error.set_message ("sample_shuffle_ratio must be between 0 and 1");
	ASSERT_TRUE (error == rnd::error_config::invalid_value);
	ASSERT_EQ ("sample_shuffle_ratio must be between 0 and 1", error.get_message ());
	error = std::runtime_error ("failure");
	ASSERT_TRUE (error == rnd::error_config::generic);
	ASSERT_EQ ("failure", error.get_message ());
	error.clear ();
	ASSERT_FALSE (error);
	ASSERT_TRUE (error.get_message ().empty ());
	error.set_message ("no value");
	ASSERT_TRUE (error == rnd::error_config::generic);
	error.set ("missing", rnd::error_config::missing_value);
	ASSERT_TRUE (error == rnd::error_config::missing_value);
	ASSERT_EQ ("missing", error.get_message ());
}

TEST (errors, assert_macros)
{
	std::error_code ok;
	std::error_code failure = rnd::error_sampling::generic;
	ASSERT_NO_ERROR (ok);
	ASSERT_IS_ERROR (failure);
}
