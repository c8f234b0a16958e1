#include <lumen/lib/errors.hpp>
#include <lumen/lib/numbers.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

TEST (error, empty)
{
	lumen::error error;
	ASSERT_FALSE (error);
	ASSERT_TRUE (error.get_message ().empty ());
	ASSERT_FALSE (static_cast<std::error_code> (error));
}

TEST (error, message_only)
{
	lumen::error error ("Store is gone");
	ASSERT_TRUE (error);
	ASSERT_EQ (lumen::error_common::generic, error.get_code ());
	ASSERT_EQ ("Store is gone", error.get_message ());

	lumen::error unset;
	unset.set_message ("Late message");
	ASSERT_EQ (lumen::error_common::generic, unset.get_code ());
}

TEST (error, from_exception)
{
	lumen::error error (std::runtime_error ("disk full"));
	ASSERT_EQ (lumen::error_common::exception, error.get_code ());
	ASSERT_EQ ("disk full", error.get_message ());
	ASSERT_EQ ("Exception thrown", error.get_code ().message ());
}

TEST (error, code_message)
{
	lumen::error error (lumen::error_headers::truncated);
	ASSERT_TRUE (error == lumen::error_headers::truncated);
	ASSERT_EQ ("Header is truncated", error.get_message ());

	// Assigning a code drops the previous message
	error.set ("Custom", lumen::error_config::invalid_value);
	ASSERT_EQ ("Custom", error.get_message ());
	error = lumen::error_config::missing_value;
	ASSERT_EQ (lumen::error_config::missing_value, error.get_code ());
	ASSERT_NE ("Custom", error.get_message ());
}

TEST (numbers, block_hash_equality)
{
	lumen::block_hash first;
	lumen::block_hash second;
	ASSERT_EQ (first, second);
	second.bytes[31] = 1;
	ASSERT_NE (first, second);
	std::string text;
	second.encode_hex (text);
	ASSERT_EQ (std::string (62, '0') + "01", text);
}
