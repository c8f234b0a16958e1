#include <lumen/lib/logging.hpp>
#include <lumen/lib/logging_enums.hpp>
#include <lumen/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <algorithm>

TEST (log_parse, parse_level)
{
	ASSERT_EQ (lumen::log::parse_level ("error"), lumen::log::level::error);
	ASSERT_EQ (lumen::log::parse_level ("off"), lumen::log::level::off);
	ASSERT_THROW (lumen::log::parse_level ("enumnotpresent"), std::invalid_argument);
	ASSERT_THROW (lumen::log::parse_level (""), std::invalid_argument);
	ASSERT_THROW (lumen::log::parse_level ("_last"), std::invalid_argument);
}

TEST (log_parse, parse_type)
{
	ASSERT_EQ (lumen::log::parse_type ("store"), lumen::log::type::store);
	ASSERT_EQ (lumen::log::parse_type ("engine"), lumen::log::type::engine);
	ASSERT_THROW (lumen::log::parse_type ("enumnotpresent"), std::invalid_argument);
	ASSERT_THROW (lumen::log::parse_type ("_last"), std::invalid_argument);
}

TEST (log_parse, all_types)
{
	auto const & types = lumen::log::all_types ();
	ASSERT_TRUE (std::find (types.begin (), types.end (), lumen::log::type::schema) != types.end ());
	ASSERT_TRUE (std::find (types.begin (), types.end (), lumen::log::type::_last) == types.end ());
	ASSERT_EQ ("schema", lumen::log::to_string (lumen::log::type::schema));
}

TEST (logger, identifier)
{
	lumen::logger logger{ "ident" };
	logger.info (lumen::log::type::test, "Message {}", 1);
	logger.log (lumen::log::level::debug, lumen::log::type::store, "Message {} {}", 2, "text");
	lumen::logger::flush ();
}
