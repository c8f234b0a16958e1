#include <lumen/lib/storeconfig.hpp>
#include <lumen/store/completion.hpp>
#include <lumen/store/engine/connection.hpp>
#include <lumen/store/engine/errors.hpp>
#include <lumen/store/engine/factory.hpp>
#include <lumen/store/schema.hpp>
#include <lumen/store/tables.hpp>
#include <lumen/test_common/testutil.hpp>

#include <gtest/gtest.h>

namespace
{
/** Opens \p name_a at \p version_a with \p upgrade_a as the upgrade handler */
asio::awaitable<std::shared_ptr<lumen::store::engine::open_request>> open_store (lumen::store::engine::factory & factory_a, std::string name_a, uint64_t version_a, lumen::store::engine::open_request::upgrade_handler upgrade_a)
{
	auto request = factory_a.open (name_a, version_a);
	request->on_upgrade_needed (std::move (upgrade_a));
	auto completion = lumen::store::watch (factory_a.strand (), *request);
	co_await completion->wait ();
	co_return request;
}
}

TEST (tables, names)
{
	ASSERT_EQ ("best-chain", lumen::to_string (lumen::tables::best_chain));
	ASSERT_EQ ("block-headers", lumen::to_string (lumen::tables::block_headers));
}

TEST (schema, create_from_empty)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto request = lumen::test::run (ctx.strand, open_store (factory, "schema", lumen::store::version_current, [&ctx] (lumen::store::engine::version_change_event const & event_a) {
		lumen::store::create_schema (event_a.connection, event_a.old_version, ctx.logger);
	}));
	ASSERT_NO_LUMEN_ERROR (request->error ());
	auto connection = request->result ();
	ASSERT_EQ (lumen::store::version_current, connection->version ());
	ASSERT_EQ ((std::vector<std::string>{ "best-chain", "block-headers" }), connection->collection_names ());
	ASSERT_EQ (0, lumen::test::run (ctx.strand, lumen::test::count (*connection, "block-headers")));
	ASSERT_EQ (0, lumen::test::run (ctx.strand, lumen::test::count (*connection, "best-chain")));
	connection->close ();
}

TEST (schema, current_version_creates_nothing)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	// A store already at version 1 whose upgrade to 2 runs the schema again
	auto request = lumen::test::run (ctx.strand, open_store (factory, "schema", 1, [&ctx] (lumen::store::engine::version_change_event const & event_a) {
		lumen::store::create_schema (event_a.connection, event_a.old_version, ctx.logger);
	}));
	ASSERT_NO_LUMEN_ERROR (request->error ());
	request->result ()->close ();

	auto upgraded = lumen::test::run (ctx.strand, open_store (factory, "schema", 2, [&ctx] (lumen::store::engine::version_change_event const & event_a) {
		EXPECT_EQ (1, event_a.old_version);
		lumen::store::create_schema (event_a.connection, event_a.old_version, ctx.logger);
	}));
	ASSERT_NO_LUMEN_ERROR (upgraded->error ());
	ASSERT_EQ ((std::vector<std::string>{ "best-chain", "block-headers" }), upgraded->result ()->collection_names ());
	upgraded->result ()->close ();
}

TEST (schema, existing_collection_aborts_upgrade)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto request = lumen::test::run (ctx.strand, open_store (factory, "schema", 1, [&ctx] (lumen::store::engine::version_change_event const & event_a) {
		event_a.connection.create_collection ("block-headers");
		lumen::store::create_schema (event_a.connection, event_a.old_version, ctx.logger);
	}));
	ASSERT_EQ (lumen::store::engine::error::abort, request->error ().get_code ());
	ASSERT_EQ (nullptr, request->result ());
}

TEST (schema, outside_upgrade)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto request = lumen::test::run (ctx.strand, open_store (factory, "schema", 1, nullptr));
	ASSERT_NO_LUMEN_ERROR (request->error ());
	auto connection = request->result ();
	ASSERT_TRUE (connection->collection_names ().empty ());
	ASSERT_THROW (lumen::store::create_schema (*connection, 0, ctx.logger), std::system_error);
	connection->close ();
}
