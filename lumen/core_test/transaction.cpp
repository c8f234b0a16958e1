#include <lumen/lib/storeconfig.hpp>
#include <lumen/store/completion.hpp>
#include <lumen/store/engine/connection.hpp>
#include <lumen/store/engine/errors.hpp>
#include <lumen/store/engine/factory.hpp>
#include <lumen/store/engine/request.hpp>
#include <lumen/store/schema.hpp>
#include <lumen/store/transaction.hpp>
#include <lumen/test_common/testutil.hpp>

#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace
{
std::shared_ptr<lumen::store::engine::connection> open_headers (lumen::test::context & ctx, lumen::store::engine::factory & factory_a)
{
	auto request = lumen::test::run (ctx.strand, [&] () -> asio::awaitable<std::shared_ptr<lumen::store::engine::open_request>> {
		auto request = factory_a.open ("headers", lumen::store::version_current);
		request->on_upgrade_needed ([&ctx] (lumen::store::engine::version_change_event const & event_a) {
			lumen::store::create_schema (event_a.connection, event_a.old_version, ctx.logger);
		});
		auto completion = lumen::store::watch (ctx.strand, *request);
		co_await completion->wait ();
		co_return request;
	}());
	return request->result ();
}
}

TEST (transaction, begin_maps_tables)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto connection = open_headers (ctx, factory);
	ASSERT_NE (nullptr, connection);
	lumen::test::run (ctx.strand, [&] () -> asio::awaitable<void> {
		auto txn = lumen::store::begin (*connection, { lumen::tables::block_headers, lumen::tables::best_chain }, lumen::store::engine::access_mode::read_write);
		EXPECT_EQ ((std::vector<std::string>{ "block-headers", "best-chain" }), txn->scope ());
		EXPECT_EQ (lumen::store::engine::access_mode::read_write, txn->mode ());
		auto completion = lumen::store::watch (ctx.strand, *txn);
		auto result = co_await lumen::store::await_completion (*txn, *completion, 0ms);
		EXPECT_NO_LUMEN_ERROR (result);
	}());
	connection->close ();
}

TEST (transaction, commit)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto connection = open_headers (ctx, factory);
	ASSERT_NE (nullptr, connection);
	lumen::test::run (ctx.strand, [&] () -> asio::awaitable<void> {
		auto txn = lumen::store::begin (*connection, { lumen::tables::best_chain }, lumen::store::engine::access_mode::read_write);
		auto completion = lumen::store::watch (ctx.strand, *txn);
		txn->object_store ("best-chain").put (std::string ("ab"), uint64_t{ 1 });
		auto result = co_await lumen::store::await_completion (*txn, *completion, 5000ms);
		EXPECT_NO_LUMEN_ERROR (result);
	}());
	ASSERT_EQ (1, lumen::test::run (ctx.strand, lumen::test::count (*connection, "best-chain")));
	connection->close ();
}

TEST (transaction, abort_reported)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto connection = open_headers (ctx, factory);
	ASSERT_NE (nullptr, connection);
	lumen::test::run (ctx.strand, [&] () -> asio::awaitable<void> {
		auto txn = lumen::store::begin (*connection, { lumen::tables::best_chain }, lumen::store::engine::access_mode::read_write);
		auto completion = lumen::store::watch (ctx.strand, *txn);
		txn->object_store ("best-chain").put (std::string ("ab"), uint64_t{ 1 });
		txn->abort ();
		auto result = co_await lumen::store::await_completion (*txn, *completion, 0ms);
		EXPECT_EQ (lumen::store::engine::error::abort, result.get_code ());
	}());
	ASSERT_EQ (0, lumen::test::run (ctx.strand, lumen::test::count (*connection, "best-chain")));
	connection->close ();
}

TEST (transaction, failing_request_reported)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto connection = open_headers (ctx, factory);
	ASSERT_NE (nullptr, connection);
	lumen::test::run (ctx.strand, [&] () -> asio::awaitable<void> {
		auto txn = lumen::store::begin (*connection, { lumen::tables::best_chain }, lumen::store::engine::access_mode::read_write);
		auto completion = lumen::store::watch (ctx.strand, *txn);
		auto best_chain = txn->object_store ("best-chain");
		best_chain.add (std::string ("ab"), uint64_t{ 1 });
		best_chain.add (std::string ("cd"), uint64_t{ 1 });
		auto result = co_await lumen::store::await_completion (*txn, *completion, 0ms);
		EXPECT_EQ (lumen::store::engine::error::constraint, result.get_code ());
	}());
	connection->close ();
}

TEST (transaction, timeout)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto connection = open_headers (ctx, factory);
	ASSERT_NE (nullptr, connection);
	lumen::test::run (ctx.strand, [&] () -> asio::awaitable<void> {
		auto txn = lumen::store::begin (*connection, { lumen::tables::best_chain }, lumen::store::engine::access_mode::read_only);
		// Never resolved, the transaction outcome is not watched
		lumen::async::completion completion{ ctx.strand };
		auto start = std::chrono::steady_clock::now ();
		auto result = co_await lumen::store::await_completion (*txn, completion, 50ms);
		EXPECT_EQ (lumen::store::engine::error::timeout, result.get_code ());
		EXPECT_GE (std::chrono::steady_clock::now () - start, 50ms);
	}());
	connection->close ();
}

TEST (transaction, timeout_rolls_back)
{
	lumen::test::context ctx{ 2 };
	lumen::async::strand caller{ ctx.io_ctx->get_executor () };
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto connection = open_headers (ctx, factory);
	ASSERT_NE (nullptr, connection);

	// The transaction cannot run before the caller gives up on it
	auto release = lumen::test::hold (ctx.strand);
	auto aborted = lumen::test::run (caller, [&] () -> asio::awaitable<std::shared_ptr<lumen::store::engine::transaction>> {
		auto txn = lumen::store::begin (*connection, { lumen::tables::best_chain }, lumen::store::engine::access_mode::read_write);
		auto completion = lumen::store::watch (ctx.strand, *txn);
		txn->object_store ("best-chain").put (std::string ("ab"), uint64_t{ 1 });
		auto result = co_await lumen::store::await_completion (*txn, *completion, 20ms);
		EXPECT_EQ (lumen::store::engine::error::timeout, result.get_code ());
		EXPECT_FALSE (txn->finished ());
		co_return txn;
	}());
	release.set_value ();

	ASSERT_EQ (0, lumen::test::run (ctx.strand, lumen::test::count (*connection, "best-chain")));
	ASSERT_TRUE (aborted->finished ());
	ASSERT_EQ (lumen::store::engine::error::abort, aborted->error ().get_code ());
	lumen::test::run (ctx.strand, [connection] () -> asio::awaitable<void> {
		connection->close ();
		co_return;
	}());
}

TEST (transaction, unknown_table)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	// Store without a schema
	auto request = lumen::test::run (ctx.strand, [&] () -> asio::awaitable<std::shared_ptr<lumen::store::engine::open_request>> {
		auto request = factory.open ("bare", 1);
		auto completion = lumen::store::watch (ctx.strand, *request);
		co_await completion->wait ();
		co_return request;
	}());
	auto connection = request->result ();
	ASSERT_NE (nullptr, connection);
	try
	{
		lumen::store::begin (*connection, { lumen::tables::block_headers }, lumen::store::engine::access_mode::read_only);
		FAIL () << "transaction started over a missing collection";
	}
	catch (std::system_error const & ex)
	{
		ASSERT_EQ (lumen::store::engine::error::not_found, ex.code ());
	}
	connection->close ();
}
