#include <lumen/lib/numbers.hpp>
#include <lumen/lib/storeconfig.hpp>
#include <lumen/store/completion.hpp>
#include <lumen/store/database.hpp>
#include <lumen/store/engine/connection.hpp>
#include <lumen/store/engine/errors.hpp>
#include <lumen/store/engine/factory.hpp>
#include <lumen/store/transaction.hpp>
#include <lumen/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <functional>
#include <future>

using namespace std::chrono_literals;

namespace
{
/** Destroys the database on its strand, also when a test returns early */
using database_handle = std::unique_ptr<lumen::store::database, std::function<void (lumen::store::database *)>>;

database_handle on_strand (lumen::async::strand & strand_a, std::unique_ptr<lumen::store::database> database_a)
{
	return database_handle{ database_a.release (), [&strand_a] (lumen::store::database * database_l) {
							   lumen::test::destroy (strand_a, std::unique_ptr<lumen::store::database> (database_l));
						   } };
}

database_handle open_database (lumen::async::strand & strand_a, lumen::store::engine::factory & factory_a, std::string name_a = "chain-db")
{
	auto [database, error] = lumen::test::run (strand_a, lumen::store::database::open (&factory_a, name_a));
	EXPECT_NO_LUMEN_ERROR (error);
	return on_strand (strand_a, std::move (database));
}
}

TEST (database, open_without_engine)
{
	lumen::test::context ctx;
	auto [database, error] = lumen::test::run (ctx.strand, lumen::store::database::open (nullptr, "chain-db"));
	ASSERT_EQ (nullptr, database);
	ASSERT_EQ (lumen::store::open_error::no_environment, error.get_code ());
}

TEST (database, open_not_supported)
{
	lumen::test::context ctx;
	lumen::store_config config;
	config.enable = false;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), config, ctx.logger);
	auto [database, error] = lumen::test::run (ctx.strand, lumen::store::database::open (&factory, "chain-db"));
	ASSERT_EQ (nullptr, database);
	ASSERT_EQ (lumen::store::open_error::not_supported, error.get_code ());
}

TEST (database, open_failed)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto [database, error] = lumen::test::run (ctx.strand, lumen::store::database::open (&factory, ".invalid"));
	ASSERT_EQ (nullptr, database);
	ASSERT_EQ (lumen::store::open_error::open_failed, error.get_code ());
	ASSERT_FALSE (error.get_message ().empty ());
}

TEST (database, open_newer_store)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto request = lumen::test::run (ctx.strand, [&] () -> asio::awaitable<std::shared_ptr<lumen::store::engine::open_request>> {
		auto request = factory.open ("chain-db", lumen::store::version_current + 1);
		auto completion = lumen::store::watch (ctx.strand, *request);
		co_await completion->wait ();
		co_return request;
	}());
	ASSERT_NO_LUMEN_ERROR (request->error ());
	request->result ()->close ();

	auto [database, error] = lumen::test::run (ctx.strand, lumen::store::database::open (&factory, "chain-db"));
	ASSERT_EQ (nullptr, database);
	ASSERT_EQ (lumen::store::open_error::open_failed, error.get_code ());
}

TEST (database, open)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto database = open_database (ctx.strand, factory);
	ASSERT_NE (nullptr, database);
	ASSERT_EQ ("chain-db", database->name ());
	ASSERT_TRUE (std::filesystem::exists (factory.path ("chain-db")));
}

TEST (database, invalid_header)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto database = open_database (ctx.strand, factory);
	ASSERT_NE (nullptr, database);

	auto bytes = lumen::test::make_header (42).to_bytes ();
	bytes.pop_back ();
	auto error = lumen::test::run (ctx.strand, database->insert_header (bytes));
	ASSERT_EQ (lumen::store::access_error::invalid_header, error.get_code ());

	std::vector<uint8_t> empty;
	error = lumen::test::run (ctx.strand, database->insert_header (empty));
	ASSERT_EQ (lumen::store::access_error::invalid_header, error.get_code ());
}

namespace lumen::store
{
TEST (database, insert_header)
{
	lumen::test::context ctx;
	engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto database = open_database (ctx.strand, factory);
	ASSERT_NE (nullptr, database);

	auto header = lumen::test::make_header (42);
	auto bytes = header.to_bytes ();
	auto hash = lumen::hash_scale_encoded_header (bytes).to_string ();
	ASSERT_NO_LUMEN_ERROR (lumen::test::run (ctx.strand, database->insert_header (bytes)));

	auto [stored, stored_error] = lumen::test::run (ctx.strand, database->get (lumen::tables::block_headers, hash));
	ASSERT_NO_LUMEN_ERROR (stored_error);
	ASSERT_TRUE (stored.has_value ());
	ASSERT_EQ (lumen::to_hex (bytes), *stored);

	auto [best, best_error] = lumen::test::run (ctx.strand, database->get (lumen::tables::best_chain, uint64_t{ 42 }));
	ASSERT_NO_LUMEN_ERROR (best_error);
	ASSERT_TRUE (best.has_value ());
	ASSERT_EQ (hash, *best);

	ASSERT_EQ (1, lumen::test::run (ctx.strand, lumen::test::count (*database->connection, "block-headers")));
	ASSERT_EQ (1, lumen::test::run (ctx.strand, lumen::test::count (*database->connection, "best-chain")));
}

TEST (database, insert_duplicate)
{
	lumen::test::context ctx;
	engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto database = open_database (ctx.strand, factory);
	ASSERT_NE (nullptr, database);

	auto bytes = lumen::test::make_header (42).to_bytes ();
	ASSERT_NO_LUMEN_ERROR (lumen::test::run (ctx.strand, database->insert_header (bytes)));
	ASSERT_NO_LUMEN_ERROR (lumen::test::run (ctx.strand, database->insert_header (bytes)));
	ASSERT_EQ (1, lumen::test::run (ctx.strand, lumen::test::count (*database->connection, "block-headers")));
	ASSERT_EQ (1, lumen::test::run (ctx.strand, lumen::test::count (*database->connection, "best-chain")));

	auto [best, best_error] = lumen::test::run (ctx.strand, database->get (lumen::tables::best_chain, uint64_t{ 42 }));
	ASSERT_NO_LUMEN_ERROR (best_error);
	ASSERT_EQ (lumen::hash_scale_encoded_header (bytes).to_string (), best.value_or (""));
}

TEST (database, same_number_overwrites)
{
	lumen::test::context ctx;
	engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto database = open_database (ctx.strand, factory);
	ASSERT_NE (nullptr, database);

	auto first = lumen::test::make_header (7, 1);
	auto second = lumen::test::make_header (7, 2);
	ASSERT_NE (first.hash (), second.hash ());
	ASSERT_NO_LUMEN_ERROR (lumen::test::run (ctx.strand, database->insert_header (first.to_bytes ())));
	ASSERT_NO_LUMEN_ERROR (lumen::test::run (ctx.strand, database->insert_header (second.to_bytes ())));

	// Both headers are kept, the best chain follows the latest insert
	ASSERT_EQ (2, lumen::test::run (ctx.strand, lumen::test::count (*database->connection, "block-headers")));
	ASSERT_EQ (1, lumen::test::run (ctx.strand, lumen::test::count (*database->connection, "best-chain")));
	auto [best, best_error] = lumen::test::run (ctx.strand, database->get (lumen::tables::best_chain, uint64_t{ 7 }));
	ASSERT_NO_LUMEN_ERROR (best_error);
	ASSERT_EQ (second.hash ().to_string (), best.value_or (""));

	// Reinserting the first header leaves the best chain alone
	ASSERT_NO_LUMEN_ERROR (lumen::test::run (ctx.strand, database->insert_header (first.to_bytes ())));
	auto [again, again_error] = lumen::test::run (ctx.strand, database->get (lumen::tables::best_chain, uint64_t{ 7 }));
	ASSERT_NO_LUMEN_ERROR (again_error);
	ASSERT_EQ (second.hash ().to_string (), again.value_or (""));
}

TEST (database, get_absent)
{
	lumen::test::context ctx;
	engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto database = open_database (ctx.strand, factory);
	ASSERT_NE (nullptr, database);

	auto [header, header_error] = lumen::test::run (ctx.strand, database->get (lumen::tables::block_headers, std::string (64, '0')));
	ASSERT_NO_LUMEN_ERROR (header_error);
	ASSERT_FALSE (header.has_value ());

	auto [best, best_error] = lumen::test::run (ctx.strand, database->get (lumen::tables::best_chain, uint64_t{ 1 }));
	ASSERT_NO_LUMEN_ERROR (best_error);
	ASSERT_FALSE (best.has_value ());
}

TEST (database, get_key_too_long)
{
	lumen::test::context ctx;
	engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto database = open_database (ctx.strand, factory);
	ASSERT_NE (nullptr, database);

	auto [value, error] = lumen::test::run (ctx.strand, database->get (lumen::tables::block_headers, std::string (4096, 'a')));
	ASSERT_NO_LUMEN_ERROR (error);
	ASSERT_FALSE (value.has_value ());
}

TEST (database, get_unexpected_value_type)
{
	lumen::test::context ctx;
	engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto database = open_database (ctx.strand, factory);
	ASSERT_NE (nullptr, database);

	auto written = lumen::test::run (ctx.strand, [&] () -> asio::awaitable<lumen::error> {
		auto txn = lumen::store::begin (*database->connection, { lumen::tables::best_chain }, engine::access_mode::read_write);
		auto completion = lumen::store::watch (ctx.strand, *txn);
		txn->object_store ("best-chain").put (uint64_t{ 12345 }, uint64_t{ 3 });
		co_return co_await lumen::store::await_completion (*txn, *completion, 0ms);
	}());
	ASSERT_NO_LUMEN_ERROR (written);

	auto [value, error] = lumen::test::run (ctx.strand, database->get (lumen::tables::best_chain, uint64_t{ 3 }));
	ASSERT_EQ (lumen::store::corrupted_error::unexpected_value_type, error.get_code ());
	ASSERT_FALSE (value.has_value ());
}

TEST (database, reopen)
{
	lumen::test::context ctx;
	engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto bytes = lumen::test::make_header (100, 9).to_bytes ();
	{
		auto database = open_database (ctx.strand, factory);
		ASSERT_NE (nullptr, database);
		ASSERT_NO_LUMEN_ERROR (lumen::test::run (ctx.strand, database->insert_header (bytes)));
	}
	auto database = open_database (ctx.strand, factory);
	ASSERT_NE (nullptr, database);
	ASSERT_EQ (lumen::store::version_current, database->connection->version ());
	auto [best, error] = lumen::test::run (ctx.strand, database->get (lumen::tables::best_chain, uint64_t{ 100 }));
	ASSERT_NO_LUMEN_ERROR (error);
	ASSERT_EQ (lumen::hash_scale_encoded_header (bytes).to_string (), best.value_or (""));
}

TEST (database, close_on_destruction)
{
	lumen::test::context ctx;
	engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto database = open_database (ctx.strand, factory);
	ASSERT_NE (nullptr, database);
	auto connection = database->connection;
	ASSERT_NO_LUMEN_ERROR (lumen::test::run (ctx.strand, database->insert_header (lumen::test::make_header (3).to_bytes ())));

	database.reset ();
	ASSERT_TRUE (connection->closed ());
	// The environment is released before an open issued afterwards runs
	auto reopened = open_database (ctx.strand, factory);
	ASSERT_NE (nullptr, reopened);
	ASSERT_EQ (1, lumen::test::run (ctx.strand, lumen::test::count (*reopened->connection, "block-headers")));
}

TEST (database, insert_timeout_rolls_back)
{
	lumen::test::context ctx{ 2 };
	lumen::async::strand caller{ ctx.io_ctx->get_executor () };
	lumen::store_config config;
	config.operation_timeout = 20ms;
	engine::factory factory (ctx.strand, lumen::test::unique_path (), config, ctx.logger);
	auto database = open_database (ctx.strand, factory);
	ASSERT_NE (nullptr, database);

	// The engine strand is busy for longer than the caller is willing to wait
	auto release = lumen::test::hold (ctx.strand);
	auto error = lumen::test::run (caller, database->insert_header (lumen::test::make_header (42).to_bytes ()));
	release.set_value ();
	EXPECT_EQ (access_error::timeout, error.get_code ());

	// The transaction runs once the strand is free but commits nothing
	ASSERT_EQ (0, lumen::test::run (ctx.strand, lumen::test::count (*database->connection, "block-headers")));
	ASSERT_EQ (0, lumen::test::run (ctx.strand, lumen::test::count (*database->connection, "best-chain")));

	ASSERT_NO_LUMEN_ERROR (lumen::test::run (ctx.strand, database->insert_header (lumen::test::make_header (42).to_bytes ())));
	ASSERT_EQ (1, lumen::test::run (ctx.strand, lumen::test::count (*database->connection, "block-headers")));
}

TEST (database, get_timeout)
{
	lumen::test::context ctx{ 2 };
	lumen::async::strand caller{ ctx.io_ctx->get_executor () };
	lumen::store_config config;
	config.operation_timeout = 20ms;
	engine::factory factory (ctx.strand, lumen::test::unique_path (), config, ctx.logger);
	auto database = open_database (ctx.strand, factory);
	ASSERT_NE (nullptr, database);

	auto release = lumen::test::hold (ctx.strand);
	auto [value, error] = lumen::test::run (caller, database->get (lumen::tables::best_chain, uint64_t{ 1 }));
	release.set_value ();
	EXPECT_EQ (access_error::timeout, error.get_code ());
	EXPECT_FALSE (value.has_value ());
}
}

TEST (database, operation_timeout_config)
{
	lumen::test::context ctx;
	lumen::store_config config;
	config.operation_timeout = 5000ms;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), config, ctx.logger);
	auto database = open_database (ctx.strand, factory);
	ASSERT_NE (nullptr, database);
	ASSERT_NO_LUMEN_ERROR (lumen::test::run (ctx.strand, database->insert_header (lumen::test::make_header (1).to_bytes ())));
}
