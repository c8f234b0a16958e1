#include <lumen/lib/storeconfig.hpp>
#include <lumen/store/completion.hpp>
#include <lumen/store/engine/connection.hpp>
#include <lumen/store/engine/errors.hpp>
#include <lumen/store/engine/factory.hpp>
#include <lumen/store/engine/request.hpp>
#include <lumen/store/engine/transaction.hpp>
#include <lumen/test_common/testutil.hpp>

#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace
{
/** Opens \p name_a at \p version_a, creating \p collections_a when an upgrade is needed */
asio::awaitable<std::shared_ptr<lumen::store::engine::open_request>> open_store (lumen::store::engine::factory & factory_a, std::string name_a, uint64_t version_a, std::vector<std::string> collections_a)
{
	auto request = factory_a.open (name_a, version_a);
	request->on_upgrade_needed ([collections_a] (lumen::store::engine::version_change_event const & event_a) {
		for (auto const & collection : collections_a)
		{
			event_a.connection.create_collection (collection);
		}
	});
	auto completion = lumen::store::watch (factory_a.strand (), *request);
	co_await completion->wait ();
	co_return request;
}

asio::awaitable<void> finish (lumen::async::strand & strand_a, lumen::store::engine::transaction & transaction_a)
{
	auto completion = lumen::store::watch (strand_a, transaction_a);
	co_await completion->wait ();
}

template <typename T>
T as (lumen::store::engine::value const & value_a)
{
	EXPECT_TRUE (std::holds_alternative<T> (value_a));
	return std::holds_alternative<T> (value_a) ? std::get<T> (value_a) : T{};
}
}

TEST (engine, open_creates_store)
{
	lumen::test::context ctx;
	auto path = lumen::test::unique_path ();
	lumen::store::engine::factory factory (ctx.strand, path, lumen::store_config{}, ctx.logger);
	ASSERT_TRUE (factory.supported ());

	auto request = lumen::test::run (ctx.strand, [&] () -> asio::awaitable<std::shared_ptr<lumen::store::engine::open_request>> {
		auto request = factory.open ("first", 1);
		uint64_t old_version = 99;
		request->on_upgrade_needed ([&old_version] (lumen::store::engine::version_change_event const & event_a) {
			old_version = event_a.old_version;
			EXPECT_EQ (1, event_a.new_version);
			event_a.connection.create_collection ("items");
		});
		auto completion = lumen::store::watch (ctx.strand, *request);
		co_await completion->wait ();
		EXPECT_EQ (0, old_version);
		co_return request;
	}());
	ASSERT_TRUE (request->done ());
	ASSERT_NO_LUMEN_ERROR (request->error ());
	auto connection = request->result ();
	ASSERT_NE (nullptr, connection);
	ASSERT_EQ ("first", connection->name ());
	ASSERT_EQ (1, connection->version ());
	ASSERT_EQ (std::vector<std::string>{ "items" }, connection->collection_names ());
	ASSERT_TRUE (std::filesystem::exists (factory.path ("first")));
	connection->close ();
}

TEST (engine, reopen_same_version)
{
	lumen::test::context ctx;
	auto path = lumen::test::unique_path ();
	lumen::store::engine::factory factory (ctx.strand, path, lumen::store_config{}, ctx.logger);
	{
		auto request = lumen::test::run (ctx.strand, open_store (factory, "store", 2, { "b", "a" }));
		ASSERT_NO_LUMEN_ERROR (request->error ());
		request->result ()->close ();
	}
	auto upgraded = false;
	auto request = lumen::test::run (ctx.strand, [&] () -> asio::awaitable<std::shared_ptr<lumen::store::engine::open_request>> {
		auto request = factory.open ("store", 2);
		request->on_upgrade_needed ([&upgraded] (lumen::store::engine::version_change_event const &) {
			upgraded = true;
		});
		auto completion = lumen::store::watch (ctx.strand, *request);
		co_await completion->wait ();
		co_return request;
	}());
	ASSERT_NO_LUMEN_ERROR (request->error ());
	ASSERT_FALSE (upgraded);
	auto connection = request->result ();
	ASSERT_EQ (2, connection->version ());
	ASSERT_EQ ((std::vector<std::string>{ "a", "b" }), connection->collection_names ());
	connection->close ();
}

TEST (engine, upgrade_from_older_version)
{
	lumen::test::context ctx;
	auto path = lumen::test::unique_path ();
	lumen::store::engine::factory factory (ctx.strand, path, lumen::store_config{}, ctx.logger);
	{
		auto request = lumen::test::run (ctx.strand, open_store (factory, "store", 1, { "a" }));
		ASSERT_NO_LUMEN_ERROR (request->error ());
		request->result ()->close ();
	}
	auto request = lumen::test::run (ctx.strand, [&] () -> asio::awaitable<std::shared_ptr<lumen::store::engine::open_request>> {
		auto request = factory.open ("store", 3);
		request->on_upgrade_needed ([] (lumen::store::engine::version_change_event const & event_a) {
			EXPECT_EQ (1, event_a.old_version);
			EXPECT_EQ (3, event_a.new_version);
			ASSERT_THROW (event_a.connection.create_collection ("a"), std::system_error);
			event_a.connection.create_collection ("c");
		});
		auto completion = lumen::store::watch (ctx.strand, *request);
		co_await completion->wait ();
		co_return request;
	}());
	ASSERT_NO_LUMEN_ERROR (request->error ());
	ASSERT_EQ (3, request->result ()->version ());
	ASSERT_EQ ((std::vector<std::string>{ "a", "c" }), request->result ()->collection_names ());
	request->result ()->close ();
}

TEST (engine, version_downgrade)
{
	lumen::test::context ctx;
	auto path = lumen::test::unique_path ();
	lumen::store::engine::factory factory (ctx.strand, path, lumen::store_config{}, ctx.logger);
	{
		auto request = lumen::test::run (ctx.strand, open_store (factory, "store", 5, {}));
		ASSERT_NO_LUMEN_ERROR (request->error ());
		request->result ()->close ();
	}
	auto request = lumen::test::run (ctx.strand, open_store (factory, "store", 4, {}));
	ASSERT_TRUE (request->done ());
	ASSERT_EQ (lumen::store::engine::error::version, request->error ().get_code ());
	ASSERT_EQ (nullptr, request->result ());
}

TEST (engine, upgrade_handler_throws)
{
	lumen::test::context ctx;
	auto path = lumen::test::unique_path ();
	lumen::store::engine::factory factory (ctx.strand, path, lumen::store_config{}, ctx.logger);
	auto request = lumen::test::run (ctx.strand, [&] () -> asio::awaitable<std::shared_ptr<lumen::store::engine::open_request>> {
		auto request = factory.open ("store", 1);
		request->on_upgrade_needed ([] (lumen::store::engine::version_change_event const & event_a) {
			event_a.connection.create_collection ("meta");
		});
		auto completion = lumen::store::watch (ctx.strand, *request);
		co_await completion->wait ();
		co_return request;
	}());
	ASSERT_EQ (lumen::store::engine::error::abort, request->error ().get_code ());

	// Nothing was committed, the next open upgrades from scratch
	auto reopened = lumen::test::run (ctx.strand, [&] () -> asio::awaitable<std::shared_ptr<lumen::store::engine::open_request>> {
		auto request = factory.open ("store", 1);
		request->on_upgrade_needed ([] (lumen::store::engine::version_change_event const & event_a) {
			EXPECT_EQ (0, event_a.old_version);
		});
		auto completion = lumen::store::watch (ctx.strand, *request);
		co_await completion->wait ();
		co_return request;
	}());
	ASSERT_NO_LUMEN_ERROR (reopened->error ());
	reopened->result ()->close ();
}

TEST (engine, invalid_name)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	ASSERT_TRUE (lumen::store::engine::factory::valid_name ("chain-db"));
	ASSERT_TRUE (lumen::store::engine::factory::valid_name ("a.b_c"));
	ASSERT_FALSE (lumen::store::engine::factory::valid_name (""));
	ASSERT_FALSE (lumen::store::engine::factory::valid_name (".hidden"));
	ASSERT_FALSE (lumen::store::engine::factory::valid_name ("a/b"));
	auto request = lumen::test::run (ctx.strand, open_store (factory, "../escape", 1, {}));
	ASSERT_EQ (lumen::store::engine::error::invalid_name, request->error ().get_code ());
}

TEST (engine, version_zero)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	ASSERT_THROW (factory.open ("store", 0), std::invalid_argument);
}

TEST (engine, disabled)
{
	lumen::test::context ctx;
	lumen::store_config config;
	config.enable = false;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), config, ctx.logger);
	ASSERT_FALSE (factory.supported ());
	auto request = lumen::test::run (ctx.strand, open_store (factory, "store", 1, {}));
	ASSERT_EQ (lumen::store::engine::error::invalid_state, request->error ().get_code ());
}

TEST (engine, create_collection_outside_upgrade)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto request = lumen::test::run (ctx.strand, open_store (factory, "store", 1, { "a" }));
	auto connection = request->result ();
	ASSERT_NE (nullptr, connection);
	try
	{
		connection->create_collection ("b");
		FAIL () << "create_collection succeeded outside an upgrade";
	}
	catch (std::system_error const & ex)
	{
		ASSERT_EQ (lumen::store::engine::error::invalid_state, ex.code ());
	}
	connection->close ();
}

TEST (engine, add_get_put_count)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto connection = lumen::test::run (ctx.strand, open_store (factory, "store", 1, { "items" }))->result ();
	ASSERT_NE (nullptr, connection);

	lumen::test::run (ctx.strand, [&] () -> asio::awaitable<void> {
		auto transaction = connection->transaction ({ "items" }, lumen::store::engine::access_mode::read_write);
		auto items = transaction->object_store ("items");
		auto added = items.add (std::string ("one"), uint64_t{ 1 });
		auto put = items.put (std::vector<uint8_t>{ 1, 2, 3 }, std::string ("bytes"));
		auto overwritten = items.put (std::string ("uno"), uint64_t{ 1 });
		auto count = items.count ();
		co_await finish (ctx.strand, *transaction);
		EXPECT_NO_LUMEN_ERROR (transaction->error ());
		EXPECT_TRUE (added->done ());
		EXPECT_EQ (1, as<uint64_t> (added->result ()));
		EXPECT_EQ ("bytes", as<std::string> (put->result ()));
		EXPECT_TRUE (overwritten->done ());
		EXPECT_EQ (2, as<uint64_t> (count->result ()));
	}());

	lumen::test::run (ctx.strand, [&] () -> asio::awaitable<void> {
		auto transaction = connection->transaction ({ "items" }, lumen::store::engine::access_mode::read_only);
		auto items = transaction->object_store ("items");
		auto one = items.get (uint64_t{ 1 });
		auto bytes = items.get (std::string ("bytes"));
		auto absent = items.get (std::string ("absent"));
		co_await finish (ctx.strand, *transaction);
		EXPECT_NO_LUMEN_ERROR (transaction->error ());
		EXPECT_EQ ("uno", as<std::string> (one->result ()));
		EXPECT_EQ ((std::vector<uint8_t>{ 1, 2, 3 }), as<std::vector<uint8_t>> (bytes->result ()));
		EXPECT_TRUE (lumen::store::engine::is_undefined (absent->result ()));
	}());
	ASSERT_EQ (2, lumen::test::run (ctx.strand, lumen::test::count (*connection, "items")));
	connection->close ();
}

TEST (engine, requests_in_issue_order)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto connection = lumen::test::run (ctx.strand, open_store (factory, "store", 1, { "items" }))->result ();
	ASSERT_NE (nullptr, connection);

	std::vector<int> order;
	lumen::test::run (ctx.strand, [&] () -> asio::awaitable<void> {
		auto transaction = connection->transaction ({ "items" }, lumen::store::engine::access_mode::read_write);
		auto items = transaction->object_store ("items");
		auto before = items.get (uint64_t{ 7 });
		before->on_success ([&order] () { order.push_back (1); });
		auto added = items.add (std::string ("seven"), uint64_t{ 7 });
		// Requests issued from a handler run in the same transaction
		added->on_success ([&order, items] () mutable {
			order.push_back (2);
			auto after = items.get (uint64_t{ 7 });
			after->on_success ([&order, after] () {
				order.push_back (3);
				EXPECT_EQ ("seven", std::get<std::string> (after->result ()));
			});
		});
		auto count = items.count ();
		count->on_success ([&order] () { order.push_back (4); });
		co_await finish (ctx.strand, *transaction);
		EXPECT_NO_LUMEN_ERROR (transaction->error ());
		EXPECT_TRUE (lumen::store::engine::is_undefined (before->result ()));
	}());
	ASSERT_EQ ((std::vector<int>{ 1, 2, 4, 3 }), order);
	connection->close ();
}

TEST (engine, duplicate_add_aborts)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto connection = lumen::test::run (ctx.strand, open_store (factory, "store", 1, { "items" }))->result ();
	ASSERT_NE (nullptr, connection);

	lumen::test::run (ctx.strand, [&] () -> asio::awaitable<void> {
		auto transaction = connection->transaction ({ "items" }, lumen::store::engine::access_mode::read_write);
		transaction->object_store ("items").add (std::string ("one"), uint64_t{ 1 });
		co_await finish (ctx.strand, *transaction);
		EXPECT_NO_LUMEN_ERROR (transaction->error ());
	}());

	lumen::test::run (ctx.strand, [&] () -> asio::awaitable<void> {
		auto transaction = connection->transaction ({ "items" }, lumen::store::engine::access_mode::read_write);
		auto items = transaction->object_store ("items");
		auto fresh = items.add (std::string ("two"), uint64_t{ 2 });
		auto duplicate = items.add (std::string ("again"), uint64_t{ 1 });
		auto later = items.put (std::string ("three"), uint64_t{ 3 });
		int completes = 0, aborts = 0, errors = 0;
		auto completion = std::make_shared<lumen::async::completion> (ctx.strand);
		transaction->on_complete ([&completes, completion] () { ++completes; completion->resolve (); });
		transaction->on_abort ([&aborts, completion] () { ++aborts; completion->resolve (); });
		transaction->on_error ([&errors, completion] () { ++errors; completion->resolve (); });
		co_await completion->wait ();
		EXPECT_EQ (0, completes);
		EXPECT_EQ (1, aborts);
		EXPECT_EQ (0, errors);
		EXPECT_TRUE (transaction->finished ());
		EXPECT_EQ (lumen::store::engine::error::constraint, transaction->error ().get_code ());
		EXPECT_NO_LUMEN_ERROR (fresh->error ());
		EXPECT_EQ (lumen::store::engine::error::constraint, duplicate->error ().get_code ());
		EXPECT_EQ (lumen::store::engine::error::abort, later->error ().get_code ());
	}());
	// The successful add before the failure was rolled back
	ASSERT_EQ (1, lumen::test::run (ctx.strand, lumen::test::count (*connection, "items")));
	connection->close ();
}

TEST (engine, explicit_abort)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto connection = lumen::test::run (ctx.strand, open_store (factory, "store", 1, { "items" }))->result ();
	ASSERT_NE (nullptr, connection);

	lumen::test::run (ctx.strand, [&] () -> asio::awaitable<void> {
		auto transaction = connection->transaction ({ "items" }, lumen::store::engine::access_mode::read_write);
		auto items = transaction->object_store ("items");
		auto added = items.add (std::string ("one"), uint64_t{ 1 });
		transaction->abort ();
		EXPECT_THROW (items.put (std::string ("two"), uint64_t{ 2 }), std::system_error);
		co_await finish (ctx.strand, *transaction);
		EXPECT_EQ (lumen::store::engine::error::abort, transaction->error ().get_code ());
		EXPECT_EQ (lumen::store::engine::error::abort, added->error ().get_code ());
		EXPECT_THROW (transaction->abort (), std::system_error);
	}());
	ASSERT_EQ (0, lumen::test::run (ctx.strand, lumen::test::count (*connection, "items")));
	connection->close ();
}

TEST (engine, abort_from_request_handler)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto connection = lumen::test::run (ctx.strand, open_store (factory, "store", 1, { "items" }))->result ();
	ASSERT_NE (nullptr, connection);

	lumen::test::run (ctx.strand, [&] () -> asio::awaitable<void> {
		auto transaction = connection->transaction ({ "items" }, lumen::store::engine::access_mode::read_write);
		auto items = transaction->object_store ("items");
		auto added = items.add (std::string ("one"), uint64_t{ 1 });
		added->on_success ([transaction] () { transaction->abort (); });
		auto second = items.add (std::string ("two"), uint64_t{ 2 });
		co_await finish (ctx.strand, *transaction);
		EXPECT_EQ (lumen::store::engine::error::abort, transaction->error ().get_code ());
		EXPECT_NO_LUMEN_ERROR (added->error ());
		EXPECT_EQ (lumen::store::engine::error::abort, second->error ().get_code ());
	}());
	ASSERT_EQ (0, lumen::test::run (ctx.strand, lumen::test::count (*connection, "items")));
	connection->close ();
}

TEST (engine, read_only)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto connection = lumen::test::run (ctx.strand, open_store (factory, "store", 1, { "items" }))->result ();
	ASSERT_NE (nullptr, connection);

	lumen::test::run (ctx.strand, [&] () -> asio::awaitable<void> {
		auto transaction = connection->transaction ({ "items" }, lumen::store::engine::access_mode::read_only);
		auto items = transaction->object_store ("items");
		try
		{
			items.add (std::string ("one"), uint64_t{ 1 });
			ADD_FAILURE () << "add succeeded in a read only transaction";
		}
		catch (std::system_error const & ex)
		{
			EXPECT_EQ (lumen::store::engine::error::read_only, ex.code ());
		}
		co_await finish (ctx.strand, *transaction);
		EXPECT_NO_LUMEN_ERROR (transaction->error ());
	}());
	connection->close ();
}

TEST (engine, inactive_after_finish)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto connection = lumen::test::run (ctx.strand, open_store (factory, "store", 1, { "items" }))->result ();
	ASSERT_NE (nullptr, connection);

	lumen::test::run (ctx.strand, [&] () -> asio::awaitable<void> {
		auto transaction = connection->transaction ({ "items" }, lumen::store::engine::access_mode::read_write);
		auto items = transaction->object_store ("items");
		co_await finish (ctx.strand, *transaction);
		EXPECT_TRUE (transaction->finished ());
		try
		{
			items.get (uint64_t{ 1 });
			ADD_FAILURE () << "get succeeded on a finished transaction";
		}
		catch (std::system_error const & ex)
		{
			EXPECT_EQ (lumen::store::engine::error::inactive, ex.code ());
		}
	}());
	connection->close ();
}

TEST (engine, scope)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto connection = lumen::test::run (ctx.strand, open_store (factory, "store", 1, { "a", "b" }))->result ();
	ASSERT_NE (nullptr, connection);

	lumen::test::run (ctx.strand, [&] () -> asio::awaitable<void> {
		EXPECT_THROW (connection->transaction ({ "missing" }, lumen::store::engine::access_mode::read_only), std::system_error);
		EXPECT_THROW (connection->transaction ({}, lumen::store::engine::access_mode::read_only), std::system_error);
		auto transaction = connection->transaction ({ "a" }, lumen::store::engine::access_mode::read_only);
		EXPECT_EQ (std::vector<std::string>{ "a" }, transaction->scope ());
		EXPECT_EQ (lumen::store::engine::access_mode::read_only, transaction->mode ());
		try
		{
			transaction->object_store ("b");
			ADD_FAILURE () << "collection outside the scope was returned";
		}
		catch (std::system_error const & ex)
		{
			EXPECT_EQ (lumen::store::engine::error::not_found, ex.code ());
		}
		co_await finish (ctx.strand, *transaction);
	}());
	connection->close ();
}

TEST (engine, key_too_long)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto connection = lumen::test::run (ctx.strand, open_store (factory, "store", 1, { "items" }))->result ();
	ASSERT_NE (nullptr, connection);

	lumen::test::run (ctx.strand, [&] () -> asio::awaitable<void> {
		auto transaction = connection->transaction ({ "items" }, lumen::store::engine::access_mode::read_write);
		auto items = transaction->object_store ("items");
		try
		{
			items.put (std::string ("value"), std::string (4096, 'k'));
			ADD_FAILURE () << "oversized key was accepted";
		}
		catch (std::system_error const & ex)
		{
			EXPECT_EQ (lumen::store::engine::error::data, ex.code ());
		}
		try
		{
			items.put (lumen::store::engine::value{}, uint64_t{ 1 });
			ADD_FAILURE () << "undefined value was accepted";
		}
		catch (std::system_error const & ex)
		{
			EXPECT_EQ (lumen::store::engine::error::data, ex.code ());
		}
		co_await finish (ctx.strand, *transaction);
		EXPECT_NO_LUMEN_ERROR (transaction->error ());
	}());
	connection->close ();
}

TEST (engine, closed_connection)
{
	lumen::test::context ctx;
	lumen::store::engine::factory factory (ctx.strand, lumen::test::unique_path (), lumen::store_config{}, ctx.logger);
	auto connection = lumen::test::run (ctx.strand, open_store (factory, "store", 1, { "items" }))->result ();
	ASSERT_NE (nullptr, connection);

	lumen::test::run (ctx.strand, [&] () -> asio::awaitable<void> {
		// Already scheduled transactions still run before the environment is released
		auto transaction = connection->transaction ({ "items" }, lumen::store::engine::access_mode::read_write);
		auto added = transaction->object_store ("items").add (std::string ("one"), uint64_t{ 1 });
		connection->close ();
		connection->close ();
		EXPECT_TRUE (connection->closed ());
		co_await finish (ctx.strand, *transaction);
		EXPECT_NO_LUMEN_ERROR (transaction->error ());
		try
		{
			connection->transaction ({ "items" }, lumen::store::engine::access_mode::read_only);
			ADD_FAILURE () << "transaction started on a closed connection";
		}
		catch (std::system_error const & ex)
		{
			EXPECT_EQ (lumen::store::engine::error::invalid_state, ex.code ());
		}
	}());
}

TEST (engine, value_encoding)
{
	using lumen::store::engine::value;
	for (auto const & item : { value{ uint64_t{ 42 } }, value{ std::string ("text") }, value{ std::vector<uint8_t>{ 0, 1 } }, value{ std::string () } })
	{
		auto bytes = lumen::store::engine::encode_value (item);
		auto decoded = lumen::store::engine::decode_value (bytes.data (), bytes.size ());
		ASSERT_TRUE (decoded.has_value ());
		ASSERT_EQ (item, *decoded);
	}
	ASSERT_FALSE (lumen::store::engine::decode_value (nullptr, 0).has_value ());
	uint8_t unknown[] = { 9, 0 };
	ASSERT_FALSE (lumen::store::engine::decode_value (unknown, sizeof (unknown)).has_value ());
	// Numbers sort before text and in numeric order
	auto one = lumen::store::engine::encode_key (uint64_t{ 1 }, 511);
	auto big = lumen::store::engine::encode_key (uint64_t{ 256 }, 511);
	auto text = lumen::store::engine::encode_key (std::string ("0"), 511);
	ASSERT_LT (one, big);
	ASSERT_LT (big, text);
}
