#include <lumen/lib/headers.hpp>
#include <lumen/lib/logging.hpp>
#include <lumen/lib/numbers.hpp>
#include <lumen/store/completion.hpp>
#include <lumen/store/database.hpp>
#include <lumen/store/engine/connection.hpp>
#include <lumen/store/engine/errors.hpp>
#include <lumen/store/engine/factory.hpp>
#include <lumen/store/engine/request.hpp>
#include <lumen/store/schema.hpp>
#include <lumen/store/transaction.hpp>

#include <system_error>

auto lumen::store::database::open (engine::factory * factory_a, std::string name_a) -> asio::awaitable<open_result>
{
	if (factory_a == nullptr)
	{
		co_return open_result{ nullptr, lumen::error (open_error::no_environment, "No storage engine available") };
	}
	if (!factory_a->supported ())
	{
		co_return open_result{ nullptr, lumen::error (open_error::not_supported, "Storage engine is not supported") };
	}

	auto & logger_l = factory_a->logger;
	auto const timeout = factory_a->config ().operation_timeout;
	auto request = factory_a->open (name_a, version_current);
	request->on_upgrade_needed ([&logger_l] (engine::version_change_event const & event_a) {
		lumen::store::create_schema (event_a.connection, event_a.old_version, logger_l);
	});
	auto opened = lumen::store::watch (factory_a->strand (), *request);
	if (!co_await opened->wait (timeout))
	{
		logger_l.error (lumen::log::type::store, "Timed out opening {}", name_a);
		co_return open_result{ nullptr, lumen::error (open_error::timeout, "Timed out opening " + name_a) };
	}
	if (request->error ())
	{
		logger_l.error (lumen::log::type::store, "Failed to open {}: {}", name_a, request->error ().get_message ());
		co_return open_result{ nullptr, lumen::error (open_error::open_failed, request->error ().get_message ()) };
	}

	auto connection_l = request->result ();
	logger_l.info (lumen::log::type::store, "Opened header store {} at version {}", name_a, connection_l->version ());
	co_return open_result{ std::make_unique<database> (connection_l, timeout, logger_l), lumen::error{} };
}

lumen::store::database::database (std::shared_ptr<engine::connection> connection_a, std::chrono::milliseconds operation_timeout_a, lumen::logger & logger_a) :
	connection{ std::move (connection_a) },
	operation_timeout{ operation_timeout_a },
	logger{ logger_a }
{
}

lumen::store::database::~database ()
{
	debug_assert (connection->strand ().running_in_this_thread (), "database destroyed outside its strand");
	connection->close ();
}

std::string const & lumen::store::database::name () const
{
	return connection->name ();
}

asio::awaitable<lumen::error> lumen::store::database::insert_header (std::span<uint8_t const> header_a)
{
	lumen::header header;
	if (auto ec = lumen::decode_header (header_a, header))
	{
		co_return lumen::error (access_error::invalid_header, "Invalid header: " + ec.message ());
	}
	auto const hash = lumen::hash_scale_encoded_header (header_a).to_string ();
	auto const number = header.number;

	auto txn = lumen::store::begin (*connection, { lumen::tables::block_headers, lumen::tables::best_chain }, engine::access_mode::read_write);
	// Watched before anything is awaited so the outcome cannot be missed
	auto committed = lumen::store::watch (connection->strand (), *txn);

	auto block_headers = txn->object_store (lumen::to_string (lumen::tables::block_headers));
	auto best_chain = txn->object_store (lumen::to_string (lumen::tables::best_chain));

	auto add = block_headers.add (lumen::to_hex (header_a), hash);
	auto added = std::make_shared<lumen::async::completion> (connection->strand ());
	add->on_success ([added, best_chain, hash, number] () mutable {
		// Unconditional, a header at the same height replaces the previous entry
		best_chain.put (hash, number);
		added->resolve ();
	});
	add->on_error ([added] () {
		added->resolve ();
	});

	if (!co_await added->wait (operation_timeout))
	{
		// The header must not be stored after the caller was told it was not
		lumen::store::abort_unfinished (*txn);
		co_return lumen::error (access_error::timeout, "Timed out inserting header " + hash);
	}
	if (add->error ())
	{
		if (add->error () == engine::error::constraint)
		{
			logger.debug (lumen::log::type::store, "Header {} already stored", hash);
			co_return lumen::error{};
		}
		co_return lumen::error (access_error::transaction_error, add->error ().get_message ());
	}

	auto result = co_await lumen::store::await_completion (*txn, *committed, operation_timeout);
	if (result == engine::error::timeout)
	{
		co_return lumen::error (access_error::timeout, result.get_message ());
	}
	if (result)
	{
		logger.warn (lumen::log::type::store, "Failed to insert header {}: {}", hash, result.get_message ());
		co_return lumen::error (access_error::transaction_error, result.get_message ());
	}
	logger.debug (lumen::log::type::store, "Inserted header {} at number {}", hash, number);
	co_return lumen::error{};
}

auto lumen::store::database::get (lumen::tables table_a, engine::key key_a) -> asio::awaitable<get_result>
{
	auto txn = lumen::store::begin (*connection, { table_a }, engine::access_mode::read_only);
	std::shared_ptr<engine::request> request;
	try
	{
		request = txn->object_store (lumen::to_string (table_a)).get (key_a);
	}
	catch (std::system_error const & ex)
	{
		// A key the engine cannot store cannot have a value
		if (ex.code () != engine::error::data)
		{
			throw;
		}
	}
	if (request == nullptr)
	{
		co_return get_result{ std::nullopt, lumen::error{} };
	}

	auto done = lumen::store::watch (connection->strand (), *request);
	if (!co_await done->wait (operation_timeout))
	{
		lumen::store::abort_unfinished (*txn);
		co_return get_result{ std::nullopt, lumen::error (access_error::timeout, "Timed out reading " + lumen::to_string (table_a)) };
	}
	if (request->error () == engine::error::data)
	{
		co_return get_result{ std::nullopt, lumen::error (access_error::corrupted, request->error ().get_message ()) };
	}
	if (request->error ())
	{
		co_return get_result{ std::nullopt, lumen::error (access_error::transaction_error, request->error ().get_message ()) };
	}

	auto const & value = request->result ();
	if (engine::is_undefined (value))
	{
		co_return get_result{ std::nullopt, lumen::error{} };
	}
	if (auto text = std::get_if<std::string> (&value))
	{
		co_return get_result{ *text, lumen::error{} };
	}
	co_return get_result{ std::nullopt, lumen::error (corrupted_error::unexpected_value_type, "Expected a text value in " + lumen::to_string (table_a)) };
}
