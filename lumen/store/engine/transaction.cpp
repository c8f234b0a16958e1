#include <lumen/lib/logging.hpp>
#include <lumen/store/engine/connection.hpp>
#include <lumen/store/engine/errors.hpp>
#include <lumen/store/engine/lmdb_env.hpp>
#include <lumen/store/engine/transaction.hpp>
#include <lumen/store/engine/transaction_impl.hpp>

#include <algorithm>
#include <system_error>

/*
 * collection
 */

lumen::store::engine::collection::collection (std::shared_ptr<engine::transaction> txn_a, std::string name_a, MDB_dbi dbi_a) :
	txn{ std::move (txn_a) },
	name_m{ std::move (name_a) },
	dbi{ dbi_a }
{
}

std::string const & lumen::store::engine::collection::name () const
{
	return name_m;
}

std::shared_ptr<lumen::store::engine::request> lumen::store::engine::collection::add (engine::value const & value_a, engine::key const & key_a)
{
	return txn->enqueue (transaction::operation::add, dbi, &key_a, &value_a);
}

std::shared_ptr<lumen::store::engine::request> lumen::store::engine::collection::put (engine::value const & value_a, engine::key const & key_a)
{
	return txn->enqueue (transaction::operation::put, dbi, &key_a, &value_a);
}

std::shared_ptr<lumen::store::engine::request> lumen::store::engine::collection::get (engine::key const & key_a)
{
	return txn->enqueue (transaction::operation::get, dbi, &key_a, nullptr);
}

std::shared_ptr<lumen::store::engine::request> lumen::store::engine::collection::count ()
{
	return txn->enqueue (transaction::operation::count, dbi, nullptr, nullptr);
}

/*
 * transaction
 */

lumen::store::engine::transaction::transaction (std::shared_ptr<engine::connection> connection_a, std::vector<std::string> scope_a, engine::access_mode mode_a) :
	connection_m{ std::move (connection_a) },
	scope_m{ std::move (scope_a) },
	mode_m{ mode_a }
{
}

lumen::store::engine::collection lumen::store::engine::transaction::object_store (std::string const & name_a)
{
	if (std::find (scope_m.begin (), scope_m.end (), name_a) == scope_m.end ())
	{
		throw std::system_error (engine::error::not_found, "Collection is not in the transaction scope: " + name_a);
	}
	return engine::collection{ shared_from_this (), name_a, connection_m->dbis.at (name_a) };
}

lumen::store::engine::access_mode lumen::store::engine::transaction::mode () const
{
	return mode_m;
}

std::vector<std::string> const & lumen::store::engine::transaction::scope () const
{
	return scope_m;
}

lumen::error const & lumen::store::engine::transaction::error () const
{
	return error_m;
}

bool lumen::store::engine::transaction::finished () const
{
	return finished_m;
}

void lumen::store::engine::transaction::abort ()
{
	if (finished_m)
	{
		throw std::system_error (engine::error::invalid_state, "Transaction already finished");
	}
	abort_requested = true;
}

void lumen::store::engine::transaction::on_complete (handler handler_a)
{
	complete_handler = std::move (handler_a);
}

void lumen::store::engine::transaction::on_abort (handler handler_a)
{
	abort_handler = std::move (handler_a);
}

void lumen::store::engine::transaction::on_error (handler handler_a)
{
	error_handler = std::move (handler_a);
}

std::shared_ptr<lumen::store::engine::request> lumen::store::engine::transaction::enqueue (operation type_a, MDB_dbi dbi_a, engine::key const * key_a, engine::value const * value_a)
{
	if (finished_m || abort_requested)
	{
		throw std::system_error (engine::error::inactive);
	}
	if ((type_a == operation::add || type_a == operation::put) && mode_m == engine::access_mode::read_only)
	{
		throw std::system_error (engine::error::read_only);
	}
	pending item{ type_a, dbi_a, {}, {}, std::make_shared<engine::request> () };
	if (key_a != nullptr)
	{
		item.key = engine::encode_key (*key_a, connection_m->max_key_size ());
	}
	if (value_a != nullptr)
	{
		item.value = engine::encode_value (*value_a);
	}
	auto result = item.request;
	queue.push_back (std::move (item));
	return result;
}

lumen::error lumen::store::engine::transaction::execute (engine::transaction_impl & txn_a, pending const & item_a, engine::value & result_a)
{
	MDB_val key{ item_a.key.size (), const_cast<uint8_t *> (item_a.key.data ()) };
	switch (item_a.type)
	{
		case operation::add:
		case operation::put:
		{
			MDB_val value{ item_a.value.size (), const_cast<uint8_t *> (item_a.value.data ()) };
			auto status (mdb_put (txn_a, item_a.dbi, &key, &value, item_a.type == operation::add ? MDB_NOOVERWRITE : 0));
			if (status != MDB_SUCCESS)
			{
				return engine::from_mdb_status (status);
			}
			// Writes report the key they wrote
			auto decoded = engine::decode_value (item_a.key.data (), item_a.key.size ());
			debug_assert (decoded.has_value ());
			result_a = decoded.value_or (engine::value{});
			return {};
		}
		case operation::get:
		{
			MDB_val value;
			auto status (mdb_get (txn_a, item_a.dbi, &key, &value));
			if (status == MDB_NOTFOUND)
			{
				result_a = engine::value{};
				return {};
			}
			if (status != MDB_SUCCESS)
			{
				return engine::from_mdb_status (status);
			}
			auto decoded = engine::decode_value (static_cast<uint8_t const *> (value.mv_data), value.mv_size);
			if (!decoded)
			{
				return lumen::error (engine::error::data, "Stored value has an unknown encoding");
			}
			result_a = std::move (*decoded);
			return {};
		}
		case operation::count:
		{
			MDB_stat stat;
			auto status (mdb_stat (txn_a, item_a.dbi, &stat));
			if (status != MDB_SUCCESS)
			{
				return engine::from_mdb_status (status);
			}
			result_a = engine::value{ static_cast<uint64_t> (stat.ms_entries) };
			return {};
		}
	}
	return lumen::error (engine::error::unknown, "Unknown operation");
}

void lumen::store::engine::transaction::run ()
{
	auto & logger = connection_m->logger;
	if (!connection_m->env)
	{
		error_m = lumen::error (engine::error::invalid_state, "Connection is closed");
		fail_pending (error_m);
		finished_m = true;
		notify (error_handler);
		return;
	}

	int status;
	engine::transaction_impl txn (status, *connection_m->env, mode_m == engine::access_mode::read_only);
	if (status != MDB_SUCCESS)
	{
		error_m = engine::from_mdb_status (status);
		logger.warn (lumen::log::type::engine, "Unable to begin transaction on {}: {}", connection_m->name (), error_m.get_message ());
		fail_pending (error_m);
		finished_m = true;
		notify (error_handler);
		return;
	}

	// Handlers fired below may issue further requests, which join the back of the queue
	while (!queue.empty () && !abort_requested)
	{
		auto item = std::move (queue.front ());
		queue.pop_front ();
		engine::value result;
		auto error_l = execute (txn, item, result);
		if (error_l)
		{
			error_m = error_l;
			item.request->fail (std::move (error_l));
			abort_requested = true;
		}
		else
		{
			item.request->succeed (std::move (result));
		}
	}

	if (abort_requested)
	{
		txn.abort ();
		if (!error_m)
		{
			error_m = lumen::error (engine::error::abort, "Transaction aborted");
		}
		fail_pending (lumen::error (engine::error::abort, "Transaction aborted"));
		finished_m = true;
		logger.debug (lumen::log::type::engine, "Transaction aborted on {}: {}", connection_m->name (), error_m.get_message ());
		notify (abort_handler);
	}
	else
	{
		status = txn.commit ();
		finished_m = true;
		if (status != MDB_SUCCESS)
		{
			error_m = engine::from_mdb_status (status);
			logger.error (lumen::log::type::engine, "Commit failed on {}: {}", connection_m->name (), error_m.get_message ());
			notify (error_handler);
		}
		else
		{
			notify (complete_handler);
		}
	}
}

void lumen::store::engine::transaction::fail_pending (lumen::error const & error_a)
{
	while (!queue.empty ())
	{
		auto item = std::move (queue.front ());
		queue.pop_front ();
		item.request->fail (error_a);
	}
}

void lumen::store::engine::transaction::notify (handler & handler_a)
{
	auto handler_l = std::move (handler_a);
	complete_handler = nullptr;
	abort_handler = nullptr;
	error_handler = nullptr;
	if (handler_l)
	{
		handler_l ();
	}
}
