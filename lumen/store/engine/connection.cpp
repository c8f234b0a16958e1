#include <lumen/lib/logging.hpp>
#include <lumen/store/engine/connection.hpp>
#include <lumen/store/engine/errors.hpp>
#include <lumen/store/engine/lmdb_env.hpp>
#include <lumen/store/engine/transaction_impl.hpp>

#include <system_error>

lumen::store::engine::connection::connection (lumen::async::strand & strand_a, lumen::logger & logger_a, std::string name_a, std::unique_ptr<engine::env> env_a) :
	strand_m{ strand_a },
	logger{ logger_a },
	name_m{ std::move (name_a) },
	env{ std::move (env_a) }
{
}

lumen::store::engine::connection::~connection ()
{
	debug_assert (upgrade_txn == nullptr);
}

std::string const & lumen::store::engine::connection::name () const
{
	return name_m;
}

uint64_t lumen::store::engine::connection::version () const
{
	return version_m;
}

std::vector<std::string> lumen::store::engine::connection::collection_names () const
{
	std::vector<std::string> result;
	for (auto const & [name_l, dbi] : dbis)
	{
		result.push_back (name_l);
	}
	return result;
}

lumen::async::strand & lumen::store::engine::connection::strand () const
{
	return strand_m;
}

void lumen::store::engine::connection::create_collection (std::string const & name_a)
{
	if (upgrade_txn == nullptr)
	{
		throw std::system_error (engine::error::invalid_state, "Collections can only be created during an upgrade");
	}
	if (dbis.count (name_a) != 0)
	{
		throw std::system_error (engine::error::constraint, "Collection already exists: " + name_a);
	}
	if (name_a.empty () || name_a == "meta")
	{
		throw std::system_error (engine::error::invalid_name, "Reserved collection name: " + name_a);
	}
	MDB_dbi dbi;
	auto status (mdb_dbi_open (*upgrade_txn, name_a.c_str (), MDB_CREATE, &dbi));
	if (status != MDB_SUCCESS)
	{
		auto error = engine::from_mdb_status (status);
		throw std::system_error (error.get_code (), error.get_message ());
	}
	dbis.emplace (name_a, dbi);
	logger.debug (lumen::log::type::engine, "Created collection {} in {}", name_a, name_m);
}

std::shared_ptr<lumen::store::engine::transaction> lumen::store::engine::connection::transaction (std::vector<std::string> const & names_a, engine::access_mode mode_a)
{
	if (closed_m || upgrade_txn != nullptr)
	{
		throw std::system_error (engine::error::invalid_state, "Connection is closed or upgrading");
	}
	if (names_a.empty ())
	{
		throw std::system_error (engine::error::not_found, "Transaction scope is empty");
	}
	for (auto const & name_l : names_a)
	{
		if (dbis.count (name_l) == 0)
		{
			throw std::system_error (engine::error::not_found, "Unknown collection: " + name_l);
		}
	}
	auto result = std::make_shared<engine::transaction> (shared_from_this (), names_a, mode_a);
	asio::post (strand_m, [result] () {
		result->run ();
	});
	return result;
}

void lumen::store::engine::connection::close ()
{
	if (!closed_m)
	{
		closed_m = true;
		logger.debug (lumen::log::type::engine, "Closing {}", name_m);
		asio::post (strand_m, [this_l = shared_from_this ()] () {
			this_l->dbis.clear ();
			this_l->env.reset ();
		});
	}
}

bool lumen::store::engine::connection::closed () const
{
	return closed_m;
}

std::size_t lumen::store::engine::connection::max_key_size () const
{
	return env->max_key_size ();
}
