#include <lumen/lib/logging.hpp>
#include <lumen/lib/stream.hpp>
#include <lumen/lib/utility.hpp>
#include <lumen/store/engine/connection.hpp>
#include <lumen/store/engine/errors.hpp>
#include <lumen/store/engine/factory.hpp>
#include <lumen/store/engine/lmdb_env.hpp>
#include <lumen/store/engine/transaction_impl.hpp>

#include <algorithm>
#include <cstring>
#include <map>
#include <stdexcept>
#include <vector>

namespace
{
char const * const meta_table = "meta";
char const * const version_key = "version";

/** @return the stored version, zero for a store that was never upgraded */
int read_version (MDB_txn * txn_a, MDB_dbi meta_a, uint64_t & version_a)
{
	MDB_val key{ std::strlen (version_key), const_cast<char *> (version_key) };
	MDB_val value;
	auto status (mdb_get (txn_a, meta_a, &key, &value));
	version_a = 0;
	if (status == MDB_NOTFOUND)
	{
		return MDB_SUCCESS;
	}
	if (status == MDB_SUCCESS)
	{
		if (value.mv_size != sizeof (uint64_t))
		{
			return MDB_CORRUPTED;
		}
		lumen::bufferstream stream (static_cast<uint8_t const *> (value.mv_data), value.mv_size);
		lumen::read_big_endian (stream, version_a);
	}
	return status;
}

int write_version (MDB_txn * txn_a, MDB_dbi meta_a, uint64_t version_a)
{
	std::vector<uint8_t> bytes;
	{
		lumen::vectorstream stream (bytes);
		lumen::write_big_endian (stream, version_a);
	}
	MDB_val key{ std::strlen (version_key), const_cast<char *> (version_key) };
	MDB_val value{ bytes.size (), bytes.data () };
	return mdb_put (txn_a, meta_a, &key, &value, 0);
}

/** Every named table other than meta is a collection. Their names are the keys of the main table */
int open_collections (MDB_txn * txn_a, std::map<std::string, MDB_dbi> & dbis_a)
{
	MDB_dbi main;
	auto status (mdb_dbi_open (txn_a, nullptr, 0, &main));
	if (status != MDB_SUCCESS)
	{
		return status;
	}
	MDB_cursor * cursor;
	status = mdb_cursor_open (txn_a, main, &cursor);
	if (status != MDB_SUCCESS)
	{
		return status;
	}
	std::vector<std::string> names;
	MDB_val key, value;
	for (status = mdb_cursor_get (cursor, &key, &value, MDB_FIRST); status == MDB_SUCCESS; status = mdb_cursor_get (cursor, &key, &value, MDB_NEXT))
	{
		std::string name (static_cast<char const *> (key.mv_data), key.mv_size);
		if (name != meta_table)
		{
			names.push_back (std::move (name));
		}
	}
	mdb_cursor_close (cursor);
	if (status != MDB_NOTFOUND)
	{
		return status;
	}
	status = MDB_SUCCESS;
	for (auto i = names.begin (), n = names.end (); i != n && status == MDB_SUCCESS; ++i)
	{
		MDB_dbi dbi;
		status = mdb_dbi_open (txn_a, i->c_str (), 0, &dbi);
		if (status == MDB_SUCCESS)
		{
			dbis_a.emplace (*i, dbi);
		}
	}
	return status;
}
}

/*
 * open_request
 */

void lumen::store::engine::open_request::on_upgrade_needed (upgrade_handler handler_a)
{
	upgrade_handler_m = std::move (handler_a);
}

void lumen::store::engine::open_request::on_success (handler handler_a)
{
	success_handler = std::move (handler_a);
}

void lumen::store::engine::open_request::on_error (handler handler_a)
{
	error_handler = std::move (handler_a);
}

bool lumen::store::engine::open_request::done () const
{
	return done_m;
}

std::shared_ptr<lumen::store::engine::connection> lumen::store::engine::open_request::result () const
{
	return result_m;
}

lumen::error const & lumen::store::engine::open_request::error () const
{
	return error_m;
}

void lumen::store::engine::open_request::upgrade (engine::version_change_event const & event_a)
{
	auto handler_l = std::move (upgrade_handler_m);
	upgrade_handler_m = nullptr;
	if (handler_l)
	{
		handler_l (event_a);
	}
}

void lumen::store::engine::open_request::succeed (std::shared_ptr<engine::connection> connection_a)
{
	done_m = true;
	result_m = std::move (connection_a);
	auto handler_l = std::move (success_handler);
	release ();
	if (handler_l)
	{
		handler_l ();
	}
}

void lumen::store::engine::open_request::fail (lumen::error error_a)
{
	done_m = true;
	error_m = std::move (error_a);
	auto handler_l = std::move (error_handler);
	release ();
	if (handler_l)
	{
		handler_l ();
	}
}

void lumen::store::engine::open_request::release ()
{
	upgrade_handler_m = nullptr;
	success_handler = nullptr;
	error_handler = nullptr;
}

/*
 * factory
 */

lumen::store::engine::factory::factory (lumen::async::strand & strand_a, std::filesystem::path root_a, lumen::store_config const & config_a, lumen::logger & logger_a) :
	logger{ logger_a },
	strand_m{ strand_a },
	root{ std::move (root_a) },
	config_m{ config_a }
{
	if (config_m.enable)
	{
		std::error_code ec;
		std::filesystem::create_directories (root, ec);
		if (!ec)
		{
			lumen::set_secure_perm_directory (root, ec);
		}
		supported_m = !ec && std::filesystem::is_directory (root, ec);
		if (!supported_m)
		{
			logger.warn (lumen::log::type::engine, "Unable to prepare store directory {}: {}", root.string (), ec.message ());
		}
	}
}

bool lumen::store::engine::factory::supported () const
{
	return supported_m;
}

std::shared_ptr<lumen::store::engine::open_request> lumen::store::engine::factory::open (std::string const & name_a, uint64_t version_a)
{
	if (version_a == 0)
	{
		throw std::invalid_argument ("Store version must be positive");
	}
	auto request = std::make_shared<engine::open_request> ();
	asio::post (strand_m, [this, request, name_a, version_a] () {
		run_open (request, name_a, version_a);
	});
	return request;
}

lumen::async::strand & lumen::store::engine::factory::strand () const
{
	return strand_m;
}

lumen::store_config const & lumen::store::engine::factory::config () const
{
	return config_m;
}

std::filesystem::path lumen::store::engine::factory::path (std::string const & name_a) const
{
	return root / (name_a + ".ldb");
}

bool lumen::store::engine::factory::valid_name (std::string const & name_a)
{
	return !name_a.empty () && name_a.front () != '.' && std::all_of (name_a.begin (), name_a.end (), [] (char c) {
		return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
	});
}

void lumen::store::engine::factory::run_open (std::shared_ptr<engine::open_request> request_a, std::string const & name_a, uint64_t version_a)
{
	if (!supported_m)
	{
		request_a->fail (lumen::error (engine::error::invalid_state, "Store engine is not available"));
		return;
	}
	if (!valid_name (name_a))
	{
		request_a->fail (lumen::error (engine::error::invalid_name, "Invalid store name: " + name_a));
		return;
	}

	auto path_l = path (name_a);
	int status;
	auto env = std::make_unique<engine::env> (status, path_l, engine::options::make ().set_config (config_m.lmdb));
	if (status != MDB_SUCCESS)
	{
		auto error = engine::from_mdb_status (status);
		logger.error (lumen::log::type::lmdb, "Could not open lmdb environment {}: {}", path_l.string (), error.get_message ());
		request_a->fail (error);
		return;
	}

	auto connection = std::make_shared<engine::connection> (strand_m, logger, name_a, std::move (env));
	engine::transaction_impl txn (status, *connection->env, false);
	MDB_dbi meta;
	uint64_t stored_version (0);
	if (status == MDB_SUCCESS)
	{
		status = mdb_dbi_open (txn, meta_table, MDB_CREATE, &meta);
	}
	if (status == MDB_SUCCESS)
	{
		status = read_version (txn, meta, stored_version);
	}
	if (status == MDB_SUCCESS)
	{
		status = open_collections (txn, connection->dbis);
	}
	if (status != MDB_SUCCESS)
	{
		request_a->fail (engine::from_mdb_status (status));
		return;
	}
	if (stored_version > version_a)
	{
		request_a->fail (lumen::error (engine::error::version, "Stored version " + std::to_string (stored_version) + " is newer than requested version " + std::to_string (version_a)));
		return;
	}
	connection->version_m = stored_version;

	if (stored_version < version_a)
	{
		logger.info (lumen::log::type::engine, "Upgrading {} from version {} to {}", name_a, stored_version, version_a);
		connection->upgrade_txn = &txn;
		try
		{
			request_a->upgrade (engine::version_change_event{ stored_version, version_a, *connection });
		}
		catch (std::exception const & ex)
		{
			// Collections created by the aborted upgrade are released with the transaction
			connection->upgrade_txn = nullptr;
			logger.error (lumen::log::type::engine, "Upgrade of {} aborted: {}", name_a, ex.what ());
			request_a->fail (lumen::error (engine::error::abort, std::string ("Upgrade aborted: ") + ex.what ()));
			return;
		}
		connection->upgrade_txn = nullptr;
		status = write_version (txn, meta, version_a);
		if (status == MDB_SUCCESS)
		{
			connection->version_m = version_a;
		}
	}
	if (status == MDB_SUCCESS)
	{
		status = txn.commit ();
	}
	if (status != MDB_SUCCESS)
	{
		request_a->fail (engine::from_mdb_status (status));
		return;
	}

	logger.debug (lumen::log::type::engine, "Opened {} at version {}", name_a, connection->version_m);
	request_a->succeed (connection);
}
