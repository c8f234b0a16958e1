#pragma once

#include <lumen/lib/async.hpp>
#include <lumen/store/engine/transaction.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <lmdb.h>

namespace lumen
{
class logger;
}

namespace lumen::store::engine
{
class env;
class transaction_impl;

/**
 * Open handle to one named store. Obtained from a successful open request.
 * Must only be used from the engine's strand.
 */
class connection final : public std::enable_shared_from_this<connection>
{
public:
	connection (lumen::async::strand &, lumen::logger &, std::string name_a, std::unique_ptr<engine::env>);
	~connection ();

	std::string const & name () const;
	uint64_t version () const;
	/** Sorted collection names */
	std::vector<std::string> collection_names () const;
	lumen::async::strand & strand () const;

	/**
	 * Only allowed from the upgrade handler of an open request.
	 * @throws std::system_error with engine::error::constraint if the collection exists, engine::error::invalid_state outside an upgrade
	 */
	void create_collection (std::string const & name_a);

	/**
	 * Starts a transaction over \p names_a. It executes once control returns to the strand.
	 * @throws std::system_error with engine::error::not_found for an unknown collection or an empty scope, engine::error::invalid_state once closed
	 */
	std::shared_ptr<engine::transaction> transaction (std::vector<std::string> const & names_a, engine::access_mode mode_a);

	/** Idempotent. The environment is released on the strand, after transactions already scheduled */
	void close ();
	bool closed () const;

private:
	std::size_t max_key_size () const;

	lumen::async::strand & strand_m;
	lumen::logger & logger;
	std::string const name_m;
	std::unique_ptr<engine::env> env;
	std::map<std::string, MDB_dbi> dbis;
	uint64_t version_m{ 0 };
	/** Set while the upgrade handler runs */
	engine::transaction_impl * upgrade_txn{ nullptr };
	bool closed_m{ false };

	friend class factory;
	friend class engine::transaction;
};
}
