#pragma once

#include <lumen/lib/errors.hpp>
#include <lumen/store/engine/request.hpp>
#include <lumen/store/engine/value.hpp>

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <lmdb.h>

namespace lumen::store::engine
{
class connection;
class transaction;
class transaction_impl;

enum class access_mode
{
	read_only,
	read_write
};

/** Handle to one named collection inside the scope of a transaction */
class collection final
{
public:
	collection (std::shared_ptr<engine::transaction>, std::string name_a, MDB_dbi);

	std::string const & name () const;
	/** Insert if absent, the request fails with engine::error::constraint when the key exists */
	std::shared_ptr<engine::request> add (engine::value const &, engine::key const &);
	/** Insert or overwrite */
	std::shared_ptr<engine::request> put (engine::value const &, engine::key const &);
	/** The request result is the undefined value when the key is absent */
	std::shared_ptr<engine::request> get (engine::key const &);
	std::shared_ptr<engine::request> count ();

private:
	std::shared_ptr<engine::transaction> txn;
	std::string name_m;
	MDB_dbi dbi;
};

/**
 * Atomic unit of work over a fixed set of collections.
 * Requests are queued as they are issued and executed in issue order by a single strand handler, which also commits.
 * The first failing request, or abort (), rolls everything back.
 * Exactly one of the complete, abort or error handlers fires. Handlers are released once one fired.
 */
class transaction final : public std::enable_shared_from_this<transaction>
{
public:
	using handler = std::function<void ()>;

	transaction (std::shared_ptr<engine::connection>, std::vector<std::string> scope_a, engine::access_mode);

	/** @throws std::system_error with engine::error::not_found if \p name_a is outside the scope */
	engine::collection object_store (std::string const & name_a);
	engine::access_mode mode () const;
	std::vector<std::string> const & scope () const;
	/** Empty after a commit, the failing request's error or engine::error::abort after an abort */
	lumen::error const & error () const;
	bool finished () const;
	/** @throws std::system_error with engine::error::invalid_state once finished */
	void abort ();

	void on_complete (handler);
	void on_abort (handler);
	void on_error (handler);

private:
	enum class operation
	{
		add,
		put,
		get,
		count
	};

	class pending final
	{
	public:
		operation type;
		MDB_dbi dbi;
		std::vector<uint8_t> key;
		std::vector<uint8_t> value;
		std::shared_ptr<engine::request> request;
	};

	std::shared_ptr<engine::request> enqueue (operation, MDB_dbi, engine::key const *, engine::value const *);
	lumen::error execute (engine::transaction_impl &, pending const &, engine::value & result);
	void run ();
	void fail_pending (lumen::error const &);
	void notify (handler &);

	std::shared_ptr<engine::connection> connection_m;
	std::vector<std::string> scope_m;
	engine::access_mode mode_m;
	std::deque<pending> queue;
	lumen::error error_m;
	bool abort_requested{ false };
	bool finished_m{ false };
	handler complete_handler;
	handler abort_handler;
	handler error_handler;

	friend class collection;
	friend class connection;
};
}
