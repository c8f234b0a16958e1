#pragma once

#include <lmdb.h>

namespace lumen::store::engine
{
class env;

/**
 * RAII wrapper for MDB_txn. A transaction that was neither committed nor aborted is aborted on destruction.
 */
class transaction_impl final
{
public:
	/** \p status_a receives the status of mdb_txn_begin */
	transaction_impl (int & status_a, engine::env const &, bool read_only);
	~transaction_impl ();
	transaction_impl (transaction_impl const &) = delete;

	/** @return the status of mdb_txn_commit, the transaction is finished either way */
	int commit ();
	void abort ();
	operator MDB_txn * () const;

	MDB_txn * handle{ nullptr };
	bool active{ false };
};
}
