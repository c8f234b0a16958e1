#include <lumen/store/engine/lmdb_env.hpp>
#include <lumen/store/engine/transaction_impl.hpp>

lumen::store::engine::transaction_impl::transaction_impl (int & status_a, engine::env const & env_a, bool read_only)
{
	status_a = mdb_txn_begin (env_a, nullptr, read_only ? MDB_RDONLY : 0, &handle);
	active = status_a == MDB_SUCCESS;
}

lumen::store::engine::transaction_impl::~transaction_impl ()
{
	abort ();
}

int lumen::store::engine::transaction_impl::commit ()
{
	auto status (MDB_BAD_TXN);
	if (active)
	{
		active = false;
		status = mdb_txn_commit (handle);
	}
	return status;
}

void lumen::store::engine::transaction_impl::abort ()
{
	if (active)
	{
		active = false;
		mdb_txn_abort (handle);
	}
}

lumen::store::engine::transaction_impl::operator MDB_txn * () const
{
	return handle;
}
