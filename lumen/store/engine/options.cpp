#include <lumen/store/engine/lmdb_env.hpp>
#include <lumen/store/engine/options.hpp>

#include <lmdb.h>

auto lumen::store::engine::options::set_config (lumen::lmdb_config config_a) -> options &
{
	config = config_a;
	return *this;
}

int lumen::store::engine::options::apply (engine::env & env) const
{
	auto status (mdb_env_set_maxdbs (env, config.max_databases));
	if (status == MDB_SUCCESS)
	{
		status = mdb_env_set_mapsize (env, config.map_size);
	}
	return status;
}

unsigned int lumen::store::engine::options::flags () const
{
	// Transactions run on whichever thread drives the strand, so reader slots must not be tied to threads
	unsigned int environment_flags = MDB_NOSUBDIR | MDB_NOTLS | MDB_NORDAHEAD;
	switch (config.sync)
	{
		case lumen::lmdb_config::sync_strategy::always:
			break;
		case lumen::lmdb_config::sync_strategy::nosync_safe:
			environment_flags |= MDB_NOMETASYNC;
			break;
		case lumen::lmdb_config::sync_strategy::nosync_unsafe:
			environment_flags |= MDB_NOSYNC;
			break;
		case lumen::lmdb_config::sync_strategy::nosync_unsafe_large_memory:
			environment_flags |= MDB_NOSYNC | MDB_WRITEMAP | MDB_MAPASYNC;
			break;
	}
	return environment_flags;
}
