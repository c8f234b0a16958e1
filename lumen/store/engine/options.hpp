#pragma once

#include <lumen/lib/lmdbconfig.hpp>

namespace lumen::store::engine
{
class env;

/** Settings applied to an LMDB environment when a store file is opened */
class options final
{
public:
	static options make ()
	{
		return options{};
	}

	options & set_config (lumen::lmdb_config config_a);

	/** Applies the table limit and map size, must run before the environment is opened */
	int apply (engine::env & env) const;
	unsigned int flags () const;

private:
	lumen::lmdb_config config;
};
}
