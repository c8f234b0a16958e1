#pragma once

#include <lumen/store/engine/options.hpp>

#include <filesystem>

#include <lmdb.h>

namespace lumen::store::engine
{
/**
 * RAII wrapper for MDB_env
 */
class env final
{
public:
	/** \p status_a receives the LMDB status, non zero if the environment could not be created or opened */
	env (int & status_a, std::filesystem::path const &, engine::options options_a = engine::options::make ());
	~env ();
	env (env const &) = delete;
	operator MDB_env * () const;
	/** Largest key the backend accepts, in bytes */
	std::size_t max_key_size () const;
	MDB_env * environment{ nullptr };

private:
	int init (std::filesystem::path const &, engine::options const & options_a);
};
}
