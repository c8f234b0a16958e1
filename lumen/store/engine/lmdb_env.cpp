#include <lumen/lib/utility.hpp>
#include <lumen/store/engine/lmdb_env.hpp>

#include <cerrno>
#include <system_error>

lumen::store::engine::env::env (int & status_a, std::filesystem::path const & path_a, engine::options options_a)
{
	status_a = init (path_a, options_a);
}

int lumen::store::engine::env::init (std::filesystem::path const & path_a, engine::options const & options_a)
{
	debug_assert (path_a.extension () == ".ldb", "invalid filename extension for lmdb database file");

	std::error_code error_mkdir, error_chmod;
	if (!path_a.has_parent_path ())
	{
		return ENOENT;
	}
	std::filesystem::create_directories (path_a.parent_path (), error_mkdir);
	lumen::set_secure_perm_directory (path_a.parent_path (), error_chmod);
	if (error_mkdir)
	{
		return error_mkdir.value ();
	}
	auto status (mdb_env_create (&environment));
	if (status != MDB_SUCCESS)
	{
		environment = nullptr;
		return status;
	}
	status = options_a.apply (*this);
	if (status == MDB_SUCCESS)
	{
		status = mdb_env_open (environment, path_a.string ().c_str (), options_a.flags (), 00600);
	}
	if (status != MDB_SUCCESS)
	{
		// A failed open still has to release the handle
		mdb_env_close (environment);
		environment = nullptr;
	}
	return status;
}

lumen::store::engine::env::~env ()
{
	if (environment != nullptr)
	{
		// Make sure the commits are flushed. This is a no-op unless MDB_NOSYNC is used.
		mdb_env_sync (environment, true);
		mdb_env_close (environment);
	}
}

lumen::store::engine::env::operator MDB_env * () const
{
	return environment;
}

std::size_t lumen::store::engine::env::max_key_size () const
{
	return static_cast<std::size_t> (mdb_env_get_maxkeysize (environment));
}
