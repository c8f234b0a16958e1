#pragma once

#include <lumen/lib/errors.hpp>
#include <lumen/lib/lmdbconfig.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace lumen
{
class tomlconfig;

/** Configuration of the header store and its engine, read from config-store.toml */
class store_config final
{
public:
	lumen::error serialize_toml (lumen::tomlconfig &) const;
	lumen::error deserialize_toml (lumen::tomlconfig &);

	/** When false the engine reports itself as unsupported and every open fails */
	bool enable{ true };
	/** Upper bound for each awaited engine notification, zero waits forever */
	std::chrono::milliseconds operation_timeout{ 0 };
	lumen::lmdb_config lmdb;
};

/**
 * Loads config-store.toml from \p data_path, falling back to \p fallback for anything the file does not set.
 * @throws std::runtime_error on parse or validation errors
 */
lumen::store_config load_store_config (lumen::store_config fallback, std::filesystem::path const & data_path, std::vector<std::string> const & config_overrides = {});
}
