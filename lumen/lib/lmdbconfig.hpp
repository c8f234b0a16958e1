#pragma once

#include <lumen/lib/errors.hpp>

#include <cstddef>
#include <cstdint>

namespace lumen
{
class tomlconfig;

/** LMDB settings shared by every store file, the [lmdb] table of config-store.toml */
class lmdb_config final
{
public:
	/** How a commit reaches the disk. Names are the values accepted in the config file */
	enum class sync_strategy
	{
		/** Flush data and meta pages on every commit */
		always,
		/** Skip the meta page flush. The last commit may be lost on a crash, the file stays consistent */
		nosync_safe,
		/** Leave flushing to the OS, a crash on a filesystem without write ordering can corrupt the file */
		nosync_unsafe,
		/** As nosync_unsafe through a writable memory map. Not safe with other processes reading the file */
		nosync_unsafe_large_memory
	};

	lumen::error serialize_toml (lumen::tomlconfig &) const;
	lumen::error deserialize_toml (lumen::tomlconfig &);

	sync_strategy sync{ sync_strategy::always };
	/** Upper bound on named tables per store file, the reserved meta table included */
	uint32_t max_databases{ 16 };
	std::size_t map_size{ 1ULL * 1024 * 1024 * 1024 };
};
}
