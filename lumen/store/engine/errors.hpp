#pragma once

#include <lumen/lib/errors.hpp>

namespace lumen::store::engine
{
/** Failures reported by the storage engine, either through request notifications or thrown synchronously */
enum class error
{
	generic = 1,
	constraint,
	not_found,
	data,
	read_only,
	inactive,
	invalid_state,
	invalid_name,
	version,
	abort,
	timeout,
	unknown
};
}

REGISTER_ERROR_CODES (lumen::store::engine, error);

namespace lumen::store::engine
{
/** Maps an LMDB status code onto the engine error category, keeping the LMDB description as the message */
lumen::error from_mdb_status (int status);
}
