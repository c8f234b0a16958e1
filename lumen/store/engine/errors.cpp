#include <lumen/store/engine/errors.hpp>

#include <lmdb.h>

std::string lumen::store::engine::error_messages::message (int ev) const
{
	switch (static_cast<lumen::store::engine::error> (ev))
	{
		case lumen::store::engine::error::generic:
			return "Unknown error";
		case lumen::store::engine::error::constraint:
			return "Key already exists";
		case lumen::store::engine::error::not_found:
			return "Not found";
		case lumen::store::engine::error::data:
			return "Invalid key or value";
		case lumen::store::engine::error::read_only:
			return "Write attempted in a read only transaction";
		case lumen::store::engine::error::inactive:
			return "Transaction is no longer active";
		case lumen::store::engine::error::invalid_state:
			return "Operation not allowed in the current state";
		case lumen::store::engine::error::invalid_name:
			return "Invalid store name";
		case lumen::store::engine::error::version:
			return "Requested version is lower than the stored version";
		case lumen::store::engine::error::abort:
			return "Transaction aborted";
		case lumen::store::engine::error::timeout:
			return "Operation timed out";
		case lumen::store::engine::error::unknown:
			return "Storage backend failure";
	}

	return "Invalid error code";
}

lumen::error lumen::store::engine::from_mdb_status (int status)
{
	std::error_code code;
	switch (status)
	{
		case MDB_SUCCESS:
			return {};
		case MDB_KEYEXIST:
			code = lumen::store::engine::error::constraint;
			break;
		case MDB_NOTFOUND:
			code = lumen::store::engine::error::not_found;
			break;
		case MDB_BAD_VALSIZE:
			code = lumen::store::engine::error::data;
			break;
		case MDB_VERSION_MISMATCH:
			code = lumen::store::engine::error::version;
			break;
		case MDB_BAD_TXN:
			code = lumen::store::engine::error::inactive;
			break;
		default:
			code = lumen::store::engine::error::unknown;
			break;
	}
	return lumen::error (code, std::string (code.message ()) + " (" + mdb_strerror (status) + ")");
}
