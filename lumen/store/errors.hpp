#pragma once

#include <lumen/lib/errors.hpp>

namespace lumen::store
{
/** Failures of database::open */
enum class open_error
{
	generic = 1,
	no_environment,
	not_supported,
	open_failed,
	timeout
};

/** Failures of reads and writes on an open database */
enum class access_error
{
	generic = 1,
	corrupted,
	transaction_error,
	invalid_header,
	timeout
};

/** The store holds data it did not write */
enum class corrupted_error
{
	generic = 1,
	unexpected_value_type
};
}

REGISTER_ERROR_CODES (lumen::store, open_error);
REGISTER_ERROR_CODES (lumen::store, access_error);
REGISTER_ERROR_CODES (lumen::store, corrupted_error);
