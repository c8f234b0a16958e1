#include <lumen/store/errors.hpp>

std::string lumen::store::open_error_messages::message (int ev) const
{
	switch (static_cast<lumen::store::open_error> (ev))
	{
		case lumen::store::open_error::generic:
			return "Unknown error";
		case lumen::store::open_error::no_environment:
			return "No storage engine in this environment";
		case lumen::store::open_error::not_supported:
			return "Storage engine not supported";
		case lumen::store::open_error::open_failed:
			return "Failed to open the database";
		case lumen::store::open_error::timeout:
			return "Timed out opening the database";
	}

	return "Invalid error code";
}

std::string lumen::store::access_error_messages::message (int ev) const
{
	switch (static_cast<lumen::store::access_error> (ev))
	{
		case lumen::store::access_error::generic:
			return "Unknown error";
		case lumen::store::access_error::corrupted:
			return "Database is corrupted";
		case lumen::store::access_error::transaction_error:
			return "Transaction failed";
		case lumen::store::access_error::invalid_header:
			return "Header cannot be decoded";
		case lumen::store::access_error::timeout:
			return "Timed out waiting for the database";
	}

	return "Invalid error code";
}

std::string lumen::store::corrupted_error_messages::message (int ev) const
{
	switch (static_cast<lumen::store::corrupted_error> (ev))
	{
		case lumen::store::corrupted_error::generic:
			return "Unknown error";
		case lumen::store::corrupted_error::unexpected_value_type:
			return "Stored value has an unexpected type";
	}

	return "Invalid error code";
}
