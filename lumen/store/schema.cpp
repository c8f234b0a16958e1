#include <lumen/lib/logging.hpp>
#include <lumen/store/engine/connection.hpp>
#include <lumen/store/schema.hpp>
#include <lumen/store/tables.hpp>

void lumen::store::create_schema (engine::connection & connection_a, uint64_t old_version, lumen::logger & logger)
{
	if (old_version < 1)
	{
		// Keys are hex encoded header hashes, values are hex encoded SCALE headers
		auto block_headers = lumen::to_string (lumen::tables::block_headers);
		connection_a.create_collection (block_headers);
		logger.info (lumen::log::type::schema, "Created collection {}", block_headers);

		// Keys are block numbers, values are hex encoded header hashes
		auto best_chain = lumen::to_string (lumen::tables::best_chain);
		connection_a.create_collection (best_chain);
		logger.info (lumen::log::type::schema, "Created collection {}", best_chain);
	}
}
