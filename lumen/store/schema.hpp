#pragma once

#include <cstdint>

namespace lumen
{
class logger;
}

namespace lumen::store::engine
{
class connection;
}

namespace lumen::store
{
/** Schema version the code expects, an older store is upgraded when opened */
uint64_t const version_current = 1;

/**
 * Creates the collections missing from a store at \p old_version. Only valid inside the upgrade notification of an open.
 * Upgrades are additive, a new version appends a block creating what it adds and no rows are migrated.
 * @throws std::system_error if a collection already exists, which aborts the upgrade
 */
void create_schema (engine::connection &, uint64_t old_version, lumen::logger &);
}
