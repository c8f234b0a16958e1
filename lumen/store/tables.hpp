#pragma once

#include <string>

namespace lumen
{
// Keep this in alphabetical order
enum class tables
{
	best_chain,
	block_headers,
};

/** Name of the collection backing \p table_a */
std::string to_string (lumen::tables table_a);
} // namespace lumen
