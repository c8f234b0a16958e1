#include <lumen/lib/utility.hpp>
#include <lumen/store/tables.hpp>

std::string lumen::to_string (lumen::tables table_a)
{
	switch (table_a)
	{
		case lumen::tables::best_chain:
			return "best-chain";
		case lumen::tables::block_headers:
			return "block-headers";
	}
	release_assert (false, "Unknown table");
	return {};
}
