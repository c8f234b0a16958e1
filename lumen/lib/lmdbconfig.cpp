#include <lumen/lib/enum_util.hpp>
#include <lumen/lib/lmdbconfig.hpp>
#include <lumen/lib/tomlconfig.hpp>
#include <lumen/lib/utility.hpp>

lumen::error lumen::lmdb_config::serialize_toml (lumen::tomlconfig & toml) const
{
	auto const choices = lumen::util::join (lumen::enum_util::values<sync_strategy> (), ", ", [] (sync_strategy value) {
		return lumen::enum_util::name (value);
	});
	auto const sync_doc = "Sync strategy for flushing commits to the store files.\ntype:string,{" + choices + "}";
	toml.put ("sync", std::string{ lumen::enum_util::name (sync) }, sync_doc.c_str ());
	toml.put ("max_databases", max_databases, "Maximum named tables per store file, including the reserved meta table.\ntype:uint32");
	toml.put ("map_size", map_size, "Maximum store map size in bytes.\ntype:uint64");
	return toml.get_error ();
}

lumen::error lumen::lmdb_config::deserialize_toml (lumen::tomlconfig & toml)
{
	toml.get_optional<uint32_t> ("max_databases", max_databases);
	toml.get_optional<std::size_t> ("map_size", map_size);

	if (!toml.get_error () && max_databases < 2)
	{
		toml.get_error ().set ("max_databases must leave room for the meta table and at least one collection", lumen::error_config::invalid_value);
	}

	if (!toml.get_error ())
	{
		std::string sync_string{ lumen::enum_util::name (sync) };
		toml.get_optional<std::string> ("sync", sync_string);
		if (auto value = lumen::enum_util::try_parse<sync_strategy> (sync_string))
		{
			sync = *value;
		}
		else
		{
			toml.get_error ().set (sync_string + " is not a valid sync option", lumen::error_config::invalid_value);
		}
	}

	return toml.get_error ();
}
