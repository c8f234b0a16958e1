#include <lumen/lib/config.hpp>
#include <lumen/lib/storeconfig.hpp>
#include <lumen/lib/tomlconfig.hpp>

lumen::error lumen::store_config::serialize_toml (lumen::tomlconfig & toml) const
{
	toml.put ("enable", enable, "Enable the header store. When disabled every open fails with not_supported.\ntype:bool");
	toml.put ("operation_timeout", static_cast<uint64_t> (operation_timeout.count ()), "Upper bound in milliseconds for each awaited engine notification. 0 waits forever.\ntype:milliseconds");

	lumen::tomlconfig lmdb_l;
	lmdb.serialize_toml (lmdb_l);
	toml.put_child ("lmdb", lmdb_l);

	return toml.get_error ();
}

lumen::error lumen::store_config::deserialize_toml (lumen::tomlconfig & toml)
{
	toml.get_optional<bool> ("enable", enable);
	toml.get_duration ("operation_timeout", operation_timeout);

	if (toml.has_key ("lmdb"))
	{
		auto lmdb_l = toml.get_required_child ("lmdb");
		lmdb.deserialize_toml (lmdb_l);
	}

	return toml.get_error ();
}

lumen::store_config lumen::load_store_config (lumen::store_config fallback, std::filesystem::path const & data_path, std::vector<std::string> const & config_overrides)
{
	return lumen::load_config_file<lumen::store_config> (fallback, "config-store.toml", data_path, config_overrides);
}
