#include <lumen/lib/config.hpp>
#include <lumen/lib/lmdbconfig.hpp>
#include <lumen/lib/logging.hpp>
#include <lumen/lib/storeconfig.hpp>
#include <lumen/lib/tomlconfig.hpp>
#include <lumen/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>

using namespace std::chrono_literals;

/** Empty store config file should match a default config object */
TEST (toml, store_config_defaults)
{
	std::stringstream ss;
	ss << R"toml(
	)toml";

	lumen::tomlconfig t;
	t.read (ss);
	lumen::store_config conf;
	lumen::store_config defaults;
	ASSERT_NO_LUMEN_ERROR (conf.deserialize_toml (t));

	ASSERT_EQ (conf.enable, defaults.enable);
	ASSERT_EQ (conf.operation_timeout, defaults.operation_timeout);
	ASSERT_EQ (conf.lmdb.sync, defaults.lmdb.sync);
	ASSERT_EQ (conf.lmdb.max_databases, defaults.lmdb.max_databases);
	ASSERT_EQ (conf.lmdb.map_size, defaults.lmdb.map_size);
	ASSERT_TRUE (defaults.enable);
	ASSERT_EQ (0ms, defaults.operation_timeout);
}

/** Deserialize a store config with non-default values */
TEST (toml, store_config_deserialize_no_defaults)
{
	std::stringstream ss;
	ss << R"toml(
	enable = false
	operation_timeout = 2500

	[lmdb]
	sync = "nosync_safe"
	max_databases = 8
	map_size = 1048576
	)toml";

	lumen::tomlconfig toml;
	toml.read (ss);
	lumen::store_config conf;
	lumen::store_config defaults;
	ASSERT_NO_LUMEN_ERROR (conf.deserialize_toml (toml));

	ASSERT_NE (conf.enable, defaults.enable);
	ASSERT_NE (conf.operation_timeout, defaults.operation_timeout);
	ASSERT_NE (conf.lmdb.sync, defaults.lmdb.sync);
	ASSERT_NE (conf.lmdb.max_databases, defaults.lmdb.max_databases);
	ASSERT_NE (conf.lmdb.map_size, defaults.lmdb.map_size);

	ASSERT_EQ (2500ms, conf.operation_timeout);
	ASSERT_EQ (lumen::lmdb_config::sync_strategy::nosync_safe, conf.lmdb.sync);
	ASSERT_EQ (8, conf.lmdb.max_databases);
	ASSERT_EQ (1048576, conf.lmdb.map_size);
}

TEST (toml, store_config_serialize)
{
	lumen::store_config conf;
	conf.enable = false;
	conf.operation_timeout = 750ms;
	conf.lmdb.sync = lumen::lmdb_config::sync_strategy::nosync_unsafe;
	lumen::tomlconfig toml;
	ASSERT_NO_LUMEN_ERROR (conf.serialize_toml (toml));

	std::stringstream ss;
	toml.write (ss);
	lumen::tomlconfig parsed;
	parsed.read (ss);
	lumen::store_config result;
	ASSERT_NO_LUMEN_ERROR (result.deserialize_toml (parsed));
	ASSERT_FALSE (result.enable);
	ASSERT_EQ (750ms, result.operation_timeout);
	ASSERT_EQ (lumen::lmdb_config::sync_strategy::nosync_unsafe, result.lmdb.sync);
}

TEST (toml, lmdb_config_invalid_sync)
{
	std::stringstream ss;
	ss << R"toml(
	sync = "sometimes"
	)toml";

	lumen::tomlconfig toml;
	toml.read (ss);
	lumen::lmdb_config conf;
	auto error = conf.deserialize_toml (toml);
	ASSERT_TRUE (error);
	ASSERT_EQ (lumen::error_config::invalid_value, error.get_code ());
}

TEST (toml, lmdb_config_max_databases)
{
	std::stringstream ss;
	ss << R"toml(
	max_databases = 1
	)toml";

	lumen::tomlconfig toml;
	toml.read (ss);
	lumen::lmdb_config conf;
	auto error = conf.deserialize_toml (toml);
	ASSERT_EQ (lumen::error_config::invalid_value, error.get_code ());
}

TEST (toml, store_config_invalid_type)
{
	std::stringstream ss;
	ss << R"toml(
	enable = "sometimes"
	)toml";

	lumen::tomlconfig toml;
	toml.read (ss);
	lumen::store_config conf;
	ASSERT_TRUE (conf.deserialize_toml (toml));
}

/** A missing file yields the fallback with the overrides applied */
TEST (toml, load_store_config_overrides)
{
	auto path = lumen::test::unique_path ();
	lumen::store_config fallback;
	fallback.operation_timeout = 100ms;
	auto conf = lumen::load_store_config (fallback, path, { "operation_timeout = 200", "lmdb.max_databases = 4" });
	ASSERT_EQ (200ms, conf.operation_timeout);
	ASSERT_EQ (4, conf.lmdb.max_databases);
	ASSERT_TRUE (conf.enable);
}

/** Values in the file replace the fallback, overrides replace the file */
TEST (toml, load_store_config_file)
{
	auto path = lumen::test::unique_path ();
	{
		std::ofstream file (path / "config-store.toml");
		file << "enable = false\noperation_timeout = 300\n";
	}
	auto conf = lumen::load_store_config (lumen::store_config{}, path, { "operation_timeout = 400" });
	ASSERT_FALSE (conf.enable);
	ASSERT_EQ (400ms, conf.operation_timeout);
}

TEST (toml, load_store_config_invalid)
{
	auto path = lumen::test::unique_path ();
	{
		std::ofstream file (path / "config-store.toml");
		file << "[lmdb]\nsync = \"never\"\n";
	}
	ASSERT_THROW (lumen::load_store_config (lumen::store_config{}, path), std::runtime_error);
	ASSERT_THROW (lumen::load_store_config (lumen::store_config{}, lumen::test::unique_path (), { "operation_timeout = " }), std::runtime_error);
}

TEST (toml, log_config_deserialize)
{
	std::stringstream ss;
	ss << R"toml(
	[log]
	default_level = "debug"

	[log.console]
	enable = false

	[log.file]
	rotation_count = 2

	[log.levels]
	engine = "trace"
	store = "warn"
	)toml";

	lumen::tomlconfig toml;
	toml.read (ss);
	auto conf = lumen::log_config::default_config ();
	ASSERT_NO_LUMEN_ERROR (conf.deserialize_toml (toml));
	ASSERT_EQ (lumen::log::level::debug, conf.default_level);
	ASSERT_FALSE (conf.console.enable);
	ASSERT_EQ (2, conf.file.rotation_count);
	ASSERT_EQ (lumen::log::level::trace, conf.levels[lumen::log::type::engine]);
	ASSERT_EQ (lumen::log::level::warn, conf.levels[lumen::log::type::store]);
}

TEST (toml, log_config_invalid_level)
{
	std::stringstream ss;
	ss << R"toml(
	[log]
	default_level = "loud"
	)toml";

	lumen::tomlconfig toml;
	toml.read (ss);
	lumen::log_config conf;
	ASSERT_TRUE (conf.deserialize_toml (toml));
}

TEST (toml, log_config_sample)
{
	lumen::tomlconfig toml;
	ASSERT_NO_LUMEN_ERROR (lumen::log_config::sample_config ().serialize_toml (toml));
	ASSERT_TRUE (toml.has_key ("log"));
	auto log = toml.get_required_child ("log");
	ASSERT_TRUE (log.has_key ("levels"));
	ASSERT_TRUE (log.has_key ("console"));
	ASSERT_TRUE (log.has_key ("file"));
}

TEST (toml, load_log_config_file)
{
	auto path = lumen::test::unique_path ();
	{
		std::ofstream file (path / "config-log.toml");
		file << "[log.levels]\nschema = \"debug\"\n";
	}
	auto conf = lumen::load_log_config (lumen::log_config::tests_default (), path, { "log.file.enable = false" });
	ASSERT_EQ (lumen::log::level::debug, conf.levels[lumen::log::type::schema]);
	ASSERT_FALSE (conf.file.enable);
}
