#include <lumen/lib/env.hpp>
#include <lumen/lib/logging.hpp>
#include <lumen/lib/utility.hpp>

#include <fmt/chrono.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

namespace
{
std::string const log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";
std::string const config_filename = "config-log.toml";
}

bool lumen::logger::global_initialized{ false };
lumen::log_config lumen::logger::global_config{};
std::vector<spdlog::sink_ptr> lumen::logger::global_sinks{};

/*
 * log_config
 */

lumen::log_config lumen::log_config::default_config ()
{
	log_config config{};
	config.default_level = lumen::log::level::info;
	config.console.enable = true;
	config.file.enable = false;
	return config;
}

lumen::log_config lumen::log_config::tests_default ()
{
	log_config config{};
	config.default_level = lumen::log::level::off;
	config.console.enable = true;
	config.console.to_cerr = true;
	config.file.enable = false;
	return config;
}

lumen::log_config lumen::log_config::sample_config ()
{
	log_config config{};
	for (auto type : lumen::log::all_types ())
	{
		if (type != lumen::log::type::all)
		{
			config.levels[type] = config.default_level;
		}
	}
	return config;
}

lumen::error lumen::log_config::serialize_toml (lumen::tomlconfig & toml) const
{
	auto level_choices = lumen::util::join (lumen::log::all_levels (), ", ", [] (auto level) { return std::string{ lumen::log::to_string (level) }; });

	lumen::tomlconfig log_l;
	log_l.put ("default_level", std::string{ lumen::log::to_string (default_level) }, ("Level for every tag without an entry in [log.levels]\ntype:string,{" + level_choices + "}").c_str ());
	log_l.put ("flush_level", std::string{ lumen::log::to_string (flush_level) }, "Messages at or above this level flush the sinks immediately\ntype:string");

	lumen::tomlconfig console_l;
	console_l.put ("enable", console.enable, "Log to the terminal\ntype:bool");
	console_l.put ("to_cerr", console.to_cerr, "Write to standard error instead of standard output\ntype:bool");
	log_l.put_child ("console", console_l);

	lumen::tomlconfig file_l;
	file_l.put ("enable", file.enable, "Log to rotating files in the log directory below the data path\ntype:bool");
	file_l.put ("max_size", static_cast<uint64_t> (file.max_size), "Size in bytes at which a log file is rotated\ntype:uint64");
	file_l.put ("rotation_count", static_cast<uint64_t> (file.rotation_count), "Number of rotated files kept\ntype:uint64");
	log_l.put_child ("file", file_l);

	lumen::tomlconfig levels_l;
	for (auto const & [type, level] : levels)
	{
		levels_l.put (std::string{ lumen::log::to_string (type) }, std::string{ lumen::log::to_string (level) });
	}
	log_l.put_child ("levels", levels_l);

	toml.put_child ("log", log_l);
	return toml.get_error ();
}

lumen::error lumen::log_config::deserialize_toml (lumen::tomlconfig & toml)
{
	auto log_l = toml.get_optional_child ("log");
	if (!log_l)
	{
		return toml.get_error ();
	}
	try
	{
		if (log_l->has_key ("default_level"))
		{
			default_level = lumen::log::parse_level (log_l->get<std::string> ("default_level"));
		}
		if (log_l->has_key ("flush_level"))
		{
			flush_level = lumen::log::parse_level (log_l->get<std::string> ("flush_level"));
		}
		if (auto console_l = log_l->get_optional_child ("console"))
		{
			console_l->get ("enable", console.enable);
			console_l->get ("to_cerr", console.to_cerr);
		}
		if (auto file_l = log_l->get_optional_child ("file"))
		{
			file_l->get ("enable", file.enable);
			file_l->get ("max_size", file.max_size);
			file_l->get ("rotation_count", file.rotation_count);
		}
		if (auto levels_l = log_l->get_optional_child ("levels"))
		{
			for (auto const & [name, level] : levels_l->get_values<std::string> ())
			{
				levels[lumen::log::parse_type (name)] = lumen::log::parse_level (level);
			}
		}
	}
	catch (std::invalid_argument const & ex)
	{
		toml.get_error ().set (ex.what (), lumen::error_config::invalid_value);
	}
	return toml.get_error ();
}

namespace
{
void apply_env_overrides (lumen::log_config & config)
{
	// e.g. LUMEN_LOG=debug
	if (auto env_level = lumen::env::get ("LUMEN_LOG"))
	{
		try
		{
			config.default_level = lumen::log::parse_level (*env_level);
		}
		catch (std::invalid_argument const & ex)
		{
			std::cerr << "Ignoring LUMEN_LOG: " << ex.what () << std::endl;
		}
	}
	// e.g. LUMEN_LOG_LEVELS=lmdb=debug,store=trace
	if (auto env_levels = lumen::env::get ("LUMEN_LOG_LEVELS"))
	{
		for (auto const & entry : lumen::util::split (*env_levels, ","))
		{
			auto pair = lumen::util::split (entry, "=");
			if (pair.size () != 2)
			{
				std::cerr << "Ignoring malformed LUMEN_LOG_LEVELS entry: " << entry << std::endl;
				continue;
			}
			try
			{
				config.levels[lumen::log::parse_type (pair[0])] = lumen::log::parse_level (pair[1]);
			}
			catch (std::invalid_argument const & ex)
			{
				std::cerr << "Ignoring LUMEN_LOG_LEVELS entry " << entry << ": " << ex.what () << std::endl;
			}
		}
	}
}
}

lumen::log_config lumen::load_log_config (lumen::log_config fallback, std::filesystem::path const & data_path, std::vector<std::string> const & config_overrides)
{
	auto config = fallback;
	std::stringstream overrides;
	for (auto const & line : config_overrides)
	{
		overrides << line << '\n';
	}

	auto path = data_path / config_filename;
	lumen::tomlconfig toml;
	lumen::error error;
	if (std::filesystem::exists (path))
	{
		error = toml.read (overrides, path);
	}
	else
	{
		error = toml.read (overrides);
	}
	if (!error)
	{
		error = config.deserialize_toml (toml);
	}
	if (error)
	{
		std::cerr << "Unable to load " << path.string () << ", using defaults: " << error.get_message () << std::endl;
		config = fallback;
	}

	apply_env_overrides (config);
	return config;
}

/*
 * logger
 */

lumen::logger::logger (std::string identifier_a) :
	identifier{ std::move (identifier_a) }
{
	release_assert (global_initialized, "logging must be initialized before the first logger is created");
}

lumen::logger::~logger ()
{
	flush ();
}

void lumen::logger::initialize (lumen::log_config fallback, std::optional<std::filesystem::path> data_path, std::vector<std::string> const & config_overrides)
{
	auto config = data_path ? lumen::load_log_config (std::move (fallback), *data_path, config_overrides) : std::move (fallback);
	setup_sinks (config, data_path);
}

void lumen::logger::initialize_for_tests (lumen::log_config fallback)
{
	auto config = lumen::load_log_config (std::move (fallback), std::filesystem::current_path ());
	// Tests never write log files
	config.file.enable = false;
	setup_sinks (config, std::nullopt);
}

void lumen::logger::setup_sinks (lumen::log_config const & config, std::optional<std::filesystem::path> const & data_path)
{
	global_config = config;
	global_sinks.clear ();
	spdlog::set_automatic_registration (false);
	spdlog::set_level (to_spdlog_level (config.default_level));

	if (config.console.enable)
	{
		if (config.console.to_cerr)
		{
			global_sinks.push_back (std::make_shared<spdlog::sinks::stderr_color_sink_mt> ());
		}
		else
		{
			global_sinks.push_back (std::make_shared<spdlog::sinks::stdout_color_sink_mt> ());
		}
	}

	if (config.file.enable && data_path)
	{
		auto log_dir = *data_path / "log";
		std::error_code ec;
		std::filesystem::create_directories (log_dir, ec);
		if (ec)
		{
			std::cerr << "Unable to create log directory " << log_dir.string () << ": " << ec.message () << std::endl;
		}
		else
		{
			auto filename = fmt::format ("lumen_{:%Y-%m-%d_%H-%M-%S}.log", fmt::localtime (std::time (nullptr)));
			global_sinks.push_back (std::make_shared<spdlog::sinks::rotating_file_sink_mt> ((log_dir / filename).string (), config.file.max_size, config.file.rotation_count));
		}
	}

	for (auto & sink : global_sinks)
	{
		sink->set_pattern (log_pattern);
	}
	global_initialized = true;
}

void lumen::logger::flush ()
{
	for (auto & sink : global_sinks)
	{
		sink->flush ();
	}
}

spdlog::logger & lumen::logger::get_logger (lumen::log::type type)
{
	{
		std::shared_lock lock{ mutex };
		if (auto existing = spd_loggers.find (type); existing != spd_loggers.end ())
		{
			return *existing->second;
		}
	}
	std::unique_lock lock{ mutex };
	auto [it, inserted] = spd_loggers.try_emplace (type, nullptr);
	if (inserted)
	{
		it->second = make_logger (type);
	}
	return *it->second;
}

std::shared_ptr<spdlog::logger> lumen::logger::make_logger (lumen::log::type type)
{
	auto tag = std::string{ lumen::log::to_string (type) };
	auto name = identifier.empty () ? tag : identifier + "::" + tag;
	auto spd_logger = std::make_shared<spdlog::logger> (name, global_sinks.begin (), global_sinks.end ());
	spd_logger->set_level (to_spdlog_level (find_level (type)));
	spd_logger->flush_on (to_spdlog_level (global_config.flush_level));
	return spd_logger;
}

lumen::log::level lumen::logger::find_level (lumen::log::type type) const
{
	if (auto it = global_config.levels.find (type); it != global_config.levels.end ())
	{
		return it->second;
	}
	if (auto it = global_config.levels.find (lumen::log::type::all); it != global_config.levels.end ())
	{
		return it->second;
	}
	return global_config.default_level;
}

spdlog::level::level_enum lumen::logger::to_spdlog_level (lumen::log::level level)
{
	switch (level)
	{
		case lumen::log::level::off:
			return spdlog::level::off;
		case lumen::log::level::critical:
			return spdlog::level::critical;
		case lumen::log::level::error:
			return spdlog::level::err;
		case lumen::log::level::warn:
			return spdlog::level::warn;
		case lumen::log::level::info:
			return spdlog::level::info;
		case lumen::log::level::debug:
			return spdlog::level::debug;
		case lumen::log::level::trace:
			return spdlog::level::trace;
	}
	debug_assert (false, "invalid log level");
	return spdlog::level::off;
}
