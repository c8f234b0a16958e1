#pragma once

#include <lumen/lib/logging_enums.hpp>
#include <lumen/lib/tomlconfig.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <fmt/ostream.h>
#include <spdlog/spdlog.h>

namespace lumen
{
/** The [log] table of config-log.toml */
class log_config final
{
public:
	lumen::error serialize_toml (lumen::tomlconfig &) const;
	lumen::error deserialize_toml (lumen::tomlconfig &);

	lumen::log::level default_level{ lumen::log::level::info };
	lumen::log::level flush_level{ lumen::log::level::error };
	/** Per tag overrides of default_level, log::type::all applies to every tag without its own entry */
	std::map<lumen::log::type, lumen::log::level> levels;

	struct console_config
	{
		bool enable{ true };
		bool to_cerr{ false };
	};

	struct file_config
	{
		bool enable{ false };
		std::size_t max_size{ 32 * 1024 * 1024 };
		std::size_t rotation_count{ 4 };
	};

	console_config console;
	file_config file;

	static log_config default_config ();
	/** Silent, tests enable what they need through config-log.toml in the working directory or LUMEN_LOG */
	static log_config tests_default ();
	/** Every tag listed, for generated sample files */
	static log_config sample_config ();
};

/**
 * Reads config-log.toml from \p data_path, then applies LUMEN_LOG (default level) and LUMEN_LOG_LEVELS (tag=level,...).
 * Problems are reported on std::cerr and fall back to \p fallback, logging is not available yet.
 */
lumen::log_config load_log_config (lumen::log_config fallback, std::filesystem::path const & data_path, std::vector<std::string> const & config_overrides = {});

/**
 * Front end to one spdlog logger per log::type. Every logger shares the process wide sinks set up by initialize.
 * The identifier distinguishes the owners, e.g. stores, when several log through the same sinks.
 */
class logger final
{
public:
	explicit logger (std::string identifier = "");
	~logger ();

	logger (logger const &) = delete;

	/** Log files go to \p data_path / log when file logging is enabled */
	static void initialize (lumen::log_config fallback, std::optional<std::filesystem::path> data_path = std::nullopt, std::vector<std::string> const & config_overrides = {});
	static void initialize_for_tests (lumen::log_config fallback);
	static void flush ();

	template <class... Args>
	void log (lumen::log::level level, lumen::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).log (to_spdlog_level (level), fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void trace (lumen::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).trace (fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void debug (lumen::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).debug (fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void info (lumen::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).info (fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void warn (lumen::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).warn (fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void error (lumen::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).error (fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void critical (lumen::log::type type, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (type).critical (fmt, std::forward<Args> (args)...);
	}

private:
	static bool global_initialized;
	static lumen::log_config global_config;
	static std::vector<spdlog::sink_ptr> global_sinks;

	static void setup_sinks (lumen::log_config const &, std::optional<std::filesystem::path> const & data_path);
	static spdlog::level::level_enum to_spdlog_level (lumen::log::level);

	spdlog::logger & get_logger (lumen::log::type);
	std::shared_ptr<spdlog::logger> make_logger (lumen::log::type);
	lumen::log::level find_level (lumen::log::type) const;

	std::string const identifier;
	std::map<lumen::log::type, std::shared_ptr<spdlog::logger>> spd_loggers;
	std::shared_mutex mutex;
};
}
