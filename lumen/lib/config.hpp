#pragma once

#include <lumen/lib/tomlconfig.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace lumen
{
/**
 * Reads \p config_filename from \p data_path, applying \p config_overrides on top of it.
 * A missing file is not an error, an empty table with only the overrides is returned instead.
 * @throws std::runtime_error if the file or the overrides cannot be parsed
 */
lumen::tomlconfig load_toml_file (std::filesystem::path const & config_filename, std::filesystem::path const & data_path, std::vector<std::string> const & config_overrides);

/**
 * Loads a config of type T, starting from \p fallback and overwriting every value present in the toml file.
 * @throws std::runtime_error on parse or validation errors
 */
template <typename T>
T load_config_file (T fallback, std::filesystem::path const & config_filename, std::filesystem::path const & data_path, std::vector<std::string> const & config_overrides)
{
	auto toml = lumen::load_toml_file (config_filename, data_path, config_overrides);

	T config = fallback;
	auto error = config.deserialize_toml (toml);
	if (error)
	{
		throw std::runtime_error (error.get_message ());
	}
	return config;
}
}
