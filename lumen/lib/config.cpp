#include <lumen/lib/config.hpp>

#include <iostream>
#include <sstream>

// Using std::cerr here, since logging may not be initialized yet
lumen::tomlconfig lumen::load_toml_file (std::filesystem::path const & config_filename, std::filesystem::path const & data_path, std::vector<std::string> const & config_overrides)
{
	std::stringstream config_overrides_stream;
	for (auto const & entry : config_overrides)
	{
		config_overrides_stream << entry << std::endl;
	}
	config_overrides_stream << std::endl;

	// Make sure we don't create an empty toml file if it doesn't exist. Running without a toml file is the default.
	auto toml_config_path = data_path / config_filename;
	if (std::filesystem::exists (toml_config_path))
	{
		lumen::tomlconfig toml;
		auto error = toml.read (config_overrides_stream, toml_config_path);
		if (error)
		{
			throw std::runtime_error (error.get_message ());
		}
		std::cerr << "Config file `" << config_filename.string () << "` loaded from data directory: " << toml_config_path.string () << std::endl;
		return toml;
	}
	else
	{
		lumen::tomlconfig toml;
		auto error = toml.read (config_overrides_stream);
		if (error)
		{
			throw std::runtime_error (error.get_message ());
		}
		return toml;
	}
}
