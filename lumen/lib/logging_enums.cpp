#include <lumen/lib/enum_util.hpp>
#include <lumen/lib/logging_enums.hpp>
#include <lumen/lib/utility.hpp>

std::string_view lumen::log::to_string (lumen::log::type tag)
{
	return lumen::enum_util::name (tag);
}

std::string_view lumen::log::to_string (lumen::log::level level)
{
	return lumen::enum_util::name (level);
}

std::vector<lumen::log::level> const & lumen::log::all_levels ()
{
	static std::vector<lumen::log::level> all = [] () {
		return lumen::enum_util::values<lumen::log::level> ();
	}();
	return all;
}

std::vector<lumen::log::type> const & lumen::log::all_types ()
{
	static std::vector<lumen::log::type> all = [] () {
		return lumen::enum_util::values<lumen::log::type> ();
	}();
	return all;
}

lumen::log::level lumen::log::parse_level (std::string_view name)
{
	auto value = lumen::enum_util::try_parse<lumen::log::level> (name);
	if (value.has_value ())
	{
		return value.value ();
	}
	else
	{
		auto all_levels_str = lumen::util::join (lumen::log::all_levels (), ", ", [] (auto const & lvl) {
			return to_string (lvl);
		});

		throw std::invalid_argument ("Invalid log level: " + std::string (name) + ". Must be one of: " + all_levels_str);
	}
}

lumen::log::type lumen::log::parse_type (std::string_view name)
{
	auto value = lumen::enum_util::try_parse<lumen::log::type> (name);
	if (value.has_value ())
	{
		return value.value ();
	}
	else
	{
		throw std::invalid_argument ("Invalid log type: " + std::string (name));
	}
}
