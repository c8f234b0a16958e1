#pragma once

#include <lumen/lib/utility.hpp>

#include <optional>
#include <string_view>
#include <vector>

#include <magic_enum.hpp>

/*
 * Thin wrappers over magic_enum. Enumerators starting with an underscore are markers
 * (e.g. _last) and are never listed or parsed.
 */
namespace lumen::enum_util
{
std::string_view name (auto value)
{
	auto result = magic_enum::enum_name (value);
	debug_assert (!result.empty (), "enumerator outside the magic_enum range");
	return result;
}

inline bool is_marker (std::string_view name)
{
	return name.starts_with ('_');
}

/** Every enumerator of E in declaration order */
template <class E>
std::vector<E> const & values ()
{
	static std::vector<E> const all = [] () {
		std::vector<E> result;
		for (auto const & [value, value_name] : magic_enum::enum_entries<E> ())
		{
			if (!is_marker (value_name))
			{
				result.push_back (value);
			}
		}
		return result;
	}();
	return all;
}

/** Case insensitive lookup by enumerator name */
template <class E>
std::optional<E> try_parse (std::string_view name)
{
	if (is_marker (name))
	{
		return std::nullopt;
	}
	return magic_enum::enum_cast<E> (name, magic_enum::case_insensitive);
}
}
