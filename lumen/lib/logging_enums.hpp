#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include <magic_enum.hpp>

namespace lumen::log
{
enum class level
{
	trace,
	debug,
	info,
	warn,
	error,
	critical,
	off,
};

enum class type
{
	all = 0, // reserved

	generic,
	test,
	init,
	config,
	logging,
	thread_runner,
	lmdb,
	engine,
	schema,
	store,

	_last // Must be the last enum
};
}

namespace lumen::log
{
std::string_view to_string (lumen::log::type);
std::string_view to_string (lumen::log::level);

/// @throw std::invalid_argument if the input string does not match a log::level
lumen::log::level parse_level (std::string_view);

/// @throw std::invalid_argument if the input string does not match a log::type
lumen::log::type parse_type (std::string_view);

std::vector<lumen::log::level> const & all_levels ();
std::vector<lumen::log::type> const & all_types ();
}

// Ensure that the enum_range is large enough to hold all values (including future ones)
template <>
struct magic_enum::customize::enum_range<lumen::log::type>
{
	static constexpr int min = 0;
	static constexpr int max = 128;
};
