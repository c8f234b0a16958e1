#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace lumen::env
{
/**
 * Get environment variable as a string or none if variable is not present.
 */
std::optional<std::string> get (std::string_view name);
}
