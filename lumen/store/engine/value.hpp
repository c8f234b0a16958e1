#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lumen::store::engine
{
/** A key is either a number or a text, numbers sort before texts */
using key = std::variant<uint64_t, std::string>;

/** Stored value. std::monostate is the undefined value returned for absent keys and cannot be stored */
using value = std::variant<std::monostate, uint64_t, std::string, std::vector<uint8_t>>;

bool is_undefined (engine::value const &);
engine::value to_value (engine::key const &);

/**
 * Serialized form of a key, ordered the way keys compare.
 * @throws std::system_error with engine::error::data if the encoded key exceeds \p max_size
 */
std::vector<uint8_t> encode_key (engine::key const &, std::size_t max_size);

/**
 * Serialized form of a value, prefixed by its type tag.
 * @throws std::system_error with engine::error::data for the undefined value
 */
std::vector<uint8_t> encode_value (engine::value const &);

/** @return std::nullopt if \p bytes is not a well formed tagged value */
std::optional<engine::value> decode_value (uint8_t const * bytes, std::size_t size);
}
