#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lumen
{
/** Lowercase hex of \p bytes, two characters per byte */
std::string to_hex (std::span<uint8_t const> bytes);

/**
 * Decodes hex text of either case into \p bytes.
 * @return true on error (odd length or a non hex character), false otherwise
 */
bool from_hex (std::string_view text, std::vector<uint8_t> & bytes);

class uint256_union
{
public:
	bool operator== (lumen::uint256_union const &) const;
	bool operator!= (lumen::uint256_union const &) const;
	void encode_hex (std::string &) const;
	/** @return true on error, the value is unchanged then */
	bool decode_hex (std::string const &);

	bool is_zero () const;
	std::string to_string () const;

	std::array<uint8_t, 32> bytes{};
};

// Headers are identified by their 256 bit hash
class block_hash final : public uint256_union
{
};

using block_number = uint64_t;
}
