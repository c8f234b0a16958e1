#include <lumen/lib/numbers.hpp>
#include <lumen/lib/utility.hpp>

#include <boost/algorithm/hex.hpp>

#include <algorithm>
#include <iterator>

std::string lumen::to_hex (std::span<uint8_t const> bytes)
{
	std::string result;
	result.reserve (bytes.size () * 2);
	boost::algorithm::hex_lower (bytes.begin (), bytes.end (), std::back_inserter (result));
	return result;
}

bool lumen::from_hex (std::string_view text, std::vector<uint8_t> & bytes)
{
	auto error (false);
	std::vector<uint8_t> result;
	result.reserve (text.size () / 2);
	try
	{
		boost::algorithm::unhex (text.begin (), text.end (), std::back_inserter (result));
	}
	catch (boost::algorithm::hex_decode_error const &)
	{
		error = true;
	}
	if (!error)
	{
		bytes = std::move (result);
	}
	return error;
}

bool lumen::uint256_union::operator== (lumen::uint256_union const & other_a) const
{
	return bytes == other_a.bytes;
}

bool lumen::uint256_union::operator!= (lumen::uint256_union const & other_a) const
{
	return !(*this == other_a);
}

void lumen::uint256_union::encode_hex (std::string & text) const
{
	debug_assert (text.empty ());
	text = lumen::to_hex (bytes);
}

bool lumen::uint256_union::decode_hex (std::string const & text)
{
	std::vector<uint8_t> decoded;
	auto error (text.size () != bytes.size () * 2 || lumen::from_hex (text, decoded));
	if (!error)
	{
		std::copy (decoded.begin (), decoded.end (), bytes.begin ());
	}
	return error;
}

bool lumen::uint256_union::is_zero () const
{
	return std::all_of (bytes.begin (), bytes.end (), [] (uint8_t byte) { return byte == 0; });
}

std::string lumen::uint256_union::to_string () const
{
	std::string result;
	encode_hex (result);
	return result;
}
