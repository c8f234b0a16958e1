#include <lumen/lib/errors.hpp>
#include <lumen/lib/headers.hpp>
#include <lumen/lib/utility.hpp>

#include <blake2.h>

#include <algorithm>

namespace
{
// Lengths are read in bounded chunks so a corrupt length prefix fails on the end of input instead of allocating
bool try_read_bytes (lumen::stream & stream_a, std::vector<uint8_t> & bytes_a, uint64_t size_a)
{
	auto error (false);
	bytes_a.clear ();
	size_t constexpr chunk_size = 4096;
	while (!error && bytes_a.size () < size_a)
	{
		auto amount = std::min<uint64_t> (chunk_size, size_a - bytes_a.size ());
		auto offset = bytes_a.size ();
		bytes_a.resize (offset + amount);
		error = stream_a.sgetn (bytes_a.data () + offset, amount) != static_cast<std::streamsize> (amount);
	}
	return error;
}

std::error_code read_hash (lumen::stream & stream_a, lumen::block_hash & hash_a)
{
	if (lumen::try_read (stream_a, hash_a.bytes))
	{
		return lumen::error_headers::truncated;
	}
	return {};
}

std::error_code read_vector (lumen::stream & stream_a, std::vector<uint8_t> & bytes_a)
{
	uint64_t size;
	if (lumen::scale::try_read_compact (stream_a, size))
	{
		return lumen::error_headers::invalid_compact;
	}
	if (try_read_bytes (stream_a, bytes_a, size))
	{
		return lumen::error_headers::truncated;
	}
	return {};
}

/*
 * The only signal is NewConfiguration (variant 0) carrying an optional configuration
 * of two little endian u32 (digest interval, digest levels)
 */
std::error_code read_changes_trie_signal (lumen::stream & stream_a, std::vector<uint8_t> & bytes_a)
{
	std::array<uint8_t, 2> prefix;
	if (lumen::try_read (stream_a, prefix))
	{
		return lumen::error_headers::truncated;
	}
	if (prefix[0] != 0 || prefix[1] > 1)
	{
		return lumen::error_headers::invalid_digest_item;
	}
	bytes_a.assign (prefix.begin (), prefix.end ());
	if (prefix[1] == 1)
	{
		std::array<uint8_t, 8> configuration;
		if (lumen::try_read (stream_a, configuration))
		{
			return lumen::error_headers::truncated;
		}
		bytes_a.insert (bytes_a.end (), configuration.begin (), configuration.end ());
	}
	return {};
}

void write_vector (lumen::stream & stream_a, std::vector<uint8_t> const & bytes_a)
{
	lumen::scale::write_compact (stream_a, bytes_a.size ());
	lumen::write (stream_a, bytes_a);
}

std::error_code read_digest_item (lumen::stream & stream_a, lumen::digest_item & item_a)
{
	uint8_t tag;
	if (lumen::try_read (stream_a, tag))
	{
		return lumen::error_headers::truncated;
	}
	item_a.type = static_cast<lumen::digest_item_type> (tag);
	switch (item_a.type)
	{
		case lumen::digest_item_type::other:
			return read_vector (stream_a, item_a.data);
		case lumen::digest_item_type::changes_trie_root:
		{
			lumen::block_hash root;
			if (auto ec = read_hash (stream_a, root))
			{
				return ec;
			}
			item_a.data.assign (root.bytes.begin (), root.bytes.end ());
			return {};
		}
		case lumen::digest_item_type::changes_trie_signal:
			return read_changes_trie_signal (stream_a, item_a.data);
		case lumen::digest_item_type::consensus:
		case lumen::digest_item_type::seal:
		case lumen::digest_item_type::pre_runtime:
			if (lumen::try_read (stream_a, item_a.engine_id))
			{
				return lumen::error_headers::truncated;
			}
			return read_vector (stream_a, item_a.data);
		case lumen::digest_item_type::runtime_environment_updated:
			return {};
	}
	return lumen::error_headers::invalid_digest_item;
}
}

bool lumen::scale::try_read_compact (lumen::stream & stream_a, uint64_t & value_a)
{
	uint8_t first;
	if (lumen::try_read (stream_a, first))
	{
		return true;
	}
	auto error (false);
	switch (first & 0b11)
	{
		case 0b00:
			value_a = first >> 2;
			break;
		case 0b01:
		{
			uint8_t second;
			error = lumen::try_read (stream_a, second);
			if (!error)
			{
				value_a = ((static_cast<uint64_t> (second) << 8) | first) >> 2;
				error = value_a < (1u << 6);
			}
			break;
		}
		case 0b10:
		{
			std::array<uint8_t, 3> rest;
			error = lumen::try_read (stream_a, rest);
			if (!error)
			{
				uint32_t raw = first | (static_cast<uint32_t> (rest[0]) << 8) | (static_cast<uint32_t> (rest[1]) << 16) | (static_cast<uint32_t> (rest[2]) << 24);
				value_a = raw >> 2;
				error = value_a < (1u << 14);
			}
			break;
		}
		default:
		{
			// Big integer mode, the upper six bits hold the byte count minus four
			auto length = static_cast<size_t> (first >> 2) + 4;
			error = length > sizeof (uint64_t);
			if (!error)
			{
				value_a = 0;
				for (size_t i = 0; !error && i < length; ++i)
				{
					uint8_t byte;
					error = lumen::try_read (stream_a, byte);
					value_a |= static_cast<uint64_t> (byte) << (8 * i);
				}
				// The most significant byte must be used and the value must not fit the four byte mode
				error = error || (value_a >> (8 * (length - 1))) == 0 || value_a < (1u << 30);
			}
			break;
		}
	}
	return error;
}

void lumen::scale::write_compact (lumen::stream & stream_a, uint64_t value_a)
{
	if (value_a < (1u << 6))
	{
		lumen::write (stream_a, static_cast<uint8_t> (value_a << 2));
	}
	else if (value_a < (1u << 14))
	{
		lumen::write_little_endian (stream_a, static_cast<uint16_t> ((value_a << 2) | 0b01));
	}
	else if (value_a < (1u << 30))
	{
		lumen::write_little_endian (stream_a, static_cast<uint32_t> ((value_a << 2) | 0b10));
	}
	else
	{
		size_t length = 4;
		while (length < sizeof (uint64_t) && (value_a >> (8 * length)) != 0)
		{
			++length;
		}
		lumen::write (stream_a, static_cast<uint8_t> (((length - 4) << 2) | 0b11));
		for (size_t i = 0; i < length; ++i)
		{
			lumen::write (stream_a, static_cast<uint8_t> (value_a >> (8 * i)));
		}
	}
}

bool lumen::digest_item::operator== (lumen::digest_item const & other_a) const
{
	return type == other_a.type && engine_id == other_a.engine_id && data == other_a.data;
}

std::error_code lumen::header::deserialize (lumen::stream & stream_a)
{
	if (auto ec = read_hash (stream_a, parent_hash))
	{
		return ec;
	}
	if (lumen::scale::try_read_compact (stream_a, number))
	{
		return lumen::error_headers::invalid_compact;
	}
	if (auto ec = read_hash (stream_a, state_root))
	{
		return ec;
	}
	if (auto ec = read_hash (stream_a, extrinsics_root))
	{
		return ec;
	}
	uint64_t count;
	if (lumen::scale::try_read_compact (stream_a, count))
	{
		return lumen::error_headers::invalid_compact;
	}
	digest.clear ();
	for (uint64_t i = 0; i < count; ++i)
	{
		lumen::digest_item item;
		if (auto ec = read_digest_item (stream_a, item))
		{
			return ec;
		}
		digest.push_back (std::move (item));
	}
	return {};
}

void lumen::header::serialize (lumen::stream & stream_a) const
{
	lumen::write (stream_a, parent_hash.bytes);
	lumen::scale::write_compact (stream_a, number);
	lumen::write (stream_a, state_root.bytes);
	lumen::write (stream_a, extrinsics_root.bytes);
	lumen::scale::write_compact (stream_a, digest.size ());
	for (auto const & item : digest)
	{
		lumen::write (stream_a, static_cast<uint8_t> (item.type));
		switch (item.type)
		{
			case lumen::digest_item_type::other:
				write_vector (stream_a, item.data);
				break;
			case lumen::digest_item_type::changes_trie_root:
				debug_assert (item.data.size () == sizeof (lumen::block_hash::bytes));
				lumen::write (stream_a, item.data);
				break;
			case lumen::digest_item_type::changes_trie_signal:
				lumen::write (stream_a, item.data);
				break;
			case lumen::digest_item_type::consensus:
			case lumen::digest_item_type::seal:
			case lumen::digest_item_type::pre_runtime:
				lumen::write (stream_a, item.engine_id);
				write_vector (stream_a, item.data);
				break;
			case lumen::digest_item_type::runtime_environment_updated:
				break;
		}
	}
}

std::vector<uint8_t> lumen::header::to_bytes () const
{
	std::vector<uint8_t> result;
	{
		lumen::vectorstream stream (result);
		serialize (stream);
	}
	return result;
}

lumen::block_hash lumen::header::hash () const
{
	return lumen::hash_scale_encoded_header (to_bytes ());
}

bool lumen::header::operator== (lumen::header const & other_a) const
{
	return parent_hash == other_a.parent_hash && number == other_a.number && state_root == other_a.state_root && extrinsics_root == other_a.extrinsics_root && digest == other_a.digest;
}

std::error_code lumen::decode_header (std::span<uint8_t const> bytes_a, lumen::header & header_a)
{
	lumen::bufferstream stream (bytes_a.data (), bytes_a.size ());
	if (auto ec = header_a.deserialize (stream))
	{
		return ec;
	}
	if (!lumen::at_end (stream))
	{
		return lumen::error_headers::trailing_bytes;
	}
	return {};
}

lumen::block_hash lumen::hash_scale_encoded_header (std::span<uint8_t const> bytes_a)
{
	lumen::block_hash result;
	blake2b_state hash_l;
	auto status (blake2b_init (&hash_l, sizeof (result.bytes)));
	debug_assert (status == 0);
	status = blake2b_update (&hash_l, bytes_a.data (), bytes_a.size ());
	debug_assert (status == 0);
	status = blake2b_final (&hash_l, result.bytes.data (), sizeof (result.bytes));
	debug_assert (status == 0);
	return result;
}
