#pragma once

#include <lumen/lib/numbers.hpp>
#include <lumen/lib/stream.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

namespace lumen
{
/** Tag byte of an entry in the header digest */
enum class digest_item_type : uint8_t
{
	other = 0,
	/** Retired, still present in headers of older chains */
	changes_trie_root = 2,
	consensus = 4,
	seal = 5,
	pre_runtime = 6,
	/** Retired, still present in headers of older chains */
	changes_trie_signal = 7,
	runtime_environment_updated = 8,
};

class digest_item final
{
public:
	bool operator== (digest_item const &) const;

	lumen::digest_item_type type{ lumen::digest_item_type::other };
	/** Only meaningful for consensus, seal and pre_runtime items */
	std::array<uint8_t, 4> engine_id{};
	/**
	 * Empty for runtime_environment_updated. The 32 byte root for changes_trie_root and
	 * the raw signal encoding for changes_trie_signal, neither is length prefixed on the wire.
	 */
	std::vector<uint8_t> data;
};

/**
 * SCALE encoded block header:
 * parent hash (32 bytes), compact block number, state root (32 bytes), extrinsics root (32 bytes), digest items.
 */
class header final
{
public:
	/**
	 * Reads one header from \p stream_a. Bytes after the header are left in the stream.
	 * @return lumen::error_headers code on failure, empty otherwise
	 */
	std::error_code deserialize (lumen::stream & stream_a);
	void serialize (lumen::stream & stream_a) const;
	std::vector<uint8_t> to_bytes () const;
	/** BLAKE2b-256 of the SCALE encoding */
	lumen::block_hash hash () const;
	bool operator== (header const &) const;

	lumen::block_hash parent_hash;
	lumen::block_number number{ 0 };
	lumen::block_hash state_root;
	lumen::block_hash extrinsics_root;
	std::vector<lumen::digest_item> digest;
};

/**
 * Decodes a complete SCALE encoded header, rejecting trailing bytes.
 * @return lumen::error_headers code on failure, empty otherwise
 */
std::error_code decode_header (std::span<uint8_t const> bytes_a, lumen::header & header_a);

/** Hash of a SCALE encoded header, computed over the raw bytes without decoding them */
lumen::block_hash hash_scale_encoded_header (std::span<uint8_t const> bytes_a);

namespace scale
{
	/** @return true on error (truncated or non canonical encoding) */
	bool try_read_compact (lumen::stream & stream_a, uint64_t & value_a);
	void write_compact (lumen::stream & stream_a, uint64_t value_a);
}
}
