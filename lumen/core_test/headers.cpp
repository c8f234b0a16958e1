#include <lumen/lib/errors.hpp>
#include <lumen/lib/headers.hpp>
#include <lumen/lib/numbers.hpp>
#include <lumen/lib/stream.hpp>
#include <lumen/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <limits>

namespace
{
std::vector<uint8_t> compact (uint64_t value)
{
	std::vector<uint8_t> result;
	{
		lumen::vectorstream stream (result);
		lumen::scale::write_compact (stream, value);
	}
	return result;
}

bool read_compact (std::vector<uint8_t> const & bytes, uint64_t & value)
{
	lumen::bufferstream stream (bytes.data (), bytes.size ());
	return lumen::scale::try_read_compact (stream, value);
}
}

TEST (compact, encoding)
{
	ASSERT_EQ (std::vector<uint8_t> ({ 0x00 }), compact (0));
	ASSERT_EQ (std::vector<uint8_t> ({ 0x04 }), compact (1));
	ASSERT_EQ (std::vector<uint8_t> ({ 0xfc }), compact (63));
	ASSERT_EQ (std::vector<uint8_t> ({ 0x01, 0x01 }), compact (64));
	ASSERT_EQ (std::vector<uint8_t> ({ 0xfd, 0xff }), compact (16383));
	ASSERT_EQ (std::vector<uint8_t> ({ 0x02, 0x00, 0x01, 0x00 }), compact (16384));
	ASSERT_EQ (std::vector<uint8_t> ({ 0xfe, 0xff, 0xff, 0xff }), compact ((1ULL << 30) - 1));
	ASSERT_EQ (std::vector<uint8_t> ({ 0x03, 0x00, 0x00, 0x00, 0x40 }), compact (1ULL << 30));
	ASSERT_EQ (std::vector<uint8_t> ({ 0x13, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff }), compact (std::numeric_limits<uint64_t>::max ()));
}

TEST (compact, decoding)
{
	for (uint64_t value : { 0ULL, 1ULL, 63ULL, 64ULL, 16383ULL, 16384ULL, (1ULL << 30) - 1, 1ULL << 30, 1ULL << 32, std::numeric_limits<uint64_t>::max () })
	{
		uint64_t decoded;
		ASSERT_FALSE (read_compact (compact (value), decoded));
		ASSERT_EQ (value, decoded);
	}
}

TEST (compact, non_canonical)
{
	uint64_t value;
	// 1 in two byte mode
	ASSERT_TRUE (read_compact ({ 0x05, 0x00 }, value));
	// 1 in four byte mode
	ASSERT_TRUE (read_compact ({ 0x06, 0x00, 0x00, 0x00 }, value));
	// 1 in big integer mode
	ASSERT_TRUE (read_compact ({ 0x03, 0x01, 0x00, 0x00, 0x00 }, value));
	// Nine bytes do not fit 64 bits
	ASSERT_TRUE (read_compact ({ 0x17, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01 }, value));
	// Truncated
	ASSERT_TRUE (read_compact ({ 0x01 }, value));
	ASSERT_TRUE (read_compact ({}, value));
}

TEST (header, decode)
{
	auto header = lumen::test::make_header (42, 7);
	auto bytes = header.to_bytes ();

	lumen::header decoded;
	ASSERT_NO_ERROR (lumen::decode_header (bytes, decoded));
	ASSERT_EQ (42, decoded.number);
	ASSERT_EQ (header.parent_hash, decoded.parent_hash);
	ASSERT_EQ (header.state_root, decoded.state_root);
	ASSERT_EQ (header.extrinsics_root, decoded.extrinsics_root);
	ASSERT_EQ (2, decoded.digest.size ());
	ASSERT_EQ (lumen::digest_item_type::pre_runtime, decoded.digest[0].type);
	ASSERT_EQ (lumen::digest_item_type::seal, decoded.digest[1].type);
	ASSERT_EQ (64, decoded.digest[1].data.size ());
	ASSERT_TRUE (header == decoded);
}

TEST (header, layout)
{
	lumen::header header;
	header.number = 1;
	auto bytes = header.to_bytes ();
	// Three hashes, a one byte compact number and an empty digest
	ASSERT_EQ (32 * 3 + 1 + 1, bytes.size ());
	ASSERT_EQ (0x04, bytes[32]);
	ASSERT_EQ (0x00, bytes.back ());
}

TEST (header, runtime_environment_updated)
{
	auto header = lumen::test::make_header (1);
	lumen::digest_item item;
	item.type = lumen::digest_item_type::runtime_environment_updated;
	header.digest.push_back (item);
	header.digest.push_back (lumen::digest_item{ lumen::digest_item_type::other, {}, { 0xaa, 0xbb } });

	lumen::header decoded;
	ASSERT_NO_ERROR (lumen::decode_header (header.to_bytes (), decoded));
	ASSERT_EQ (header, decoded);
}

TEST (header, truncated)
{
	auto bytes = lumen::test::make_header (42).to_bytes ();
	lumen::header decoded;
	ASSERT_EQ (lumen::error_headers::truncated, lumen::decode_header (std::span<uint8_t const> (bytes.data (), bytes.size () - 1), decoded));
	ASSERT_EQ (lumen::error_headers::truncated, lumen::decode_header (std::span<uint8_t const> (bytes.data (), 31), decoded));
	ASSERT_EQ (lumen::error_headers::truncated, lumen::decode_header (std::span<uint8_t const> (), decoded));
}

TEST (header, trailing_bytes)
{
	auto bytes = lumen::test::make_header (42).to_bytes ();
	bytes.push_back (0);
	lumen::header decoded;
	ASSERT_EQ (lumen::error_headers::trailing_bytes, lumen::decode_header (bytes, decoded));
}

TEST (header, invalid_digest_item)
{
	lumen::header header;
	auto bytes = header.to_bytes ();
	// One digest item with an unknown tag
	bytes.back () = 0x04;
	bytes.push_back (0x03);
	lumen::header decoded;
	ASSERT_EQ (lumen::error_headers::invalid_digest_item, lumen::decode_header (bytes, decoded));
}

// Older chains still carry changes trie items in their headers
TEST (header, changes_trie_items)
{
	lumen::header header;
	auto bytes = header.to_bytes ();
	bytes.back () = 0x0c;
	bytes.push_back (0x02);
	bytes.insert (bytes.end (), 32, 0x5a);
	// New configuration, none
	bytes.insert (bytes.end (), { 0x07, 0x00, 0x00 });
	// New configuration with digest interval 4 and digest levels 2
	bytes.insert (bytes.end (), { 0x07, 0x00, 0x01, 0x04, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00 });

	lumen::header decoded;
	ASSERT_NO_ERROR (lumen::decode_header (bytes, decoded));
	ASSERT_EQ (3, decoded.digest.size ());
	ASSERT_EQ (lumen::digest_item_type::changes_trie_root, decoded.digest[0].type);
	ASSERT_EQ (std::vector<uint8_t> (32, 0x5a), decoded.digest[0].data);
	ASSERT_EQ (lumen::digest_item_type::changes_trie_signal, decoded.digest[1].type);
	ASSERT_EQ (std::vector<uint8_t> ({ 0x00, 0x00 }), decoded.digest[1].data);
	ASSERT_EQ (lumen::digest_item_type::changes_trie_signal, decoded.digest[2].type);
	ASSERT_EQ (10, decoded.digest[2].data.size ());
	ASSERT_EQ (bytes, decoded.to_bytes ());
}

TEST (header, malformed_changes_trie_items)
{
	lumen::header header;
	auto prefix = header.to_bytes ();
	prefix.back () = 0x04;
	auto decode = [&prefix] (std::vector<uint8_t> item_a) {
		auto bytes = prefix;
		bytes.insert (bytes.end (), item_a.begin (), item_a.end ());
		lumen::header decoded;
		return lumen::decode_header (bytes, decoded);
	};
	// Unknown signal variant
	ASSERT_EQ (lumen::error_headers::invalid_digest_item, decode ({ 0x07, 0x01, 0x00 }));
	// Option tag other than none or some
	ASSERT_EQ (lumen::error_headers::invalid_digest_item, decode ({ 0x07, 0x00, 0x02 }));
	ASSERT_EQ (lumen::error_headers::truncated, decode ({ 0x07, 0x00, 0x01, 0x04, 0x00 }));
	ASSERT_EQ (lumen::error_headers::truncated, decode ({ 0x07, 0x00 }));
	std::vector<uint8_t> short_root (32, 0x5a);
	short_root[0] = 0x02;
	ASSERT_EQ (lumen::error_headers::truncated, decode (short_root));
}

// A digest length far beyond the input fails on the end of input
TEST (header, oversized_digest_item)
{
	lumen::header header;
	auto bytes = header.to_bytes ();
	bytes.back () = 0x04;
	bytes.push_back (0x00);
	auto length = compact (1ULL << 40);
	bytes.insert (bytes.end (), length.begin (), length.end ());
	lumen::header decoded;
	ASSERT_EQ (lumen::error_headers::truncated, lumen::decode_header (bytes, decoded));
}

TEST (header, hash)
{
	// BLAKE2b-256 of the empty input
	ASSERT_EQ ("0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8", lumen::hash_scale_encoded_header ({}).to_string ());

	auto header = lumen::test::make_header (42);
	ASSERT_EQ (lumen::hash_scale_encoded_header (header.to_bytes ()), header.hash ());
	ASSERT_NE (header.hash (), lumen::test::make_header (42, 1).hash ());
}

TEST (numbers, hex)
{
	std::vector<uint8_t> bytes{ 0x00, 0x01, 0xab, 0xff };
	ASSERT_EQ ("0001abff", lumen::to_hex (bytes));

	std::vector<uint8_t> decoded;
	ASSERT_FALSE (lumen::from_hex ("0001ABff", decoded));
	ASSERT_EQ (bytes, decoded);
	ASSERT_TRUE (lumen::from_hex ("abc", decoded));
	ASSERT_TRUE (lumen::from_hex ("zz", decoded));
	ASSERT_EQ (bytes, decoded);
}

TEST (numbers, block_hash)
{
	lumen::block_hash hash;
	ASSERT_TRUE (hash.is_zero ());
	ASSERT_FALSE (hash.decode_hex ("0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8"));
	ASSERT_FALSE (hash.is_zero ());
	ASSERT_EQ ("0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8", hash.to_string ());
	ASSERT_TRUE (hash.decode_hex ("0e57"));
}
