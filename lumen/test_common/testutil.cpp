#include <lumen/lib/utility.hpp>
#include <lumen/store/completion.hpp>
#include <lumen/store/engine/connection.hpp>
#include <lumen/store/engine/request.hpp>
#include <lumen/test_common/testutil.hpp>

#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <iostream>

namespace
{
std::vector<std::filesystem::path> all_unique_paths;
}

std::filesystem::path lumen::test::unique_path ()
{
	auto result = std::filesystem::temp_directory_path () / "lumen_test" / boost::uuids::to_string (boost::uuids::random_generator () ());

	std::filesystem::create_directories (result);

	all_unique_paths.push_back (result);
	return result;
}

void lumen::test::remove_temporary_directories ()
{
	for (auto & path : all_unique_paths)
	{
		std::error_code ec;
		std::filesystem::remove_all (path, ec);
		if (ec)
		{
			std::cerr << "Could not remove temporary directory: " << ec.message () << std::endl;
		}
	}
	all_unique_paths.clear ();
}

std::promise<void> lumen::test::hold (lumen::async::strand & strand_a)
{
	std::promise<void> release;
	asio::post (strand_a, [released = release.get_future ().share ()] () {
		released.wait ();
	});
	return release;
}

lumen::header lumen::test::make_header (uint64_t number, uint8_t seed)
{
	lumen::header result;
	result.parent_hash.bytes.fill (seed);
	result.number = number;
	result.state_root.bytes.fill (0x11);
	result.extrinsics_root.bytes.fill (0x22);

	lumen::digest_item pre_runtime;
	pre_runtime.type = lumen::digest_item_type::pre_runtime;
	pre_runtime.engine_id = { 'a', 'u', 'r', 'a' };
	pre_runtime.data = { 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08 };
	result.digest.push_back (pre_runtime);

	lumen::digest_item seal;
	seal.type = lumen::digest_item_type::seal;
	seal.engine_id = { 'a', 'u', 'r', 'a' };
	seal.data.assign (64, seed);
	result.digest.push_back (seal);
	return result;
}

asio::awaitable<uint64_t> lumen::test::count (lumen::store::engine::connection & connection_a, std::string collection_a)
{
	auto txn = connection_a.transaction ({ collection_a }, lumen::store::engine::access_mode::read_only);
	auto request = txn->object_store (collection_a).count ();
	auto done = lumen::store::watch (connection_a.strand (), *request);
	co_await done->wait ();
	release_assert (!request->error (), request->error ().get_message ());
	co_return std::get<uint64_t> (request->result ());
}
