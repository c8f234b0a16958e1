#pragma once

#include <lumen/lib/async.hpp>
#include <lumen/lib/errors.hpp>
#include <lumen/store/engine/value.hpp>
#include <lumen/store/errors.hpp>
#include <lumen/store/tables.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>

namespace lumen
{
class logger;
}

namespace lumen::store::engine
{
class connection;
class factory;
}

namespace lumen::store
{
/**
 * Header store of a light client: block headers by hash and the best chain by block number.
 * Owns one engine connection, closed when the handle is destroyed.
 * Coroutines must run on the strand of the factory the database was opened with, and the handle must be destroyed there too.
 */
class database final
{
public:
	using open_result = std::pair<std::unique_ptr<database>, lumen::error>;

	/**
	 * Opens or creates store \p name_a, creating the schema if the store is older than version_current.
	 * @return the database, or open_error::no_environment, not_supported, open_failed or timeout
	 */
	static asio::awaitable<open_result> open (engine::factory * factory_a, std::string name_a);

	database (std::shared_ptr<engine::connection>, std::chrono::milliseconds operation_timeout_a, lumen::logger &);
	/** Closes the connection, transactions already scheduled still run first */
	~database ();
	database (database const &) = delete;
	database & operator= (database const &) = delete;

	/**
	 * Stores a SCALE encoded header under its hash and points the best chain entry for its number at it.
	 * Both writes commit together. Storing a header that is already present succeeds without writing anything.
	 * @return access_error::invalid_header if the header cannot be decoded, transaction_error or timeout otherwise
	 */
	asio::awaitable<lumen::error> insert_header (std::span<uint8_t const> header_a);

	std::string const & name () const;

private:
	using get_result = std::pair<std::optional<std::string>, lumen::error>;

	/** Text value stored under \p key_a, std::nullopt if absent or if the key cannot be stored at all */
	asio::awaitable<get_result> get (lumen::tables table_a, engine::key key_a);

	std::shared_ptr<engine::connection> connection;
	std::chrono::milliseconds const operation_timeout;
	lumen::logger & logger;

	friend class database_insert_header_Test;
	friend class database_insert_duplicate_Test;
	friend class database_same_number_overwrites_Test;
	friend class database_get_absent_Test;
	friend class database_get_key_too_long_Test;
	friend class database_get_unexpected_value_type_Test;
	friend class database_reopen_Test;
	friend class database_close_on_destruction_Test;
	friend class database_insert_timeout_rolls_back_Test;
	friend class database_get_timeout_Test;
};
}
