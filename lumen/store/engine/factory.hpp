#pragma once

#include <lumen/lib/async.hpp>
#include <lumen/lib/errors.hpp>
#include <lumen/lib/storeconfig.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace lumen
{
class logger;
}

namespace lumen::store::engine
{
class connection;

class version_change_event final
{
public:
	uint64_t old_version;
	uint64_t new_version;
	engine::connection & connection;
};

/**
 * Pending open of a named store. Notifications fire on the strand after the caller returned to the event loop,
 * so handlers can be installed right after factory::open returns.
 * At most one upgrade notification fires, then exactly one of success or error.
 */
class open_request final
{
public:
	using handler = std::function<void ()>;
	using upgrade_handler = std::function<void (engine::version_change_event const &)>;

	void on_upgrade_needed (upgrade_handler);
	void on_success (handler);
	void on_error (handler);

	bool done () const;
	/** The open connection once successful */
	std::shared_ptr<engine::connection> result () const;
	lumen::error const & error () const;

private:
	void upgrade (engine::version_change_event const &);
	void succeed (std::shared_ptr<engine::connection>);
	void fail (lumen::error);
	void release ();

	upgrade_handler upgrade_handler_m;
	handler success_handler;
	handler error_handler;
	std::shared_ptr<engine::connection> result_m;
	lumen::error error_m;
	bool done_m{ false };

	friend class factory;
};

/**
 * Entry point of the storage engine. Every store lives in its own file under the root directory
 * and all engine work is serialized on the strand.
 */
class factory final
{
public:
	factory (lumen::async::strand &, std::filesystem::path root_a, lumen::store_config const &, lumen::logger &);

	/** False when disabled by configuration or when the root directory cannot be prepared */
	bool supported () const;

	/**
	 * Opens or creates store \p name_a, upgrading it when its stored version is lower than \p version_a.
	 * The factory must outlive the returned request.
	 * @throws std::invalid_argument if \p version_a is zero
	 */
	std::shared_ptr<engine::open_request> open (std::string const & name_a, uint64_t version_a);

	lumen::async::strand & strand () const;
	lumen::store_config const & config () const;
	std::filesystem::path path (std::string const & name_a) const;

	static bool valid_name (std::string const & name_a);

	lumen::logger & logger;

private:
	void run_open (std::shared_ptr<engine::open_request>, std::string const & name_a, uint64_t version_a);

	lumen::async::strand & strand_m;
	std::filesystem::path const root;
	lumen::store_config const config_m;
	bool supported_m{ false };
};
}
