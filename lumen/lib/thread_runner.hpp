#pragma once

#include <lumen/lib/logging.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/thread.hpp>

#include <memory>
#include <vector>

namespace lumen
{
namespace asio = boost::asio;

/**
 * Runs an io_context on a fixed number of threads until it runs out of work.
 * The context is kept alive with a work guard until join () is called.
 */
class thread_runner final
{
public:
	thread_runner (std::shared_ptr<asio::io_context>, lumen::logger &, unsigned thread_count = boost::thread::hardware_concurrency ());
	~thread_runner ();

	/** Drops the work guard and waits for outstanding handlers to finish */
	void join ();

private:
	void run ();

	lumen::logger & logger;
	std::shared_ptr<asio::io_context> io_ctx;
	asio::executor_work_guard<asio::io_context::executor_type> work;
	std::vector<boost::thread> threads;
};
}
