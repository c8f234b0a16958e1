#include <lumen/lib/thread_runner.hpp>

lumen::thread_runner::thread_runner (std::shared_ptr<asio::io_context> io_ctx_a, lumen::logger & logger_a, unsigned thread_count) :
	logger{ logger_a },
	io_ctx{ std::move (io_ctx_a) },
	work{ asio::make_work_guard (*io_ctx) }
{
	release_assert (thread_count > 0);
	logger.debug (lumen::log::type::thread_runner, "Running io_context on {} thread(s)", thread_count);
	threads.reserve (thread_count);
	for (auto i = 0u; i < thread_count; ++i)
	{
		threads.emplace_back ([this] () { run (); });
	}
}

lumen::thread_runner::~thread_runner ()
{
	join ();
}

void lumen::thread_runner::run ()
{
	try
	{
		io_ctx->run ();
	}
	catch (std::exception const & ex)
	{
		logger.critical (lumen::log::type::thread_runner, "Unhandled exception in io thread: {}", ex.what ());
#ifndef NDEBUG
		throw;
#endif
	}
}

void lumen::thread_runner::join ()
{
	if (threads.empty ())
	{
		return;
	}
	work.reset ();
	for (auto & thread : threads)
	{
		if (thread.joinable ())
		{
			thread.join ();
		}
	}
	threads.clear ();
	logger.debug (lumen::log::type::thread_runner, "io threads stopped");
}
