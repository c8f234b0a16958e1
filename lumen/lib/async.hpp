#pragma once

#include <lumen/lib/utility.hpp>

#include <utility>

#include <boost/asio.hpp>

#include <chrono>

namespace asio = boost::asio;

namespace lumen::async
{
using strand = asio::strand<asio::io_context::executor_type>;

inline asio::awaitable<void> sleep_for (auto duration)
{
	asio::steady_timer timer{ co_await asio::this_coro::executor };
	timer.expires_after (duration);
	boost::system::error_code ec; // Swallow potential error from coroutine cancellation
	co_await timer.async_wait (asio::redirect_error (asio::use_awaitable, ec));
	debug_assert (!ec || ec == asio::error::operation_aborted);
}

/**
 * One shot signal bridging a callback notification to a coroutine.
 * A timer that never expires on its own acts as the condition, resolving cancels it.
 * Both resolve () and wait () must be used from the strand the signal was created with.
 */
class completion final
{
public:
	explicit completion (lumen::async::strand & strand) :
		timer{ strand }
	{
		timer.expires_at (std::chrono::steady_clock::time_point::max ());
	}

	/** Idempotent, resolving before anyone waits is allowed */
	void resolve ()
	{
		resolved_m = true;
		timer.cancel ();
	}

	bool resolved () const
	{
		return resolved_m;
	}

	/**
	 * Suspends until resolved. A zero timeout waits forever.
	 * @return true if resolved, false if the timeout elapsed first
	 */
	asio::awaitable<bool> wait (std::chrono::milliseconds timeout = std::chrono::milliseconds{ 0 })
	{
		if (resolved_m)
		{
			co_return true;
		}
		if (timeout.count () > 0)
		{
			timer.expires_after (timeout);
		}
		boost::system::error_code ec;
		co_await timer.async_wait (asio::redirect_error (asio::use_awaitable, ec));
		debug_assert (!ec || ec == asio::error::operation_aborted);
		co_return resolved_m;
	}

private:
	asio::steady_timer timer;
	bool resolved_m{ false };
};
}
