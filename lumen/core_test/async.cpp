#include <lumen/lib/async.hpp>
#include <lumen/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <chrono>

using namespace std::chrono_literals;

TEST (async, sleep)
{
	lumen::test::context ctx;

	auto fut = asio::co_spawn (
	ctx.strand,
	[&] () -> asio::awaitable<void> {
		co_await lumen::async::sleep_for (500ms);
	},
	asio::use_future);

	ASSERT_EQ (fut.wait_for (100ms), std::future_status::timeout);
	ASSERT_EQ (fut.wait_for (1s), std::future_status::ready);
}

TEST (completion, resolve_before_wait)
{
	lumen::test::context ctx;
	lumen::async::completion completion{ ctx.strand };

	auto resolved = lumen::test::run (ctx.strand, [&] () -> asio::awaitable<bool> {
		completion.resolve ();
		co_return co_await completion.wait ();
	}());
	ASSERT_TRUE (resolved);
	ASSERT_TRUE (completion.resolved ());
}

TEST (completion, resolve_after_wait)
{
	lumen::test::context ctx;
	lumen::async::completion completion{ ctx.strand };

	auto fut = asio::co_spawn (
	ctx.strand,
	[&] () -> asio::awaitable<bool> {
		co_return co_await completion.wait ();
	},
	asio::use_future);

	ASSERT_EQ (fut.wait_for (200ms), std::future_status::timeout);
	asio::post (ctx.strand, [&] () { completion.resolve (); });
	ASSERT_EQ (fut.wait_for (1s), std::future_status::ready);
	ASSERT_TRUE (fut.get ());
}

TEST (completion, resolve_idempotent)
{
	lumen::test::context ctx;
	lumen::async::completion completion{ ctx.strand };

	auto resolved = lumen::test::run (ctx.strand, [&] () -> asio::awaitable<bool> {
		completion.resolve ();
		completion.resolve ();
		auto first = co_await completion.wait ();
		completion.resolve ();
		auto second = co_await completion.wait ();
		co_return first && second;
	}());
	ASSERT_TRUE (resolved);
}

TEST (completion, timeout)
{
	lumen::test::context ctx;
	lumen::async::completion completion{ ctx.strand };

	auto start = std::chrono::steady_clock::now ();
	auto resolved = lumen::test::run (ctx.strand, [&] () -> asio::awaitable<bool> {
		co_return co_await completion.wait (100ms);
	}());
	ASSERT_FALSE (resolved);
	ASSERT_FALSE (completion.resolved ());
	ASSERT_GE (std::chrono::steady_clock::now () - start, 100ms);
}

// A resolve arriving before the deadline wins over the timeout
TEST (completion, resolve_within_timeout)
{
	lumen::test::context ctx;
	lumen::async::completion completion{ ctx.strand };

	auto resolved = lumen::test::run (ctx.strand, [&] () -> asio::awaitable<bool> {
		asio::post (ctx.strand, [&] () { completion.resolve (); });
		co_return co_await completion.wait (10s);
	}());
	ASSERT_TRUE (resolved);
}
