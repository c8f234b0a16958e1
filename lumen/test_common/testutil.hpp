#pragma once

#include <lumen/lib/async.hpp>
#include <lumen/lib/headers.hpp>
#include <lumen/lib/logging.hpp>
#include <lumen/lib/thread_runner.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#define GTEST_TEST_ERROR_CODE(expression, text, actual, expected, fail)                       \
	GTEST_AMBIGUOUS_ELSE_BLOCKER_                                                             \
	if (const ::testing::AssertionResult gtest_ar_ = ::testing::AssertionResult (expression)) \
		;                                                                                     \
	else                                                                                      \
		fail (::testing::internal::GetBoolAssertionFailureMessage (                           \
		gtest_ar_, text, actual, expected)                                                    \
			  .c_str ())

/** Extends gtest with a std::error_code assert that prints the error code message when non-zero */
#define ASSERT_NO_ERROR(condition)                                                      \
	GTEST_TEST_ERROR_CODE (!(condition), #condition, condition.message ().c_str (), "", \
	GTEST_FATAL_FAILURE_)

/** Extends gtest with a std::error_code assert that prints the error code message when non-zero */
#define EXPECT_NO_ERROR(condition)                                                      \
	GTEST_TEST_ERROR_CODE (!(condition), #condition, condition.message ().c_str (), "", \
	GTEST_NONFATAL_FAILURE_)

/** Extends gtest with a lumen::error assert that prints the error message when set */
#define ASSERT_NO_LUMEN_ERROR(condition)                                                    \
	GTEST_TEST_ERROR_CODE (!(condition), #condition, condition.get_message ().c_str (), "", \
	GTEST_FATAL_FAILURE_)

/** Extends gtest with a lumen::error expectation that prints the error message when set */
#define EXPECT_NO_LUMEN_ERROR(condition)                                                    \
	GTEST_TEST_ERROR_CODE (!(condition), #condition, condition.get_message ().c_str (), "", \
	GTEST_NONFATAL_FAILURE_)

namespace lumen::store::engine
{
class connection;
}

namespace lumen::test
{
/** A fresh directory under the system temporary directory, removed by remove_temporary_directories () */
std::filesystem::path unique_path ();
void remove_temporary_directories ();

/**
 * io_context driving one strand, the way stores are driven in production.
 * A second thread lets a test wait on another strand while this one is held.
 */
class context
{
public:
	explicit context (unsigned thread_count = 1) :
		runner{ io_ctx, logger, thread_count }
	{
	}

	std::shared_ptr<asio::io_context> io_ctx{ std::make_shared<asio::io_context> () };
	lumen::logger logger;
	lumen::thread_runner runner;
	lumen::async::strand strand{ io_ctx->get_executor () };
};

/** Blocks \p strand_a until the returned promise is fulfilled, the promise must be fulfilled before the context is destroyed */
std::promise<void> hold (lumen::async::strand & strand_a);

/**
 * Runs \p awaitable_a on \p strand_a and blocks until it finished.
 * @throws std::runtime_error if it did not finish within \p timeout_a
 */
template <typename T>
T run (lumen::async::strand & strand_a, asio::awaitable<T> awaitable_a, std::chrono::seconds timeout_a = std::chrono::seconds{ 10 })
{
	auto future = asio::co_spawn (strand_a, std::move (awaitable_a), asio::use_future);
	if (future.wait_for (timeout_a) != std::future_status::ready)
	{
		throw std::runtime_error ("Coroutine did not finish in time");
	}
	return future.get ();
}

/** Destroys \p object_a on \p strand_a and waits for it, for objects confined to a strand */
template <typename T>
void destroy (lumen::async::strand & strand_a, std::unique_ptr<T> object_a)
{
	lumen::test::run (strand_a, [] (std::unique_ptr<T> object_l) -> asio::awaitable<void> {
		object_l.reset ();
		co_return;
	}(std::move (object_a)));
}

/** Header at height \p number, \p seed varies the parent hash so headers at the same height differ */
lumen::header make_header (uint64_t number, uint8_t seed = 0);

/** Number of entries in \p collection_a, read in its own transaction */
asio::awaitable<uint64_t> count (lumen::store::engine::connection &, std::string collection_a);
}
