#include <lumen/store/engine/connection.hpp>
#include <lumen/store/engine/errors.hpp>
#include <lumen/store/transaction.hpp>

#include <algorithm>
#include <iterator>
#include <string>

std::shared_ptr<lumen::store::engine::transaction> lumen::store::begin (engine::connection & connection_a, std::vector<lumen::tables> const & tables_a, engine::access_mode mode_a)
{
	std::vector<std::string> names;
	std::transform (tables_a.begin (), tables_a.end (), std::back_inserter (names), [] (lumen::tables table_a) {
		return lumen::to_string (table_a);
	});
	return connection_a.transaction (names, mode_a);
}

void lumen::store::abort_unfinished (engine::transaction & transaction_a)
{
	if (!transaction_a.finished ())
	{
		transaction_a.abort ();
	}
}

asio::awaitable<lumen::error> lumen::store::await_completion (engine::transaction & transaction_a, lumen::async::completion & completion_a, std::chrono::milliseconds timeout_a)
{
	if (!co_await completion_a.wait (timeout_a))
	{
		lumen::store::abort_unfinished (transaction_a);
		co_return lumen::error (engine::error::timeout, "Timed out waiting for the transaction to finish");
	}
	debug_assert (transaction_a.finished ());
	co_return transaction_a.error ();
}
