#pragma once

#include <lumen/lib/async.hpp>
#include <lumen/lib/errors.hpp>
#include <lumen/store/completion.hpp>
#include <lumen/store/engine/transaction.hpp>
#include <lumen/store/tables.hpp>

#include <chrono>
#include <memory>
#include <vector>

namespace lumen::store::engine
{
class connection;
}

namespace lumen::store
{
/**
 * Starts an engine transaction over \p tables_a.
 * @throws std::system_error if a table has no collection, a store that skipped its upgrade is unusable
 */
std::shared_ptr<engine::transaction> begin (engine::connection &, std::vector<lumen::tables> const & tables_a, engine::access_mode);

/** Rolls back \p transaction_a unless it already finished, for callers that stop waiting on it */
void abort_unfinished (engine::transaction &);

/**
 * Waits for \p completion_a, obtained from watch () on \p transaction_a, and returns the transaction outcome.
 * A transaction still unfinished when \p timeout_a elapses is aborted, none of its writes become durable.
 * @return empty after a commit, the engine error otherwise, engine::error::timeout if \p timeout_a elapsed first
 */
asio::awaitable<lumen::error> await_completion (engine::transaction & transaction_a, lumen::async::completion & completion_a, std::chrono::milliseconds timeout_a);
}
