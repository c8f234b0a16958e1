#pragma once

#include <lumen/lib/async.hpp>

#include <memory>

namespace lumen::store::engine
{
class open_request;
class request;
class transaction;
}

namespace lumen::store
{
/*
 * Each overload installs one resolver on every terminal notification of the engine object, replacing any handler already installed.
 * The returned signal resolves on whichever notification fires.
 */

/** Resolves on success or error */
std::shared_ptr<lumen::async::completion> watch (lumen::async::strand &, engine::open_request &);
/** Resolves on success or error */
std::shared_ptr<lumen::async::completion> watch (lumen::async::strand &, engine::request &);
/** Resolves on complete, abort or error */
std::shared_ptr<lumen::async::completion> watch (lumen::async::strand &, engine::transaction &);
}
