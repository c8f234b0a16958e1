#pragma once

#include <lumen/lib/errors.hpp>
#include <lumen/store/engine/value.hpp>

#include <functional>

namespace lumen::store::engine
{
/**
 * Outcome of one collection operation. Exactly one of the success or error handlers fires, on the strand,
 * while the owning transaction executes. Handlers are released once they fired.
 */
class request final
{
public:
	using handler = std::function<void ()>;

	void on_success (handler);
	void on_error (handler);

	bool done () const;
	lumen::error const & error () const;
	/** Stored value for reads, the key for writes and the entry count for counts. Undefined until success */
	engine::value const & result () const;

	void succeed (engine::value result_a);
	void fail (lumen::error error_a);

private:
	handler success_handler;
	handler error_handler;
	engine::value result_m;
	lumen::error error_m;
	bool done_m{ false };
};
}
