#include <lumen/lib/utility.hpp>
#include <lumen/store/engine/request.hpp>

void lumen::store::engine::request::on_success (handler handler_a)
{
	success_handler = std::move (handler_a);
}

void lumen::store::engine::request::on_error (handler handler_a)
{
	error_handler = std::move (handler_a);
}

bool lumen::store::engine::request::done () const
{
	return done_m;
}

lumen::error const & lumen::store::engine::request::error () const
{
	return error_m;
}

lumen::store::engine::value const & lumen::store::engine::request::result () const
{
	return result_m;
}

void lumen::store::engine::request::succeed (engine::value result_a)
{
	debug_assert (!done_m);
	done_m = true;
	result_m = std::move (result_a);
	auto handler_l = std::move (success_handler);
	success_handler = nullptr;
	error_handler = nullptr;
	if (handler_l)
	{
		handler_l ();
	}
}

void lumen::store::engine::request::fail (lumen::error error_a)
{
	debug_assert (!done_m);
	done_m = true;
	error_m = std::move (error_a);
	auto handler_l = std::move (error_handler);
	success_handler = nullptr;
	error_handler = nullptr;
	if (handler_l)
	{
		handler_l ();
	}
}
