#include <lumen/store/completion.hpp>
#include <lumen/store/engine/factory.hpp>
#include <lumen/store/engine/request.hpp>
#include <lumen/store/engine/transaction.hpp>

std::shared_ptr<lumen::async::completion> lumen::store::watch (lumen::async::strand & strand_a, engine::open_request & request_a)
{
	auto result = std::make_shared<lumen::async::completion> (strand_a);
	auto resolver = [result] () { result->resolve (); };
	request_a.on_success (resolver);
	request_a.on_error (resolver);
	return result;
}

std::shared_ptr<lumen::async::completion> lumen::store::watch (lumen::async::strand & strand_a, engine::request & request_a)
{
	auto result = std::make_shared<lumen::async::completion> (strand_a);
	auto resolver = [result] () { result->resolve (); };
	request_a.on_success (resolver);
	request_a.on_error (resolver);
	return result;
}

std::shared_ptr<lumen::async::completion> lumen::store::watch (lumen::async::strand & strand_a, engine::transaction & transaction_a)
{
	auto result = std::make_shared<lumen::async::completion> (strand_a);
	auto resolver = [result] () { result->resolve (); };
	transaction_a.on_complete (resolver);
	transaction_a.on_abort (resolver);
	transaction_a.on_error (resolver);
	return result;
}
