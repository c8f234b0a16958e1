#include <lumen/lib/errors.hpp>
#include <lumen/lib/utility.hpp>

std::string lumen::error_common_messages::message (int ev) const
{
	switch (static_cast<lumen::error_common> (ev))
	{
		case lumen::error_common::generic:
			return "Unknown error";
		case lumen::error_common::exception:
			return "Exception thrown";
	}

	return "Invalid error code";
}

std::string lumen::error_headers_messages::message (int ev) const
{
	switch (static_cast<lumen::error_headers> (ev))
	{
		case lumen::error_headers::generic:
			return "Unknown error";
		case lumen::error_headers::truncated:
			return "Header is truncated";
		case lumen::error_headers::invalid_compact:
			return "Invalid compact integer encoding";
		case lumen::error_headers::invalid_digest_item:
			return "Unknown or malformed digest item";
		case lumen::error_headers::trailing_bytes:
			return "Unexpected bytes after the end of the header";
	}

	return "Invalid error code";
}

std::string lumen::error_config_messages::message (int ev) const
{
	switch (static_cast<lumen::error_config> (ev))
	{
		case lumen::error_config::generic:
			return "Unknown error";
		case lumen::error_config::invalid_value:
			return "Invalid configuration value";
		case lumen::error_config::missing_value:
			return "Missing value in configuration";
	}

	return "Invalid error code";
}

lumen::error::error (std::error_code code_a)
{
	code = code_a;
}

lumen::error::error (std::error_code code_a, std::string message_a)
{
	code = code_a;
	message = std::move (message_a);
}

lumen::error::error (std::string message_a)
{
	code = lumen::error_common::generic;
	message = std::move (message_a);
}

lumen::error::error (std::exception const & exception_a)
{
	code = lumen::error_common::exception;
	message = exception_a.what ();
}

lumen::error & lumen::error::operator= (lumen::error const & err_a)
{
	code = err_a.code;
	message = err_a.message;
	return *this;
}

lumen::error & lumen::error::operator= (lumen::error && err_a)
{
	code = err_a.code;
	message = std::move (err_a.message);
	return *this;
}

/** Assign error code */
lumen::error & lumen::error::operator= (std::error_code const code_a)
{
	code = code_a;
	message.clear ();
	return *this;
}

/** Set the error to lumen::error_common::generic and the error message to \p message_a */
lumen::error & lumen::error::operator= (std::string message_a)
{
	code = lumen::error_common::generic;
	message = std::move (message_a);
	return *this;
}

/** Sets the error to lumen::error_common::exception and adopts the exception error message. */
lumen::error & lumen::error::operator= (std::exception const & exception_a)
{
	code = lumen::error_common::exception;
	message = exception_a.what ();
	return *this;
}

/** Return true if this#error_code equals the parameter */
bool lumen::error::operator== (std::error_code const code_a) const
{
	return code == code_a;
}

lumen::error::operator std::error_code () const
{
	return code;
}

std::error_code lumen::error::get_code () const
{
	return code;
}

/** Implicit bool conversion; true if there's an error */
lumen::error::operator bool () const
{
	return code.value () != 0;
}

/**
 * Get error message, or an empty string if there's no error. If a custom error message is set,
 * that will be returned, otherwise the error_code#message() is returned.
 */
std::string lumen::error::get_message () const
{
	std::string res = message;
	if (code && res.empty ())
	{
		res = code.message ();
	}
	return res;
}

/** Set an error message and an error code */
lumen::error & lumen::error::set (std::string message_a, std::error_code code_a)
{
	message = std::move (message_a);
	code = code_a;
	return *this;
}

/** Set a custom error message. If the error code is not set, it will be set to lumen::error_common::generic. */
lumen::error & lumen::error::set_message (std::string message_a)
{
	if (!code)
	{
		code = lumen::error_common::generic;
	}
	message = std::move (message_a);
	return *this;
}
