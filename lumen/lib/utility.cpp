#include <lumen/lib/utility.hpp>

#include <boost/stacktrace.hpp>

#include <iostream>
#include <sstream>

void lumen::set_secure_perm_directory (std::filesystem::path const & path, std::error_code & ec)
{
	std::filesystem::permissions (path, std::filesystem::perms::owner_all, ec);
}

std::string lumen::generate_stacktrace ()
{
	std::stringstream ss;
	ss << boost::stacktrace::stacktrace ();
	return ss.str ();
}

/*
 * Backing code for "release_assert" & "debug_assert", which are macros
 */
void assert_internal (char const * check_expr, char const * func, char const * file, unsigned int line, bool is_release_assert, std::string_view error_msg)
{
	std::cerr << "Assertion (" << check_expr << ") failed\n"
			  << func << "\n"
			  << file << ":" << line << "\n";
	if (!error_msg.empty ())
	{
		std::cerr << "Error: " << error_msg << "\n";
	}
	std::cerr << "\n";

	std::cerr << lumen::generate_stacktrace () << std::endl;

	abort ();
}
