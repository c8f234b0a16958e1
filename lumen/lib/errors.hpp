#pragma once

#include <memory>
#include <string>
#include <system_error>
#include <type_traits>

namespace lumen
{
/** Common error codes */
enum class error_common
{
	generic = 1,
	exception
};

/** Header decoding errors */
enum class error_headers
{
	generic = 1,
	truncated,
	invalid_compact,
	invalid_digest_item,
	trailing_bytes
};

/** toml configuration related errors */
enum class error_config
{
	generic = 1,
	invalid_value,
	missing_value
};
} // lumen namespace

// Convenience macro to implement the standard boilerplate for using std::error_code with enums
// Use this at the end of any header defining one or more error code enums.
#define REGISTER_ERROR_CODES(namespace_name, enum_type)                                                        \
	namespace namespace_name                                                                                   \
	{                                                                                                          \
		static_assert (static_cast<int> (enum_type::generic) > 0, "The first error enum must be generic = 1"); \
		class enum_type##_messages : public std::error_category                                                \
		{                                                                                                      \
		public:                                                                                                \
			char const * name () const noexcept override                                                       \
			{                                                                                                  \
				return #enum_type;                                                                             \
			}                                                                                                  \
                                                                                                               \
			std::string message (int ev) const override;                                                       \
		};                                                                                                     \
                                                                                                               \
		inline std::error_category const & enum_type##_category ()                                             \
		{                                                                                                      \
			static enum_type##_messages instance;                                                              \
			return instance;                                                                                   \
		}                                                                                                      \
                                                                                                               \
		inline std::error_code make_error_code (::namespace_name::enum_type err)                               \
		{                                                                                                      \
			return { static_cast<int> (err), enum_type##_category () };                                        \
		}                                                                                                      \
	}                                                                                                          \
	namespace std                                                                                              \
	{                                                                                                          \
		template <>                                                                                            \
		struct is_error_code_enum<::namespace_name::enum_type> : std::true_type                                \
		{                                                                                                      \
		};                                                                                                     \
	}

REGISTER_ERROR_CODES (lumen, error_common);
REGISTER_ERROR_CODES (lumen, error_headers);
REGISTER_ERROR_CODES (lumen, error_config);

namespace lumen
{
/** Adapter for std::error_code, std::exception and bool flags to facilitate unified error handling */
class error
{
public:
	error () = default;
	error (lumen::error const & error_a) = default;
	error (lumen::error && error_a) = default;

	error (std::error_code code_a);
	error (std::error_code code_a, std::string message_a);
	error (std::string message_a);
	error (std::exception const & exception_a);
	error & operator= (lumen::error const & err_a);
	error & operator= (lumen::error && err_a);
	error & operator= (std::error_code code_a);
	error & operator= (std::string message_a);
	error & operator= (std::exception const & exception_a);
	bool operator== (std::error_code code_a) const;
	explicit operator std::error_code () const;
	explicit operator bool () const;
	std::error_code get_code () const;
	std::string get_message () const;
	error & set (std::string message_a, std::error_code code_a = lumen::error_common::generic);
	error & set_message (std::string message_a);

private:
	std::error_code code;
	std::string message;
};

/**
 * A type that manages a lumen::error.
 * The default return type is lumen::error&, though shared_ptr<lumen::error> is a good option in cases
 * where shared error state is desirable.
 */
template <typename RET_TYPE = lumen::error &>
class error_aware
{
	static_assert (std::is_same<RET_TYPE, lumen::error &>::value || std::is_same<RET_TYPE, std::shared_ptr<lumen::error>>::value, "Must be lumen::error& or shared_ptr<lumen::error>");

public:
	/** Returns the error object managed by this object */
	virtual RET_TYPE get_error () = 0;
};
}
