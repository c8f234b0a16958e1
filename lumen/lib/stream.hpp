#pragma once

#include <lumen/lib/utility.hpp>

#include <boost/endian/conversion.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/stream_buffer.hpp>

#include <cstdint>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <type_traits>
#include <vector>

namespace lumen
{
/**
 * Character traits for uint8_t streams, every operation forwards to std::char_traits<char>.
 * std::char_traits<uint8_t> is not provided by the standard.
 */
struct byte_traits
{
	using char_type = uint8_t;
	using base = std::char_traits<char>;
	using int_type = base::int_type;
	using off_type = base::off_type;
	using pos_type = base::pos_type;
	using state_type = base::state_type;

	static char const * as_char (char_type const * ptr) noexcept
	{
		return reinterpret_cast<char const *> (ptr);
	}
	static char * as_char (char_type * ptr) noexcept
	{
		return reinterpret_cast<char *> (ptr);
	}

	static void assign (char_type & target, char_type const & source) noexcept
	{
		target = source;
	}
	static char_type * assign (char_type * target, size_t count, char_type value)
	{
		base::assign (as_char (target), count, static_cast<char> (value));
		return target;
	}
	static bool eq (char_type lhs, char_type rhs) noexcept
	{
		return lhs == rhs;
	}
	static bool lt (char_type lhs, char_type rhs) noexcept
	{
		return lhs < rhs;
	}
	static int compare (char_type const * lhs, char_type const * rhs, size_t count)
	{
		return base::compare (as_char (lhs), as_char (rhs), count);
	}
	static size_t length (char_type const * str)
	{
		return base::length (as_char (str));
	}
	static char_type const * find (char_type const * str, size_t count, char_type const & value)
	{
		return reinterpret_cast<char_type const *> (base::find (as_char (str), count, static_cast<char> (value)));
	}
	static char_type * move (char_type * target, char_type const * source, size_t count)
	{
		base::move (as_char (target), as_char (source), count);
		return target;
	}
	static char_type * copy (char_type * target, char_type const * source, size_t count)
	{
		base::copy (as_char (target), as_char (source), count);
		return target;
	}
	static int_type not_eof (int_type value) noexcept
	{
		return base::not_eof (value);
	}
	static char_type to_char_type (int_type value) noexcept
	{
		return static_cast<char_type> (value);
	}
	static int_type to_int_type (char_type value) noexcept
	{
		return static_cast<int_type> (value);
	}
	static bool eq_int_type (int_type lhs, int_type rhs) noexcept
	{
		return lhs == rhs;
	}
	static int_type eof () noexcept
	{
		return base::eof ();
	}
};

using stream = std::basic_streambuf<uint8_t, byte_traits>;
/** Reads from a borrowed byte range */
using bufferstream = boost::iostreams::stream_buffer<boost::iostreams::basic_array_source<uint8_t>, byte_traits>;
/** Appends to a byte vector */
using vectorstream = boost::iostreams::stream_buffer<boost::iostreams::back_insert_device<std::vector<uint8_t>>, byte_traits>;

/** Fills \p value_a with the next sizeof (T) bytes. Returns true if the stream ran out */
template <typename T>
bool try_read (lumen::stream & stream_a, T & value_a)
{
	static_assert (std::is_standard_layout<T>::value, "Only standard layout types can be read from a stream");
	return stream_a.sgetn (reinterpret_cast<uint8_t *> (&value_a), sizeof (value_a)) != sizeof (value_a);
}

/** @throw std::runtime_error if the stream ran out */
template <typename T>
void read (lumen::stream & stream_a, T & value_a)
{
	if (try_read (stream_a, value_a))
	{
		throw std::runtime_error ("Stream ended before the value was complete");
	}
}

template <typename T>
void write (lumen::stream & stream_a, T const & value_a)
{
	static_assert (std::is_standard_layout<T>::value, "Only standard layout types can be written to a stream");
	[[maybe_unused]] auto written (stream_a.sputn (reinterpret_cast<uint8_t const *> (&value_a), sizeof (value_a)));
	debug_assert (written == sizeof (value_a));
}

inline void write (lumen::stream & stream_a, std::vector<uint8_t> const & bytes_a)
{
	[[maybe_unused]] auto written (stream_a.sputn (bytes_a.data (), bytes_a.size ()));
	debug_assert (static_cast<size_t> (written) == bytes_a.size ());
}

/** Consumes one byte if there is one */
inline bool at_end (lumen::stream & stream_a)
{
	uint8_t next;
	return lumen::try_read (stream_a, next);
}

/** Store keys and numbers are big endian so that LMDB's byte order matches numeric order */
template <typename T>
void write_big_endian (lumen::stream & stream_a, T const & value_a)
{
	lumen::write (stream_a, boost::endian::native_to_big (value_a));
}

template <typename T>
void read_big_endian (lumen::stream & stream_a, T & value_a)
{
	T raw;
	lumen::read (stream_a, raw);
	value_a = boost::endian::big_to_native (raw);
}

/** SCALE fixed width integers are little endian */
template <typename T>
void write_little_endian (lumen::stream & stream_a, T const & value_a)
{
	lumen::write (stream_a, boost::endian::native_to_little (value_a));
}
}
