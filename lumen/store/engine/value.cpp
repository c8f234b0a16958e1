#include <lumen/lib/stream.hpp>
#include <lumen/store/engine/errors.hpp>
#include <lumen/store/engine/value.hpp>

#include <system_error>

namespace
{
enum class tag : uint8_t
{
	number = 1,
	text = 2,
	binary = 3
};
}

bool lumen::store::engine::is_undefined (engine::value const & value_a)
{
	return std::holds_alternative<std::monostate> (value_a);
}

lumen::store::engine::value lumen::store::engine::to_value (engine::key const & key_a)
{
	return std::visit ([] (auto const & key_l) -> engine::value { return key_l; }, key_a);
}

std::vector<uint8_t> lumen::store::engine::encode_key (engine::key const & key_a, std::size_t max_size)
{
	std::vector<uint8_t> result;
	{
		lumen::vectorstream stream (result);
		if (auto number = std::get_if<uint64_t> (&key_a))
		{
			lumen::write (stream, tag::number);
			lumen::write_big_endian (stream, *number);
		}
		else
		{
			auto const & text = std::get<std::string> (key_a);
			lumen::write (stream, tag::text);
			lumen::write (stream, std::vector<uint8_t> (text.begin (), text.end ()));
		}
	}
	if (result.size () > max_size)
	{
		throw std::system_error (lumen::store::engine::error::data, "Key exceeds the maximum key size of " + std::to_string (max_size) + " bytes");
	}
	return result;
}

std::vector<uint8_t> lumen::store::engine::encode_value (engine::value const & value_a)
{
	std::vector<uint8_t> result;
	{
		lumen::vectorstream stream (result);
		switch (value_a.index ())
		{
			case 1:
				lumen::write (stream, tag::number);
				lumen::write_big_endian (stream, std::get<uint64_t> (value_a));
				break;
			case 2:
			{
				auto const & text = std::get<std::string> (value_a);
				lumen::write (stream, tag::text);
				lumen::write (stream, std::vector<uint8_t> (text.begin (), text.end ()));
				break;
			}
			case 3:
				lumen::write (stream, tag::binary);
				lumen::write (stream, std::get<std::vector<uint8_t>> (value_a));
				break;
			default:
				throw std::system_error (lumen::store::engine::error::data, "The undefined value cannot be stored");
		}
	}
	return result;
}

std::optional<lumen::store::engine::value> lumen::store::engine::decode_value (uint8_t const * bytes, std::size_t size)
{
	if (size == 0)
	{
		return std::nullopt;
	}
	lumen::bufferstream stream (bytes, size);
	tag tag_l;
	lumen::read (stream, tag_l);
	switch (tag_l)
	{
		case tag::number:
		{
			if (size != 1 + sizeof (uint64_t))
			{
				return std::nullopt;
			}
			uint64_t number;
			lumen::read_big_endian (stream, number);
			return engine::value{ number };
		}
		case tag::text:
			return engine::value{ std::string (reinterpret_cast<char const *> (bytes + 1), size - 1) };
		case tag::binary:
			return engine::value{ std::vector<uint8_t> (bytes + 1, bytes + size) };
	}
	return std::nullopt;
}
