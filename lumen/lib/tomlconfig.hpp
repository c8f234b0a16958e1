#pragma once

#include <lumen/lib/errors.hpp>

#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>
#include <boost/type_traits.hpp>

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <cpptoml.h>

namespace lumen
{
/** Type trait to determine if T is compatible with boost's lexical_cast */
template <class T>
struct is_lexical_castable : std::integral_constant<bool,
							 (std::is_default_constructible<T>::value && boost::has_right_shift<std::basic_istream<char>, T>::value)>
{
};

/* Used to build configuration error messages */
// clang-format off
template <typename T> inline std::string type_desc () { return "a value of the expected type"; }
template <> inline std::string type_desc<uint32_t> () { return "a 32-bit unsigned integer"; }
template <> inline std::string type_desc<uint64_t> () { return "a 64-bit unsigned integer"; }
template <> inline std::string type_desc<std::string> () { return "a string"; }
template <> inline std::string type_desc<bool> () { return "a boolean"; }
// clang-format on

/**
 * One table of a toml document. Child tables share the error state of their parent,
 * the first error reported anywhere in the document is kept until cleared.
 */
class tomlconfig : public lumen::error_aware<>
{
public:
	tomlconfig ();
	tomlconfig (std::shared_ptr<cpptoml::table> const & tree_a, std::shared_ptr<lumen::error> const & error_a = nullptr);

	lumen::error & get_error () override;

	lumen::error & read (std::istream & stream_a);
	/** Reads \p path_a, keys in \p stream_overrides take precedence over the file */
	lumen::error & read (std::istream & stream_overrides, std::filesystem::path const & path_a);
	/** Keys in the first stream take precedence over those in the second */
	lumen::error & read (std::istream & stream_first_a, std::istream & stream_second_a);
	void write (std::ostream & stream_a) const;

	boost::optional<tomlconfig> get_optional_child (std::string const & key_a);
	/** Sets lumen::error_config::missing_value if absent */
	tomlconfig get_required_child (std::string const & key_a);
	tomlconfig & put_child (std::string const & key_a, lumen::tomlconfig & conf_a);
	bool has_key (std::string const & key_a);

	/** Set value for the given key. Any existing value will be overwritten. */
	template <typename T>
	tomlconfig & put (std::string const & key, T const & value, boost::optional<char const *> documentation_a = boost::none)
	{
		tree->insert (key, value);
		if (documentation_a)
		{
			tree->document (key, *documentation_a);
		}
		return *this;
	}

	/**
	 * Get optional value, using the current value of \p target as the default if \p key is missing.
	 * @return May return lumen::error_config::invalid_value
	 */
	template <typename T>
	tomlconfig & get_optional (std::string const & key, T & target)
	{
		get_config (true, key, target, target);
		return *this;
	}

	template <typename T>
	tomlconfig & get (std::string const & key, T & target)
	{
		get_config (true, key, target, target);
		return *this;
	}

	/** Get value of optional key. Use default value of data type if missing. */
	template <typename T>
	T get (std::string const & key)
	{
		T target{};
		get_config (true, key, target, target);
		return target;
	}

	/** Reads an integer count of \p Duration units */
	template <typename Duration>
	tomlconfig & get_duration (std::string const & key, Duration & target)
	{
		uint64_t value = target.count ();
		get (key, value);
		target = Duration{ value };
		return *this;
	}

	/** Every key of this table with its value converted to T */
	template <typename T>
	std::vector<std::pair<std::string, T>> get_values ()
	{
		std::vector<std::pair<std::string, T>> result;
		for (auto & entry : *tree)
		{
			T target{};
			get_config (true, entry.first, target, target);
			result.push_back ({ entry.first, target });
		}
		return result;
	}

private:
	template <typename T, typename = std::enable_if_t<lumen::is_lexical_castable<T>::value>>
	tomlconfig & get_config (bool optional, std::string const & key, T & target, T default_value = T ())
	{
		try
		{
			if (tree->contains_qualified (key))
			{
				auto val (tree->get_qualified_as<std::string> (key));
				if (!boost::conversion::try_lexical_convert<T> (*val, target))
				{
					set_error<T> (lumen::error_config::invalid_value, optional, key);
				}
			}
			else if (!optional)
			{
				set_error<T> (lumen::error_config::missing_value, optional, key);
			}
			else
			{
				target = default_value;
			}
		}
		catch (std::runtime_error & ex)
		{
			set_error<T> (ex, optional, key);
		}

		return *this;
	}

	tomlconfig & get_config (bool optional, std::string const & key, bool & target, bool default_value = false);

	/** Only the first error is kept */
	template <typename T, typename V>
	void set_error (V error_a, bool optional, std::string const & key)
	{
		if (!*error)
		{
			*error = error_a;
			error->set_message (optional ? key + " is not " + type_desc<T> () : key + " is required and must be " + type_desc<T> ());
		}
	}

	std::shared_ptr<cpptoml::table> tree;
	std::shared_ptr<lumen::error> error;
};
}
