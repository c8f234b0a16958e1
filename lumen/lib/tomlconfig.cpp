#include <lumen/lib/tomlconfig.hpp>

#include <fstream>
#include <sstream>

lumen::tomlconfig::tomlconfig () :
	tree (cpptoml::make_table ()),
	error (std::make_shared<lumen::error> ())
{
}

lumen::tomlconfig::tomlconfig (std::shared_ptr<cpptoml::table> const & tree_a, std::shared_ptr<lumen::error> const & error_a) :
	tree (tree_a),
	error (error_a ? error_a : std::make_shared<lumen::error> ())
{
}

lumen::error & lumen::tomlconfig::get_error ()
{
	return *error;
}

lumen::error & lumen::tomlconfig::read (std::istream & stream_a)
{
	std::stringstream stream_override_empty;
	stream_override_empty << std::endl;
	return read (stream_override_empty, stream_a);
}

lumen::error & lumen::tomlconfig::read (std::istream & stream_overrides, std::filesystem::path const & path_a)
{
	std::ifstream stream (path_a);
	if (stream.fail ())
	{
		error->set ("Unable to open " + path_a.string (), lumen::error_config::generic);
	}
	else
	{
		read (stream_overrides, stream);
	}
	return *error;
}

lumen::error & lumen::tomlconfig::read (std::istream & stream_first_a, std::istream & stream_second_a)
{
	try
	{
		tree = cpptoml::parse_base_and_override_files (stream_first_a, stream_second_a, cpptoml::parser::merge_type::ignore, true);
	}
	catch (std::runtime_error const & ex)
	{
		*error = ex;
	}
	return *error;
}

void lumen::tomlconfig::write (std::ostream & stream_a) const
{
	cpptoml::toml_writer writer{ stream_a, "" };
	tree->accept (writer);
}

boost::optional<lumen::tomlconfig> lumen::tomlconfig::get_optional_child (std::string const & key_a)
{
	boost::optional<tomlconfig> child_config;
	if (tree->contains (key_a))
	{
		child_config = tomlconfig (tree->get_table (key_a), error);
	}
	return child_config;
}

lumen::tomlconfig lumen::tomlconfig::get_required_child (std::string const & key_a)
{
	if (!tree->contains (key_a))
	{
		*error = lumen::error_config::missing_value;
		error->set_message ("Missing configuration node: " + key_a);
		return *this;
	}
	return tomlconfig (tree->get_table (key_a), error);
}

lumen::tomlconfig & lumen::tomlconfig::put_child (std::string const & key_a, lumen::tomlconfig & conf_a)
{
	tree->insert (key_a, conf_a.tree);
	return *this;
}

bool lumen::tomlconfig::has_key (std::string const & key_a)
{
	return tree->contains (key_a);
}

lumen::tomlconfig & lumen::tomlconfig::get_config (bool optional, std::string const & key, bool & target, bool default_value)
{
	try
	{
		if (tree->contains_qualified (key))
		{
			auto val (tree->get_qualified_as<std::string> (key));
			if (*val == "true")
			{
				target = true;
			}
			else if (*val == "false")
			{
				target = false;
			}
			else
			{
				set_error<bool> (lumen::error_config::invalid_value, optional, key);
			}
		}
		else if (!optional)
		{
			set_error<bool> (lumen::error_config::missing_value, optional, key);
		}
		else
		{
			target = default_value;
		}
	}
	catch (std::runtime_error & ex)
	{
		set_error<bool> (ex, optional, key);
	}
	return *this;
}
