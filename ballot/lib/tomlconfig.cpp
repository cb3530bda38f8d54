#include <ballot/lib/tomlconfig.hpp>
#include <ballot/lib/utility.hpp>

#include <sstream>

ballot::tomlconfig::tomlconfig () :
	tree (cpptoml::make_table ())
{
	error = std::make_shared<ballot::error> ();
}

ballot::tomlconfig::tomlconfig (std::shared_ptr<cpptoml::table> const & tree_a, std::shared_ptr<ballot::error> const & error_a) :
	ballot::configbase (error_a), tree (tree_a)
{
	if (!error)
	{
		error = std::make_shared<ballot::error> ();
	}
}

void ballot::tomlconfig::doc (std::string const & key, std::string const & doc)
{
	tree->document (key, doc);
}

ballot::error & ballot::tomlconfig::read (std::istream & stream_overrides, std::filesystem::path const & path_a)
{
	std::fstream stream;
	open_or_create (stream, path_a.string ());
	if (!stream.fail ())
	{
		read (stream_overrides, stream);
	}
	return *error;
}

ballot::error & ballot::tomlconfig::read (std::istream & stream_a)
{
	std::stringstream stream_override_empty;
	stream_override_empty << std::endl;
	return read (stream_override_empty, stream_a);
}

/** Read from two streams where keys in the first will take precedence over those in the second stream. */
ballot::error & ballot::tomlconfig::read (std::istream & stream_first_a, std::istream & stream_second_a)
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

void ballot::tomlconfig::write (std::ostream & stream_a) const
{
	cpptoml::toml_writer writer{ stream_a, "" };
	tree->accept (writer);
}

/** Open configuration file, create if necessary */
void ballot::tomlconfig::open_or_create (std::fstream & stream_a, std::string const & path_a)
{
	if (!std::filesystem::exists (path_a))
	{
		std::ofstream stream (path_a);
		ballot::set_secure_perm_file (path_a);
	}

	stream_a.open (path_a);
}

std::shared_ptr<cpptoml::table> ballot::tomlconfig::get_tree ()
{
	return tree;
}

boost::optional<ballot::tomlconfig> ballot::tomlconfig::get_optional_child (std::string const & key_a)
{
	boost::optional<tomlconfig> child_config;
	if (tree->contains (key_a))
	{
		return tomlconfig (tree->get_table (key_a), error);
	}
	return child_config;
}

ballot::tomlconfig ballot::tomlconfig::get_required_child (std::string const & key_a)
{
	if (!tree->contains (key_a))
	{
		*error = ballot::error_config::missing_value;
		error->set_message ("Missing configuration node: " + key_a);
		return *this;
	}
	return tomlconfig (tree->get_table (key_a), error);
}

ballot::tomlconfig & ballot::tomlconfig::put_child (std::string const & key_a, ballot::tomlconfig & conf_a)
{
	tree->insert (key_a, conf_a.get_tree ());
	return *this;
}

bool ballot::tomlconfig::has_key (std::string const & key_a)
{
	return tree->contains (key_a);
}

/** Renders the table with every value commented out when \p comment_values is set, used by --generate_config */
std::string ballot::tomlconfig::to_string (bool comment_values)
{
	std::stringstream ss, ss_processed;
	cpptoml::toml_writer writer{ ss, "" };
	tree->accept (writer);
	std::string line;
	while (std::getline (ss, line, '\n'))
	{
		if (!line.empty () && line[0] != '[')
		{
			if (line[0] == '#')
			{
				line = "\t" + line;
			}
			else
			{
				line = comment_values ? "\t# " + line : "\t" + line;
			}
		}
		ss_processed << line << std::endl;
	}
	return ss_processed.str ();
}

void ballot::tomlconfig::get_value (std::string const & key, bool & target)
{
	if (!tree->contains_qualified (key))
	{
		return;
	}
	try
	{
		auto value (tree->get_qualified_as<std::string> (key));
		if (*value == "true" || *value == "false")
		{
			target = *value == "true";
		}
		else
		{
			set_value_error<bool> (ballot::error_config::invalid_value, key);
		}
	}
	catch (std::runtime_error & ex)
	{
		set_value_error<bool> (ex, key);
	}
}
