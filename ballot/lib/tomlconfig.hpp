#pragma once

#include <ballot/lib/configbase.hpp>

#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>

#include <cpptoml.h>

#include <filesystem>
#include <fstream>

namespace ballot
{
class error;

/** Manages a table in a toml configuration table hierarchy */
class tomlconfig : public ballot::configbase
{
public:
	tomlconfig ();
	tomlconfig (std::shared_ptr<cpptoml::table> const & tree_a, std::shared_ptr<ballot::error> const & error_a = nullptr);

	void doc (std::string const & key, std::string const & doc);
	ballot::error & read (std::istream & stream_overrides, std::filesystem::path const & path_a);
	ballot::error & read (std::istream & stream_a);
	ballot::error & read (std::istream & stream_first_a, std::istream & stream_second_a);
	void write (std::ostream & stream_a) const;
	void open_or_create (std::fstream & stream_a, std::string const & path_a);
	std::shared_ptr<cpptoml::table> get_tree ();
	boost::optional<tomlconfig> get_optional_child (std::string const & key_a);
	tomlconfig get_required_child (std::string const & key_a);
	tomlconfig & put_child (std::string const & key_a, ballot::tomlconfig & conf_a);
	bool has_key (std::string const & key_a);
	std::string to_string (bool comment_values);

	/** Set value for the given key. Any existing value will be overwritten. */
	template <typename T>
	tomlconfig & put (std::string const & key, T const & value, boost::optional<char const *> documentation_a = boost::none)
	{
		tree->insert (key, value);
		if (documentation_a)
		{
			doc (key, *documentation_a);
		}
		return *this;
	}

	/** Get value, keeping the current value of \p target when \p key is missing */
	template <typename T>
	tomlconfig & get (std::string const & key, T & target)
	{
		get_value (key, target);
		return *this;
	}

	/** Get chrono duration, keeping the current value when \p key is missing */
	template <typename Duration>
	tomlconfig & get_duration (std::string const & key, Duration & target)
	{
		uint64_t value = target.count ();
		get (key, value);
		target = Duration{ value };
		return *this;
	}

protected:
	template <typename T, typename = std::enable_if_t<ballot::is_lexical_castable<T>::value>>
	void get_value (std::string const & key, T & target)
	{
		if (!tree->contains_qualified (key))
		{
			return;
		}
		try
		{
			auto value (tree->get_qualified_as<std::string> (key));
			T converted;
			if (boost::conversion::try_lexical_convert<T> (*value, converted))
			{
				target = converted;
			}
			else
			{
				set_value_error<T> (ballot::error_config::invalid_value, key);
			}
		}
		catch (std::runtime_error & ex)
		{
			set_value_error<T> (ex, key);
		}
	}

	void get_value (std::string const & key, bool & target);

private:
	/** The config node being managed */
	std::shared_ptr<cpptoml::table> tree;
};
}
