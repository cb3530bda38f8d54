#include <ballot/lib/enum_util.hpp>
#include <ballot/lib/thread_roles.hpp>
#include <ballot/lib/utility.hpp>

#include <pthread.h>

std::string_view ballot::thread_role::to_string (ballot::thread_role::name name)
{
	return ballot::enum_util::name (name);
}

std::string ballot::thread_role::get_string (ballot::thread_role::name role)
{
	std::string thread_role_name_string;

	switch (role)
	{
		case ballot::thread_role::name::unknown:
			thread_role_name_string = "<unknown>";
			break;
		case ballot::thread_role::name::evaluation:
			thread_role_name_string = "Evaluation";
			break;
		case ballot::thread_role::name::notifications:
			thread_role_name_string = "Notifications";
			break;
		case ballot::thread_role::name::registry_sweep:
			thread_role_name_string = "Registry sweep";
			break;
		case ballot::thread_role::name::coordinator_sweep:
			thread_role_name_string = "Round sweep";
			break;
		case ballot::thread_role::name::confirmation_simulator:
			thread_role_name_string = "Conf simulator";
			break;
		case ballot::thread_role::name::signal_manager:
			thread_role_name_string = "Signal manager";
			break;
		default:
			debug_assert (false && "ballot::thread_role::get_string unhandled thread role");
	}

	/*
	 * Linux limits thread names to 15 characters
	 */
	debug_assert (thread_role_name_string.size () < 16);
	return thread_role_name_string;
}

namespace
{
thread_local ballot::thread_role::name current_thread_role = ballot::thread_role::name::unknown;
}

ballot::thread_role::name ballot::thread_role::get ()
{
	return current_thread_role;
}

std::string ballot::thread_role::get_string ()
{
	return get_string (current_thread_role);
}

void ballot::thread_role::set (ballot::thread_role::name role)
{
	auto thread_role_name_string (get_string (role));

	ballot::thread_role::set_os_name (thread_role_name_string);

	current_thread_role = role;
}

void ballot::thread_role::set_os_name (std::string const & thread_name)
{
	pthread_setname_np (pthread_self (), thread_name.c_str ());
}
