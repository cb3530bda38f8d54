#pragma once

#include <string>
#include <string_view>

/*
 * Functions for understanding the role of the current thread
 */
namespace ballot::thread_role
{
enum class name
{
	unknown,
	evaluation,
	notifications,
	registry_sweep,
	coordinator_sweep,
	confirmation_simulator,
	signal_manager,
};

std::string_view to_string (name);

/*
 * Get/Set the identifier for the current thread
 */
ballot::thread_role::name get ();
void set (ballot::thread_role::name);

/*
 * Get the thread name as a string from enum
 */
std::string get_string (ballot::thread_role::name);

/*
 * Get the current thread's role as a string
 */
std::string get_string ();

/*
 * Internal only, should not be called directly
 */
void set_os_name (std::string const &);
}
