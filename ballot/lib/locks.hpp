#pragma once

#include <condition_variable>
#include <mutex>

namespace ballot
{
/** std::mutex with an optional name, so contended locks can be identified in a debugger */
class mutex
{
public:
	mutex () = default;
	explicit mutex (char const * name_a) :
		name (name_a)
	{
	}

	void lock ()
	{
		mutex_m.lock ();
	}

	void unlock ()
	{
		mutex_m.unlock ();
	}

	bool try_lock ()
	{
		return mutex_m.try_lock ();
	}

	char const * get_name () const
	{
		return name ? name : "";
	}

private:
	char const * name{ nullptr };
	std::mutex mutex_m;
};

template <typename Mutex>
using lock_guard = std::lock_guard<Mutex>;

template <typename Mutex>
using unique_lock = std::unique_lock<Mutex>;

// For consistency wrapping the less well known _any variant which can be used with any lockable type
using condition_variable = std::condition_variable_any;
}
