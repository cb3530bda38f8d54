#pragma once

#include <ballot/lib/locks.hpp>
#include <ballot/lib/utility.hpp>

#include <functional>
#include <vector>

namespace ballot
{
/** Callbacks for a component event, run on a copy of the list without holding the lock */
template <typename... T>
class observer_set final
{
public:
	void add (std::function<void (T...)> const & observer)
	{
		ballot::lock_guard<ballot::mutex> lock{ mutex };
		observers.push_back (observer);
	}

	void notify (T... args) const
	{
		decltype (observers) snapshot;
		{
			ballot::lock_guard<ballot::mutex> lock{ mutex };
			snapshot = observers;
		}
		for (auto const & observer : snapshot)
		{
			observer (args...);
		}
	}

private:
	mutable ballot::mutex mutex{ "observer_set" };
	std::vector<std::function<void (T...)>> observers;
};
}
