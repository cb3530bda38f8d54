#pragma once

#include <ballot/lib/locks.hpp>
#include <ballot/lib/thread_roles.hpp>
#include <ballot/lib/utility.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <latch>
#include <memory>
#include <type_traits>

namespace ballot
{
class thread_pool final
{
public:
	thread_pool (unsigned num_threads, ballot::thread_role::name thread_name) :
		num_threads{ num_threads },
		thread_name{ thread_name },
		thread_names_latch{ num_threads }
	{
	}

	~thread_pool ()
	{
		// Must be stopped before destruction to avoid running tasks while components are being destroyed
		debug_assert (!thread_pool_impl);
	}

	void start ()
	{
		debug_assert (!stopped);
		debug_assert (!thread_pool_impl);
		thread_pool_impl = std::make_unique<boost::asio::thread_pool> (num_threads);
		set_thread_names ();
	}

	void stop ()
	{
		ballot::unique_lock<ballot::mutex> lock{ mutex };
		if (!stopped && thread_pool_impl)
		{
			stopped = true;

			lock.unlock ();

			thread_pool_impl->stop ();
			thread_pool_impl->join ();

			lock.lock ();
			thread_pool_impl = nullptr;
		}
	}

	template <typename F>
	void push_task (F && task)
	{
		ballot::lock_guard<ballot::mutex> guard{ mutex };
		if (!stopped)
		{
			release_assert (thread_pool_impl);
			boost::asio::post (*thread_pool_impl, std::forward<F> (task));
		}
	}

	template <typename F>
	void add_timed_task (std::chrono::steady_clock::time_point const & expiry_time, F && task)
	{
		ballot::lock_guard<ballot::mutex> guard{ mutex };
		if (!stopped)
		{
			release_assert (thread_pool_impl);
			auto timer = std::make_shared<boost::asio::steady_timer> (thread_pool_impl->get_executor ());
			timer->expires_at (expiry_time);
			timer->async_wait ([this, t = std::forward<F> (task), /* preserve lifetime */ timer] (boost::system::error_code const & ec) mutable {
				if (!ec)
				{
					push_task (std::move (t));
				}
			});
		}
	}

	bool alive () const
	{
		ballot::lock_guard<ballot::mutex> guard{ mutex };
		return thread_pool_impl != nullptr;
	}

private:
	void set_thread_names ()
	{
		for (auto i = 0u; i < num_threads; ++i)
		{
			boost::asio::post (*thread_pool_impl, [this] () {
				ballot::thread_role::set (thread_name);
				thread_names_latch.arrive_and_wait ();
			});
		}
		thread_names_latch.wait ();
	}

private:
	unsigned const num_threads;
	ballot::thread_role::name const thread_name;

	std::latch thread_names_latch;
	mutable ballot::mutex mutex;
	std::atomic<bool> stopped{ false };
	std::unique_ptr<boost::asio::thread_pool> thread_pool_impl;
};
}
