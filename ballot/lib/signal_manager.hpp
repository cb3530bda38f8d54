#pragma once

#include <ballot/lib/logging.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace ballot
{
/**
 * Runs signal handlers from a dedicated thread instead of the interrupted one.
 * Only one instance should exist per process, handlers cannot be removed.
 */
class signal_manager final
{
public:
	signal_manager ();
	~signal_manager ();

	/** Calls \p handler for every \p signum, or only for the first one unless \p repeat */
	void register_signal_handler (int signum, std::function<void (int)> handler, bool repeat);

private:
	struct signal_descriptor final
	{
		std::shared_ptr<boost::asio::signal_set> sigset;
		signal_manager & sigman;
		std::function<void (int)> handler_func;
		bool repeat;
	};

	static void base_handler (ballot::signal_manager::signal_descriptor descriptor, boost::system::error_code const & error, int signum);

	ballot::logger logger;
	boost::asio::io_context ioc;
	boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
	std::vector<signal_descriptor> descriptor_list;
	std::thread thread;
};

std::string to_signal_name (int signum);
}
