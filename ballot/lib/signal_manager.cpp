#include <ballot/lib/signal_manager.hpp>
#include <ballot/lib/thread_roles.hpp>

#include <csignal>

ballot::signal_manager::signal_manager () :
	work (boost::asio::make_work_guard (ioc))
{
	thread = std::thread ([&ioc = ioc] () {
		ballot::thread_role::set (ballot::thread_role::name::signal_manager);
		ioc.run ();
	});
}

ballot::signal_manager::~signal_manager ()
{
	work.reset ();
	ioc.stop ();
	thread.join ();
}

void ballot::signal_manager::register_signal_handler (int signum, std::function<void (int)> handler, bool repeat)
{
	auto sigset = std::make_shared<boost::asio::signal_set> (ioc, signum);

	signal_descriptor descriptor{ sigset, *this, handler, repeat };

	// Keeps the signal set alive for as long as the manager
	descriptor_list.push_back (descriptor);

	sigset->async_wait ([descriptor] (boost::system::error_code const & error, int signum) {
		ballot::signal_manager::base_handler (descriptor, error, signum);
	});

	logger.debug (ballot::log::type::signal_manager, "Registered signal handler for signal: {}", to_signal_name (signum));
}

void ballot::signal_manager::base_handler (ballot::signal_manager::signal_descriptor descriptor, boost::system::error_code const & ec, int signum)
{
	auto & logger = descriptor.sigman.logger;

	if (!ec)
	{
		logger.debug (ballot::log::type::signal_manager, "Signal received: {}", to_signal_name (signum));

		if (descriptor.handler_func)
		{
			descriptor.handler_func (signum);
		}

		if (descriptor.repeat)
		{
			descriptor.sigset->async_wait ([descriptor] (boost::system::error_code const & error, int signum) {
				ballot::signal_manager::base_handler (descriptor, error, signum);
			});
		}
		else
		{
			logger.debug (ballot::log::type::signal_manager, "Signal handler {} will not repeat", to_signal_name (signum));

			descriptor.sigset->clear ();
		}
	}
	else
	{
		logger.debug (ballot::log::type::signal_manager, "Signal error: {} ({})", ec.message (), to_signal_name (signum));
	}
}

std::string ballot::to_signal_name (int signum)
{
	switch (signum)
	{
		case SIGINT:
			return "SIGINT";
		case SIGTERM:
			return "SIGTERM";
	}
	return std::to_string (signum);
}
